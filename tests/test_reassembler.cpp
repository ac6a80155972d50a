#include <doctest/doctest.h>
#include "xtoc/reassembler.hpp"
#include "xtoc/chunker.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

using namespace xtoc;

static std::vector<FramedPacket> parts_of(const std::vector<std::string>& lines) {
    std::vector<FramedPacket> out;
    for (const auto& l : lines) {
        auto p = parse_packet(l);
        REQUIRE(p.has_value());
        out.push_back(*p);
    }
    return out;
}

static const std::string kPayload =
    "AQAMAAACAAGwVRUAAQAMAAACAAGwVRUAAQAMAAACAAGwVRUAAQAMAAACAAGwVRUAAQAMAAACAAGwVRUA";

TEST_CASE("Parts reassemble in any arrival order") {
    const FramedPacket whole = make_frame(1, ClearMode{}, "ORDER001", 1, 1, kPayload);
    auto lines = chunk_packet(whole, 40);
    REQUIRE(lines.size() >= 3);
    std::reverse(lines.begin(), lines.end());

    const ReassemblyResult r = reassemble_packets(parts_of(lines));
    REQUIRE(r.ok());
    CHECK(r.packet == whole.raw);
    REQUIRE(r.parsed.has_value());
    CHECK(r.parsed->payload == kPayload);
    CHECK(r.parsed->total == 1);
}

TEST_CASE("Duplicate parts do not disturb reassembly") {
    const FramedPacket whole = make_frame(1, ClearMode{}, "DUPS0001", 1, 1, kPayload);
    auto lines = chunk_packet(whole, 40);
    lines.push_back(lines[0]);

    const ReassemblyResult r = reassemble_packets(parts_of(lines));
    REQUIRE(r.ok());
    CHECK(r.packet == whole.raw);
}

TEST_CASE("Dropping any one part reports exactly that part as missing") {
    const FramedPacket whole = make_frame(1, ClearMode{}, "GAPS0001", 1, 1, kPayload);
    const auto lines = chunk_packet(whole, 40);
    REQUIRE(lines.size() >= 3);
    const size_t total = lines.size();

    for (size_t drop = 0; drop < total; ++drop) {
        CAPTURE(drop);
        auto kept = lines;
        kept.erase(kept.begin() + static_cast<std::ptrdiff_t>(drop));

        const ReassemblyResult r = reassemble_packets(parts_of(kept));
        CHECK(r.code == ErrorCode::MissingPart);
        CHECK(r.missing_part == drop + 1);
        CHECK(r.reason == "Missing part " + std::to_string(drop + 1) + "/" + std::to_string(total));
        CHECK_FALSE(r.parsed.has_value());
    }
}

TEST_CASE("Parts from different messages are refused") {
    std::vector<FramedPacket> parts{
        make_frame(1, ClearMode{}, "AAAA0001", 1, 2, "AAAA"),
        make_frame(1, ClearMode{}, "BBBB0001", 2, 2, "BBBB"),
    };
    const ReassemblyResult r = reassemble_packets(parts);
    CHECK(r.code == ErrorCode::InconsistentParts);
    CHECK(r.reason == "Parts do not match same packet");
}

TEST_CASE("Parts that differ in template or mode are refused") {
    const ReassemblyResult tpl = reassemble_packets({
        make_frame(1, ClearMode{}, "SAME0001", 1, 2, "AAAA"),
        make_frame(2, ClearMode{}, "SAME0001", 2, 2, "BBBB"),
    });
    CHECK(tpl.code == ErrorCode::InconsistentParts);

    const ReassemblyResult mode = reassemble_packets({
        make_frame(1, ClearMode{}, "SAME0001", 1, 2, "AAAA"),
        make_frame(1, SecureMode{"k"}, "SAME0001", 2, 2, "BBBB"),
    });
    CHECK(mode.code == ErrorCode::InconsistentParts);
}

TEST_CASE("Secure parts under different key ids are refused") {
    const ReassemblyResult r = reassemble_packets({
        make_frame(4, SecureMode{"k1"}, "SECR0001", 1, 2, "AAAA"),
        make_frame(4, SecureMode{"k2"}, "SECR0001", 2, 2, "BBBB"),
    });
    CHECK(r.code == ErrorCode::InconsistentParts);
    CHECK(r.reason == "Parts do not match same packet");

    const ReassemblyResult same = reassemble_packets({
        make_frame(4, SecureMode{"k1"}, "SECR0001", 2, 2, "BBBB"),
        make_frame(4, SecureMode{"k1"}, "SECR0001", 1, 2, "AAAA"),
    });
    REQUIRE(same.ok());
    CHECK(same.packet == "X1.4.S.SECR0001.1/1.k1.AAAABBBB");
}

TEST_CASE("An empty set reports no parts") {
    const ReassemblyResult r = reassemble_packets({});
    CHECK(r.code == ErrorCode::NoPackets);
    CHECK(r.reason == "No parts");
}

TEST_CASE("Text entry skips noise and blank lines") {
    const FramedPacket whole = make_frame(3, ClearMode{}, "TEXT0001", 1, 1, kPayload);
    const auto lines = chunk_packet(whole, 45);

    std::string text = "de N0CALL\r\n\r\n";
    for (const auto& l : lines) text += "  " + l + "  \r\n\n";
    text += "73\n";

    const ReassemblyResult r = reassemble_text(text);
    REQUIRE(r.ok());
    CHECK(r.packet == whole.raw);
}

TEST_CASE("Text entry with a single complete packet returns it as-is") {
    const ReassemblyResult r = reassemble_text("X1.1.C.7KQ2M9TA.1/1.AQAMAAACAAGwVRUA\n");
    REQUIRE(r.ok());
    CHECK(r.packet == "X1.1.C.7KQ2M9TA.1/1.AQAMAAACAAGwVRUA");
}

TEST_CASE("Text entry without any wrapper reports no packets") {
    const ReassemblyResult r = reassemble_text("hello\nworld\n");
    CHECK(r.code == ErrorCode::NoPackets);
    CHECK(r.reason == "No valid packets found");
}

TEST_CASE("Candidates are pulled out of chat noise") {
    const std::string text =
        "KX9ABC: X1.1.C.AAAA0001.1/2.QUJD, and more\n"
        "X1.1.C.AAAA0001.2/2.REVG\n"
        "(X1.1.C.AAAA0001.2/2.REVG)\n"
        "no packet here\n";

    const auto c = extract_candidates(text);
    REQUIRE(c.size() == 2);
    CHECK(c[0] == "X1.1.C.AAAA0001.1/2.QUJD");
    CHECK(c[1] == "X1.1.C.AAAA0001.2/2.REVG");
}
