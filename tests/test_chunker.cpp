#include <doctest/doctest.h>
#include "xtoc/chunker.hpp"
#include "xtoc/reassembler.hpp"
#include "xtoc/template_codec.hpp"

#include <string>
#include <vector>

using namespace xtoc;

static std::string payload_of(size_t n) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string s;
    for (size_t i = 0; i < n; ++i) s.push_back(alphabet[(i * 7 + 3) % 64]);
    return s;
}

static std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) out += l + "\n";
    return out;
}

TEST_CASE("A line that already fits is returned unchanged") {
    const FramedPacket p = make_frame(1, ClearMode{}, "7KQ2M9TA", 1, 1, "AQAMAAACAAGwVRUA");
    const auto lines = chunk_packet(p, TransportProfile::JS8Call);
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == p.raw);
}

TEST_CASE("A part of a larger message is never re-split") {
    const FramedPacket p = make_frame(1, ClearMode{}, "7KQ2M9TA", 2, 3, payload_of(200));
    const auto lines = chunk_packet(p, 50);
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == p.raw);
}

TEST_CASE("Chunk plan accounts for the part/total width") {
    // "X1.1.C.7KQ2M9TA." is 16 characters
    const ChunkPlan small = plan_chunks(16, 100, 50);
    CHECK(small.chunk_len == 30);
    CHECK(small.count == 4);
    CHECK(small.converged);

    const ChunkPlan wide = plan_chunks(16, 1000, 50);
    CHECK(wide.chunk_len == 28);
    CHECK(wide.count == 36);
    CHECK(wide.iterations <= CHUNK_MAX_ITERATIONS);
}

TEST_CASE("Every chunk fits the profile budget and reassembles to the original") {
    const size_t sizes[] = {40, 100, 333, 1500};
    for (size_t i = 0; i < PROFILE_COUNT; ++i) {
        const ProfileInfo& profile = profile_at(i);
        for (size_t n : sizes) {
            CAPTURE(profile.name);
            CAPTURE(n);
            const FramedPacket p = make_frame(5, ClearMode{}, "ABCD1234", 1, 1, payload_of(n));
            const auto lines = chunk_packet(p, profile.profile);
            REQUIRE_FALSE(lines.empty());
            for (const auto& l : lines) CHECK(l.size() <= profile.max_chars);

            const ReassemblyResult r = reassemble_text(join_lines(lines));
            REQUIRE(r.ok());
            CHECK(r.packet == p.raw);
        }
    }
}

TEST_CASE("Secure packets keep the key id on every chunk") {
    const FramedPacket p = make_frame(2, SecureMode{"ops7"}, "ZXCV5678", 1, 1, payload_of(180));
    const auto lines = chunk_packet(p, TransportProfile::APRS);
    REQUIRE(lines.size() > 1);
    for (size_t i = 0; i < lines.size(); ++i) {
        auto part = parse_packet(lines[i]);
        REQUIRE(part.has_value());
        CHECK(part->kid() == "ops7");
        CHECK(part->part == i + 1);
        CHECK(part->total == lines.size());
        CHECK(lines[i].size() <= 67);
    }
}

TEST_CASE("chunk_line refuses lines that are not wrappers") {
    CHECK(chunk_line("not a packet", 50).empty());
    CHECK(chunk_line("X1.1.C.ID.1/1.AAAA", 50).size() == 1);
}

TEST_CASE("SITREP with extra source ids splits for JS8Call and comes back intact") {
    SitrepPayload s;
    s.src = 12; s.src_ids = {12, 14, 19}; s.pri = 1; s.t_ms = 1700000000123LL;
    s.loc = GeoPoint{38.8977, -77.0365};

    std::string line;
    REQUIRE(make_clear_packet(PacketPayload{s}, "JS8TEST1", line) == ErrorCode::Ok);
    REQUIRE(line.size() > 50);

    const auto lines = chunk_line(line, max_chars(TransportProfile::JS8Call));
    CHECK(lines.size() >= 2);
    for (const auto& l : lines) CHECK(l.size() <= 50);

    const ReassemblyResult r = reassemble_text(join_lines(lines));
    REQUIRE(r.ok());
    CHECK(r.packet == line);
}

TEST_CASE("Profile budgets resolve by name") {
    CHECK(max_chars_for("JS8Call") == 50);
    CHECK(max_chars_for("meshtastic") == 180);
    CHECK(max_chars_for("no-such-link") == max_chars(DEFAULT_PROFILE));
}
