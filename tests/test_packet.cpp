#include <doctest/doctest.h>
#include "xtoc/packet.hpp"
#include "xtoc/describe.hpp"
#include "xtoc/template_codec.hpp"

#include <set>
#include <string>

using namespace xtoc;

TEST_CASE("Clear wrapper parses into its fields") {
    auto p = parse_packet("X1.1.C.7KQ2M9TA.1/1.AQAMAAACAAGwVRUA");
    REQUIRE(p.has_value());
    CHECK(p->template_id == 1);
    CHECK_FALSE(p->is_secure());
    CHECK(p->mode_char() == 'C');
    CHECK(p->id == "7KQ2M9TA");
    CHECK(p->part == 1);
    CHECK(p->total == 1);
    CHECK(p->payload == "AQAMAAACAAGwVRUA");
    CHECK(p->kid().empty());
    CHECK(build_packet(*p) == p->raw);
}

TEST_CASE("Secure wrapper carries the key id after part/total") {
    auto p = parse_packet("  X1.4.S.ABCD1234.2/3.7.Zm9vYmFy \n");
    REQUIRE(p.has_value());
    CHECK(p->is_secure());
    CHECK(p->kid() == "7");
    CHECK(p->part == 2);
    CHECK(p->total == 3);
    CHECK(p->payload == "Zm9vYmFy");
    CHECK(p->raw == "X1.4.S.ABCD1234.2/3.7.Zm9vYmFy");
    CHECK(build_packet(*p) == p->raw);
}

TEST_CASE("Malformed wrappers are rejected with a reason") {
    FramedPacket p;
    CHECK(parse_packet_status("", p) == ErrorCode::MalformedWrapper);
    CHECK(parse_packet_status("hello world", p) == ErrorCode::MalformedWrapper);
    CHECK(parse_packet_status("X1.1.C.ID.1/1", p) == ErrorCode::MalformedWrapper);
    CHECK(parse_packet_status("X1.x.C.ID.1/1.AA", p) == ErrorCode::MalformedWrapper);
    CHECK(parse_packet_status("X1.1.Q.ID.1/1.AA", p) == ErrorCode::MalformedWrapper);
    CHECK(parse_packet_status("X1.1.C..1/1.AA", p) == ErrorCode::MalformedWrapper);
    CHECK(parse_packet_status("X1.1.C.ID.11.AA", p) == ErrorCode::MalformedWrapper);
    CHECK(parse_packet_status("X1.1.C.ID.0/1.AA", p) == ErrorCode::MalformedWrapper);
    CHECK(parse_packet_status("X1.1.C.ID.3/2.AA", p) == ErrorCode::MalformedWrapper);
    CHECK(parse_packet_status("X1.1.C.ID.1/1.", p) == ErrorCode::MalformedWrapper);
    CHECK(parse_packet_status("X1.1.S.ID.1/1.AA", p) == ErrorCode::MalformedWrapper);
}

TEST_CASE("Other wrapper versions are reported as unsupported") {
    FramedPacket p;
    CHECK(parse_packet_status("X2.1.C.ID.1/1.AA", p) == ErrorCode::UnsupportedVersion);
    CHECK(parse_packet_status("X10.1.C.ID.1/1.AA", p) == ErrorCode::UnsupportedVersion);
    CHECK(parse_packet_status("XA.1.C.ID.1/1.AA", p) == ErrorCode::MalformedWrapper);
}

TEST_CASE("make_frame and same_message agree on message identity") {
    const FramedPacket a = make_frame(1, ClearMode{}, "ID1", 1, 3, "AAAA");
    const FramedPacket b = make_frame(1, ClearMode{}, "ID1", 2, 3, "BBBB");
    const FramedPacket other_total = make_frame(1, ClearMode{}, "ID1", 2, 4, "BBBB");
    const FramedPacket other_id = make_frame(1, ClearMode{}, "ID2", 2, 3, "BBBB");
    const FramedPacket s1 = make_frame(1, SecureMode{"k1"}, "ID1", 1, 3, "AAAA");
    const FramedPacket s2 = make_frame(1, SecureMode{"k2"}, "ID1", 2, 3, "AAAA");

    CHECK(a.raw == "X1.1.C.ID1.1/3.AAAA");
    CHECK(s1.raw == "X1.1.S.ID1.1/3.k1.AAAA");
    CHECK(same_message(a, b));
    CHECK_FALSE(same_message(a, other_total));
    CHECK_FALSE(same_message(a, other_id));
    CHECK_FALSE(same_message(a, s1));
    CHECK_FALSE(same_message(s1, s2));
}

TEST_CASE("Packet ids use the unambiguous alphabet") {
    const std::string alphabet = PACKET_ID_ALPHABET;
    const std::string id = generate_packet_id();
    CHECK(id.size() == PACKET_ID_LEN);
    for (char c : id) CHECK(alphabet.find(c) != std::string::npos);

    CHECK(generate_packet_id(12, 42) == generate_packet_id(12, 42));
    CHECK(generate_packet_id(12, 42) != generate_packet_id(12, 43));

    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) seen.insert(generate_packet_id());
    CHECK(seen.size() > 45);
}

TEST_CASE("Secure AAD binds every header field") {
    CHECK(make_secure_aad(4, "ABCD1234", 1, 1, "7") == "X1|4|S|ABCD1234|1|1|7");
}

TEST_CASE("make_clear_packet encodes and frames a payload") {
    SitrepPayload s;
    s.src = 12; s.pri = 2; s.t_ms = 1700000000123LL;

    std::string line;
    REQUIRE(make_clear_packet(PacketPayload{s}, "7KQ2M9TA", line) == ErrorCode::Ok);
    CHECK(line == "X1.1.C.7KQ2M9TA.1/1.AQAMAAACAAGwVRUA");

    CHECK(make_clear_packet(PacketPayload{s}, "", line) == ErrorCode::MalformedWrapper);
    CHECK(make_clear_packet(PacketPayload{s}, "A.B", line) == ErrorCode::MalformedWrapper);

    s.src = 0;
    CHECK(make_clear_packet(PacketPayload{s}, "ID", line) == ErrorCode::FieldOutOfRange);
}

TEST_CASE("make_secure_packet frames ciphertext with the key id") {
    std::string line;
    REQUIRE(make_secure_packet(2, "ID9", "team-a", "Zm9v", line) == ErrorCode::Ok);
    CHECK(line == "X1.2.S.ID9.1/1.team-a.Zm9v");
    CHECK(make_secure_packet(2, "ID9", "", "Zm9v", line) == ErrorCode::MalformedWrapper);
    CHECK(make_secure_packet(2, "ID9", "a.b", "Zm9v", line) == ErrorCode::MalformedWrapper);
}

TEST_CASE("describe renders a one-line summary") {
    auto p = parse_packet("X1.1.C.7KQ2M9TA.1/1.AQAMAAACAAGwVRUA");
    REQUIRE(p.has_value());
    CHECK(describe(*p) == "tpl=SITREP id=7KQ2M9TA mode=C part=1/1 payload_len=16");

    PacketPayload payload;
    REQUIRE(decode_payload_b64(p->template_id, p->payload, payload) == ErrorCode::Ok);
    CHECK(describe(payload) == "tpl=SITREP src=12 dst=0 pri=2 status=0 t=1700000000000");
}
