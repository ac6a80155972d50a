#include <doctest/doctest.h>
#include "xtoc/chunk_store.hpp"
#include "xtoc/chunker.hpp"

#include <string>
#include <vector>

using namespace xtoc;

static const std::string kPayload =
    "AQAMAAACAAGwVRUAAQAMAAACAAGwVRUAAQAMAAACAAGwVRUAAQAMAAACAAGwVRUA";

static std::vector<std::string> chunks(const std::string& id, size_t max_chars = 40) {
    return chunk_packet(make_frame(1, ClearMode{}, id, 1, 1, kPayload), max_chars);
}

TEST_CASE("Complete single-chunk lines pass straight through") {
    ChunkStore store;
    REQUIRE(store.add_line("X1.1.C.7KQ2M9TA.1/1.AQAMAAACAAGwVRUA", 1000));
    CHECK(store.pending_frames() == 1);
    store.tick(1000);

    FramedPacket out;
    REQUIRE(store.get_packet(out));
    CHECK(out.id == "7KQ2M9TA");
    CHECK(out.payload == "AQAMAAACAAGwVRUA");
    CHECK_FALSE(store.get_packet(out));
    CHECK(store.stats().completed == 1);
}

TEST_CASE("Chunks arriving over several ticks complete one packet") {
    ChunkStore store;
    const auto lines = chunks("SLOW0001");
    REQUIRE(lines.size() >= 3);

    FramedPacket out;
    uint64_t now = 0;
    for (size_t i = 0; i + 1 < lines.size(); ++i) {
        now += 30000;
        REQUIRE(store.add_line(lines[i], now));
        store.tick(now);
        CHECK_FALSE(store.get_packet(out));
    }
    CHECK(store.pending_groups() == 1);

    REQUIRE(store.add_line(lines.back(), now + 30000));
    store.tick(now + 30000);
    REQUIRE(store.get_packet(out));
    CHECK(out.total == 1);
    CHECK(out.payload == kPayload);
    CHECK(store.pending_groups() == 0);
}

TEST_CASE("Repeated parts count as duplicates and do not emit twice") {
    ChunkStore store;
    const auto lines = chunks("DUPE0001");
    REQUIRE(store.add_line(lines[0], 10));
    REQUIRE(store.add_line(lines[0], 20));
    store.tick(20);
    CHECK(store.stats().duplicates == 1);
    CHECK(store.pending_groups() == 1);

    for (size_t i = 1; i < lines.size(); ++i) REQUIRE(store.add_line(lines[i], 30));
    store.tick(30);

    FramedPacket out;
    REQUIRE(store.get_packet(out));
    CHECK_FALSE(store.get_packet(out));
}

TEST_CASE("Idle groups expire after fifteen minutes") {
    ChunkStore store;
    const auto lines = chunks("IDLE0001");
    REQUIRE(store.add_line(lines[0], 0));
    store.tick(0);
    CHECK(store.pending_groups() == 1);

    store.tick(ChunkStore::BUFFER_TTL_MS);
    CHECK(store.pending_groups() == 1);

    store.tick(ChunkStore::BUFFER_TTL_MS + 1);
    CHECK(store.pending_groups() == 0);
    CHECK(store.stats().expired == 1);
}

TEST_CASE("A new total under the same id restarts the group") {
    ChunkStore store;
    const auto narrow = chunks("RECH0001", 40);
    const auto wide = chunks("RECH0001", 60);
    REQUIRE(narrow.size() != wide.size());

    REQUIRE(store.add_line(narrow[0], 0));
    REQUIRE(store.add_line(narrow[1], 0));
    store.tick(0);

    for (const auto& l : wide) REQUIRE(store.add_line(l, 1));
    store.tick(1);

    FramedPacket out;
    REQUIRE(store.get_packet(out));
    CHECK(out.payload == kPayload);
}

TEST_CASE("Several packets on one received line are all queued") {
    ChunkStore store;
    REQUIRE(store.add_line("rx X1.1.C.AAAA.1/1.QUJD X1.2.C.BBBB.1/1.REVG", 5));
    CHECK(store.pending_frames() == 2);
    store.tick(5);

    FramedPacket a, b;
    REQUIRE(store.get_packet(a));
    REQUIRE(store.get_packet(b));
    CHECK(a.id == "AAAA");
    CHECK(b.id == "BBBB");
}

TEST_CASE("Lines without wrappers are ignored, a full inbox refuses") {
    ChunkStore store;
    CHECK(store.add_line("CQ CQ de N0CALL", 0));
    CHECK(store.stats().ignored == 1);

    for (size_t i = 0; i < ChunkStore::INBOX_CAP; ++i) {
        REQUIRE(store.add_line("X1.1.C.ID" + std::to_string(i) + ".1/1.QUJD", 0));
    }
    CHECK_FALSE(store.add_line("X1.1.C.LAST.1/1.QUJD", 0));
    CHECK(store.stats().refused == 1);
}

TEST_CASE("Frames declaring too many parts are refused") {
    ChunkStore store;
    REQUIRE(store.add_line("X1.1.C.HUGE.1/999.QUJD", 0));
    store.tick(0);
    CHECK(store.pending_groups() == 0);
    CHECK(store.stats().refused == 1);
}

TEST_CASE("Group key separates mode and key id") {
    const FramedPacket c = make_frame(1, ClearMode{}, "ID", 1, 2, "AA");
    const FramedPacket s = make_frame(1, SecureMode{"k"}, "ID", 1, 2, "AA");
    CHECK(ChunkStore::group_key(c) == "X1:1:C:ID:");
    CHECK(ChunkStore::group_key(s) == "X1:1:S:ID:k");
}
