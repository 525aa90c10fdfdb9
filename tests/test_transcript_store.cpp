#include <catch2/catch_test_macros.hpp>

#include "storage/transcript_store.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("ss_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("TranscriptStore", "[store]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        TranscriptStore store;
        REQUIRE(store.open(tmp.path));
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TranscriptStore store;
        REQUIRE(store.open(":memory:"));

        REQUIRE(store.insert("room-1", "Speaker 0: hello", 14));
        auto rows = store.recent(5);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].session_id == "room-1");
        REQUIRE(rows[0].text == "Speaker 0: hello");
        REQUIRE_FALSE(rows[0].created_at.empty());
        REQUIRE(rows[0].expires_at > rows[0].created_at);
    }

    SECTION("NewestFirstWithLimit") {
        TranscriptStore store;
        REQUIRE(store.open(":memory:"));
        for (int i = 0; i < 5; i++) {
            REQUIRE(store.insert("s", "block " + std::to_string(i), 1));
        }
        auto rows = store.recent(3);
        REQUIRE(rows.size() == 3);
        REQUIRE(rows[0].text == "block 4");
        REQUIRE(rows[2].text == "block 2");
    }

    SECTION("FilterBySession") {
        TranscriptStore store;
        REQUIRE(store.open(":memory:"));
        store.insert("a", "from a", 1);
        store.insert("b", "from b", 1);
        store.insert("a", "again a", 1);

        auto rows = store.recent(10, "a");
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0].text == "again a");
        REQUIRE(rows[1].text == "from a");
        REQUIRE(store.recent(10, "missing").empty());
    }

    SECTION("ExpiredRowsHiddenAndPurged") {
        TranscriptStore store;
        REQUIRE(store.open(":memory:"));
        store.insert("s", "kept", 7);
        store.insert("s", "gone", 0);

        auto rows = store.recent(10);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].text == "kept");

        REQUIRE(store.purge_expired() == 1);
        REQUIRE(store.purge_expired() == 0);
    }

    SECTION("PersistsAcrossReopen") {
        TmpDb tmp;
        {
            TranscriptStore store;
            REQUIRE(store.open(tmp.path));
            REQUIRE(store.insert("s", "durable", 3));
        }
        TranscriptStore store;
        REQUIRE(store.open(tmp.path));
        auto rows = store.recent(1);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].text == "durable");
    }

    SECTION("ClosedStoreRefuses") {
        TranscriptStore store;
        REQUIRE_FALSE(store.insert("s", "x", 1));
        REQUIRE(store.recent().empty());
        REQUIRE(store.purge_expired() == -1);
    }
}
