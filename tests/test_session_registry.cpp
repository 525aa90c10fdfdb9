#include <catch2/catch_test_macros.hpp>
#include "fakes.hpp"
#include "session_registry.hpp"

#include <atomic>

using namespace std::chrono;

TEST_CASE("SessionRegistry", "[registry]") {
    Config cfg;
    cfg.audio.codec = "pcm16";
    auto provider = std::make_shared<FakeProvider>();
    std::atomic<int> created{0};

    SessionRegistry registry([&](const std::string& id, const std::string& codec)
                                 -> std::expected<std::shared_ptr<Session>, std::string> {
        auto decoder = make_frame_decoder(codec.empty() ? "pcm16" : codec, 16000, 1, 0);
        if (!decoder) return std::unexpected(decoder.error());
        created++;
        auto s = std::make_shared<Session>(id, cfg, std::move(*decoder),
                                           Session::Hooks{.connections = provider->factory()});
        if (!s->start()) return std::unexpected("start failed");
        return s;
    });

    SECTION("SameIdSameSession") {
        auto a = registry.get_or_create("a", "");
        auto b = registry.get_or_create("a", "opus");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->get() == b->get());
        REQUIRE(created == 1);
        REQUIRE(registry.size() == 1);
    }

    SECTION("ConcurrentCallersConverge") {
        std::vector<std::shared_ptr<Session>> seen(8);
        {
            std::vector<std::jthread> threads;
            for (size_t i = 0; i < seen.size(); i++) {
                threads.emplace_back([&, i] {
                    auto s = registry.get_or_create("shared", "pcm16");
                    if (s) seen[i] = *s;
                });
            }
        }
        REQUIRE(created == 1);
        for (auto& s : seen) REQUIRE(s.get() == seen[0].get());
    }

    SECTION("RejectsEmptyIdAndBadCodec") {
        REQUIRE_FALSE(registry.get_or_create("", "pcm16").has_value());
        auto bad = registry.get_or_create("x", "vorbis");
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error() == "unknown codec: vorbis");
        REQUIRE(registry.size() == 0);
    }

    SECTION("RemoveClosesSession") {
        auto s = *registry.get_or_create("gone", "");
        REQUIRE(registry.remove("gone"));
        REQUIRE_FALSE(registry.remove("gone"));
        REQUIRE(registry.find("gone") == nullptr);
        REQUIRE(s->closing());
        REQUIRE(wait_for([&] { return s->ended(); }));
        REQUIRE(registry.reap() == 1);
    }

    SECTION("ClosingSessionReplaced") {
        auto first = *registry.get_or_create("id", "");
        first->request_close(CloseReason::Explicit);
        auto second = *registry.get_or_create("id", "");
        REQUIRE(first.get() != second.get());
        REQUIRE(created == 2);
        REQUIRE(registry.find("id") == second);
    }

    SECTION("ReapDetachesEndedSessions") {
        auto s = *registry.get_or_create("self-ending", "");
        s->request_close(CloseReason::Inactive);
        REQUIRE(wait_for([&] { return s->ended(); }));

        REQUIRE(registry.reap() == 1);
        REQUIRE(registry.size() == 0);
        REQUIRE(registry.reap() == 0);
    }

    SECTION("SweepEvictsIdle") {
        auto idle = *registry.get_or_create("idle", "");
        std::this_thread::sleep_for(milliseconds(100));
        auto busy = *registry.get_or_create("busy", "");
        busy->post_connect();

        auto evicted = registry.sweep(steady_clock::now(), milliseconds(50));
        REQUIRE(evicted == std::vector<std::string>{"idle"});
        REQUIRE(idle->closing());
        REQUIRE_FALSE(busy->closing());
        REQUIRE(registry.size() == 1);
    }

    SECTION("SnapshotListsLiveSessions") {
        registry.get_or_create("one", "");
        registry.get_or_create("two", "");
        auto snap = registry.snapshot();
        REQUIRE(snap.size() == 2);
        REQUIRE(snap[0].id == "one");
        REQUIRE(snap[1].codec == "pcm16");
    }

    SECTION("CloseAllJoins") {
        auto a = *registry.get_or_create("a", "");
        auto b = *registry.get_or_create("b", "");
        registry.close_all();
        REQUIRE(a->ended());
        REQUIRE(b->ended());
        REQUIRE(registry.size() == 0);
    }
}
