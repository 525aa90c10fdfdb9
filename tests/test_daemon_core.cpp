#include <catch2/catch_test_macros.hpp>
#include "daemon_core.hpp"
#include "fakes.hpp"

#include "base64.hpp"

#include <atomic>
#include <cstring>

using json = nlohmann::json;
using namespace std::chrono;

namespace {

struct RecordingSink : TranscriptSink {
    std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> blocks;

    std::expected<void, std::string> deliver(const std::string& id, const std::string& text) override {
        std::lock_guard lock(mutex);
        blocks.emplace_back(id, text);
        return {};
    }

    size_t count() {
        std::lock_guard lock(mutex);
        return blocks.size();
    }
};

Config core_config() {
    Config cfg;
    cfg.audio.codec = "pcm16";
    cfg.store.path = ":memory:";
    cfg.downstream.enabled = false;
    cfg.provider.api_key = "test";
    return cfg;
}

std::string encoded_pcm(size_t samples) {
    std::vector<int16_t> pcm(samples, 5);
    std::vector<uint8_t> bytes(pcm.size() * sizeof(int16_t));
    std::memcpy(bytes.data(), pcm.data(), bytes.size());
    return base64::encode(bytes);
}

bool ok(const json& resp) {
    return resp.value("status", "") == "ok";
}

} // namespace

TEST_CASE("DaemonCore", "[daemon]") {
    RingBuffer ring(16000);
    MockAudioCapture mic;
    auto provider = std::make_shared<FakeProvider>();
    auto connections = provider->factory();
    std::atomic<int> notified{0};
    auto cfg = core_config();

    auto* sink = new RecordingSink;
    DaemonCore core(cfg, false, ring, mic,
                    [&](const std::string&) { return connections(); },
                    [&] { notified++; });
    core.set_transcript_sink(std::unique_ptr<TranscriptSink>(sink));
    REQUIRE(core.init());

    SECTION("UnknownCommand") {
        auto resp = core.handle_command("bogus", json::object());
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"] == "unknown command");
    }

    SECTION("AudioValidation") {
        REQUIRE_FALSE(ok(core.handle_command("audio", {{"cmd", "audio"}, {"data", encoded_pcm(4)}})));
        REQUIRE_FALSE(ok(core.handle_command("audio", {{"session_id", "s"}, {"data", "***"}})));
        REQUIRE_FALSE(ok(core.handle_command("audio", {{"session_id", "s"}, {"data", ""}})));
        REQUIRE_FALSE(ok(core.handle_command("audio", {{"session_id", 42}, {"data", "AAAA"}})));
        REQUIRE(core.sessions().size() == 0);
    }

    SECTION("AudioCreatesSessionAndForwards") {
        auto resp = core.handle_command("audio", {{"session_id", "s1"}, {"data", encoded_pcm(320)}});
        REQUIRE(ok(resp));
        REQUIRE(core.sessions().size() == 1);
        REQUIRE(wait_for([&] { return provider->sent_audio().size() == 1; }));
        REQUIRE(provider->sent_audio()[0].size() == 320);
    }

    SECTION("CodecMismatchRejected") {
        REQUIRE(ok(core.handle_command("connect", {{"session_id", "s1"}})));
        auto resp = core.handle_command("audio", {{"session_id", "s1"}, {"codec", "opus"},
                                                  {"data", encoded_pcm(4)}});
        REQUIRE_FALSE(ok(resp));
        REQUIRE(resp["message"] == "session s1 uses codec pcm16");
    }

    SECTION("StatusReportsSessions") {
        REQUIRE(ok(core.handle_command("connect", {{"session_id", "s1"}})));
        REQUIRE(wait_for([&] {
            return core.handle_command("status", {{"session_id", "s1"}})["state"] == "open";
        }));

        auto all = core.handle_command("status", json::object());
        REQUIRE(ok(all));
        REQUIRE(all["sessions"].size() == 1);
        REQUIRE(all["sessions"][0]["codec"] == "pcm16");
        REQUIRE(all["microphone"]["listening"] == false);
        REQUIRE(all["dispatched"] == 0);

        REQUIRE_FALSE(ok(core.handle_command("status", {{"session_id", "nope"}})));
    }

    SECTION("UnknownSessionErrors") {
        REQUIRE_FALSE(ok(core.handle_command("flush", {{"session_id", "nope"}})));
        REQUIRE_FALSE(ok(core.handle_command("disconnect", {{"session_id", "nope"}})));
        REQUIRE_FALSE(ok(core.handle_command("connect", json::object())));
    }

    SECTION("DisconnectDeliversAndRecords") {
        REQUIRE(ok(core.handle_command("connect", {{"session_id", "s1"}})));
        REQUIRE(wait_for([&] { return provider->push(results_json("hello world", 0)); }));
        REQUIRE(wait_for([&] {
            return core.handle_command("status", {{"session_id", "s1"}})["fragments"] == 1;
        }));

        REQUIRE(ok(core.handle_command("disconnect", {{"session_id", "s1"}})));
        REQUIRE(wait_for([&] { return sink->count() == 1; }));
        REQUIRE(sink->blocks[0].first == "s1");
        REQUIRE(sink->blocks[0].second == "Speaker 0: hello world");

        auto history = core.handle_command("history", {{"limit", 5}});
        REQUIRE(ok(history));
        REQUIRE(history["entries"].size() == 1);
        REQUIRE(history["entries"][0]["text"] == "Speaker 0: hello world");
        REQUIRE(history["entries"][0]["session_id"] == "s1");
    }

    SECTION("FlushKeepsSessionOpen") {
        REQUIRE(ok(core.handle_command("connect", {{"session_id", "s1"}})));
        REQUIRE(wait_for([&] { return provider->push(results_json("first block", 1)); }));
        REQUIRE(wait_for([&] {
            return core.handle_command("status", {{"session_id", "s1"}})["fragments"] == 1;
        }));

        REQUIRE(ok(core.handle_command("flush", {{"session_id", "s1"}})));
        REQUIRE(wait_for([&] { return sink->count() == 1; }));
        REQUIRE(core.sessions().find("s1") != nullptr);
        REQUIRE(core.handle_command("status", {{"session_id", "s1"}})["state"] == "open");
    }

    SECTION("ListenAndStop") {
        auto resp = core.handle_command("listen", json::object());
        REQUIRE(ok(resp));
        REQUIRE(resp["session_id"] == "microphone");
        REQUIRE(mic.is_capturing());
        REQUIRE(core.microphone_active());
        REQUIRE_FALSE(ok(core.handle_command("listen", json::object())));

        std::vector<int16_t> captured(700, 3);
        ring.write(captured);
        core.pump_microphone();
        REQUIRE(wait_for([&] { return provider->sent_audio().size() == 2; }));
        REQUIRE(ring.available() == 60);

        REQUIRE(ok(core.handle_command("stop", json::object())));
        REQUIRE_FALSE(mic.is_capturing());
        REQUIRE_FALSE(core.microphone_active());
        REQUIRE(ring.available() == 0);
        REQUIRE(core.sessions().find("microphone") == nullptr);
        REQUIRE_FALSE(ok(core.handle_command("stop", json::object())));
    }

    SECTION("HealthSweepEvictsStale") {
        REQUIRE(ok(core.handle_command("connect", {{"session_id", "old"}})));
        core.health_sweep(steady_clock::now() + milliseconds(cfg.health.stale_after_ms + 1000));
        REQUIRE(core.sessions().size() == 0);

        REQUIRE(wait_for([&] { return notified > 0; }));
        core.on_sessions_changed();
    }

    SECTION("HealthSweepFlushesBeforeEviction") {
        REQUIRE(ok(core.handle_command("connect", {{"session_id", "idle"}})));
        REQUIRE(wait_for([&] { return provider->push(results_json("still buffered", 2)); }));
        REQUIRE(wait_for([&] {
            return core.handle_command("status", {{"session_id", "idle"}})["fragments"] == 1;
        }));

        core.health_sweep(steady_clock::now() + milliseconds(cfg.health.stale_after_ms + 1000));
        REQUIRE(core.sessions().size() == 0);

        REQUIRE(wait_for([&] { return sink->count() == 1; }));
        REQUIRE(sink->blocks[0].first == "idle");
        REQUIRE(sink->blocks[0].second == "Speaker 2: still buffered");

        auto history = core.handle_command("history", {{"limit", 5}, {"session_id", "idle"}});
        REQUIRE(history["entries"].size() == 1);
        REQUIRE(history["entries"][0]["text"] == "Speaker 2: still buffered");
    }

    SECTION("ShutdownIsIdempotent") {
        REQUIRE(ok(core.handle_command("connect", {{"session_id", "s1"}})));
        core.shutdown();
        REQUIRE(core.sessions().size() == 0);
        core.shutdown();
    }
}

TEST_CASE("DaemonCore without store", "[daemon]") {
    RingBuffer ring(1600);
    MockAudioCapture mic;
    auto cfg = core_config();
    cfg.store.enabled = false;

    DaemonCore core(cfg, false, ring, mic,
                    [](const std::string&) { return std::unique_ptr<UpstreamConnection>(); },
                    nullptr);
    REQUIRE(core.init());

    auto resp = core.handle_command("history", json::object());
    REQUIRE(resp["status"] == "error");
    REQUIRE(resp["message"] == "transcript store disabled");
}
