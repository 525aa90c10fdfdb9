#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ss_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        (void)::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Keeps the host's DEEPGRAM_API_KEY out of the assertions.
struct ScopedEnv {
    std::string name;
    std::string saved;
    bool had = false;

    ScopedEnv(const char* n, const char* value) : name(n) {
        if (const char* old = std::getenv(n)) {
            saved = old;
            had = true;
        }
        if (value) setenv(n, value, 1);
        else unsetenv(n);
    }

    ~ScopedEnv() {
        if (had) setenv(name.c_str(), saved.c_str(), 1);
        else unsetenv(name.c_str());
    }
};

} // namespace

TEST_CASE("Config", "[config]") {
    ScopedEnv env("DEEPGRAM_API_KEY", nullptr);

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.audio.codec == "opus");
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.header_bytes == 3);
        REQUIRE(cfg.audio.mic_ring_samples() == 10 * 16000);
        REQUIRE(cfg.keepalive.interval_ms == 10000);
        REQUIRE(cfg.session.inactivity_timeout_ms == 30000);
        REQUIRE(cfg.reconnect.max_attempts == 5);
        REQUIRE(cfg.reconnect.backoff_base_ms == 1000);
        REQUIRE(cfg.reconnect.backoff_multiplier == 1.5);
        REQUIRE(cfg.reconnect.backoff_cap_ms == 30000);
        REQUIRE(cfg.transcript.duplicate_threshold == 0.85);
        REQUIRE(cfg.transcript.recent_window == 15);
        REQUIRE(cfg.transcript.flush_dwell_ms == 180000);
        REQUIRE(cfg.store.retention_days == 14);
        REQUIRE_FALSE(cfg.archive.enabled);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "provider": { "url": "wss://stt.example/v1/listen", "api_key": "k1",
                          "model": "nova-2", "diarize": false },
            "audio": { "codec": "pcm16", "sample_rate": 48000, "channels": 2,
                       "mic_device": "alsa_input.usb-headset" },
            "keepalive": { "interval_ms": 5000, "mode": "both" },
            "session": { "inactivity_timeout_ms": 60000, "max_pending_packets": 10 },
            "reconnect": { "max_attempts": 2, "backoff_multiplier": 2.0 },
            "transcript": { "flush_dwell_ms": 1000, "duplicate_threshold": 0.9 },
            "health": { "stale_after_ms": 120000 },
            "downstream": { "enabled": false, "url": "http://analysis:9000/in" },
            "archive": { "enabled": true, "dir": "/var/tmp/a", "segment_ms": 2000 },
            "store": { "path": "/var/tmp/t.db", "retention_days": 3 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.provider.url == "wss://stt.example/v1/listen");
        REQUIRE(cfg.provider.api_key == "k1");
        REQUIRE(cfg.provider.model == "nova-2");
        REQUIRE_FALSE(cfg.provider.diarize);
        REQUIRE(cfg.audio.codec == "pcm16");
        REQUIRE(cfg.audio.sample_rate == 48000);
        REQUIRE(cfg.audio.channels == 2);
        REQUIRE(cfg.audio.mic_device == "alsa_input.usb-headset");
        REQUIRE(cfg.audio.mic_ring_samples() == 10 * 48000 * 2);
        REQUIRE(cfg.keepalive.mode == "both");
        REQUIRE(cfg.session.max_pending_packets == 10);
        REQUIRE(cfg.reconnect.max_attempts == 2);
        REQUIRE(cfg.reconnect.backoff_multiplier == 2.0);
        REQUIRE(cfg.transcript.duplicate_threshold == 0.9);
        REQUIRE(cfg.health.stale_after_ms == 120000);
        REQUIRE_FALSE(cfg.downstream.enabled);
        REQUIRE(cfg.downstream.url == "http://analysis:9000/in");
        REQUIRE(cfg.archive.enabled);
        REQUIRE(cfg.archive.segment_ms == 2000);
        REQUIRE(cfg.store.retention_days == 3);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "provider": { "language": "en" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.provider.language == "en");
        // Other fields retain defaults
        REQUIRE(cfg.provider.model == "nova-3");
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.keepalive.mode == "audio");
    }

    SECTION("InvalidValuesReplaced") {
        TmpFile f(R"({
            "audio": { "codec": "flac", "channels": 0 },
            "keepalive": { "mode": "ping" },
            "reconnect": { "backoff_multiplier": 0.5 },
            "transcript": { "duplicate_threshold": 3.0, "recent_window": 0 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.audio.codec == "opus");
        REQUIRE(cfg.audio.channels == 1);
        REQUIRE(cfg.keepalive.mode == "audio");
        REQUIRE(cfg.reconnect.backoff_multiplier == 1.5);
        REQUIRE(cfg.transcript.duplicate_threshold == 0.85);
        REQUIRE(cfg.transcript.recent_window == 15);
    }

    SECTION("ZeroPendingQueueReplaced") {
        Config cfg;
        cfg.session.max_pending_packets = 0;
        cfg.validate();
        REQUIRE(cfg.session.max_pending_packets == 1000);

        TmpFile f(R"({ "session": { "max_pending_packets": 0 } })");
        REQUIRE(Config::load(f.path).session.max_pending_packets == 1000);
    }

    SECTION("NegativeUnsignedKeepsDefault") {
        TmpFile f(R"({
            "reconnect": { "max_attempts": -1, "backoff_cap_ms": -5 },
            "store": { "retention_days": -14 },
            "session": { "max_pending_packets": 20 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.reconnect.max_attempts == 5);
        REQUIRE(cfg.reconnect.backoff_cap_ms == 30000);
        REQUIRE(cfg.store.retention_days == 14);
        // Neighbouring keys still load.
        REQUIRE(cfg.session.max_pending_packets == 20);
    }

    SECTION("ApiKeyFromEnvironment") {
        ScopedEnv key("DEEPGRAM_API_KEY", "from-env");
        TmpFile f("{}");
        REQUIRE(Config::load(f.path).provider.api_key == "from-env");

        TmpFile explicit_key(R"({ "provider": { "api_key": "from-file" } })");
        REQUIRE(Config::load(explicit_key.path).provider.api_key == "from-file");
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.audio.codec == "opus");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("WrongTypeFallsBack") {
        TmpFile f(R"({ "audio": { "sample_rate": "fast" } })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ss_test_nonexistent_config_file.json");
        REQUIRE(cfg.audio.codec == "opus");
        REQUIRE(cfg.provider.api_key.empty());
    }
}
