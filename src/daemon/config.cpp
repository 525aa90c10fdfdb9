#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <type_traits>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (!section.contains(key)) return;
    const auto& v = section[key];
    // get<unsigned>() wraps negative numbers; keep the default instead.
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (v.is_number() && v.get<double>() < 0) {
            std::println(stderr, "config: negative {}, using default", key);
            return;
        }
    }
    out = v.get<T>();
}

void apply_env(Config& cfg) {
    if (cfg.provider.api_key.empty()) {
        if (const char* key = std::getenv("DEEPGRAM_API_KEY")) {
            cfg.provider.api_key = key;
        }
    }
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        apply_env(cfg);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("provider")) {
            auto& p = j["provider"];
            read_key(p, "url", cfg.provider.url);
            read_key(p, "api_key", cfg.provider.api_key);
            read_key(p, "model", cfg.provider.model);
            read_key(p, "language", cfg.provider.language);
            read_key(p, "smart_format", cfg.provider.smart_format);
            read_key(p, "punctuate", cfg.provider.punctuate);
            read_key(p, "diarize", cfg.provider.diarize);
            read_key(p, "interim_results", cfg.provider.interim_results);
            read_key(p, "utterance_end_ms", cfg.provider.utterance_end_ms);
            read_key(p, "endpointing_ms", cfg.provider.endpointing_ms);
            read_key(p, "connect_timeout_ms", cfg.provider.connect_timeout_ms);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "codec", cfg.audio.codec);
            read_key(a, "sample_rate", cfg.audio.sample_rate);
            read_key(a, "channels", cfg.audio.channels);
            read_key(a, "header_bytes", cfg.audio.header_bytes);
            read_key(a, "mic_buffer_seconds", cfg.audio.mic_buffer_seconds);
            read_key(a, "mic_device", cfg.audio.mic_device);
        }

        if (j.contains("keepalive")) {
            auto& k = j["keepalive"];
            read_key(k, "interval_ms", cfg.keepalive.interval_ms);
            read_key(k, "mode", cfg.keepalive.mode);
            read_key(k, "silence_samples", cfg.keepalive.silence_samples);
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            read_key(s, "inactivity_timeout_ms", cfg.session.inactivity_timeout_ms);
            read_key(s, "max_pending_packets", cfg.session.max_pending_packets);
        }

        if (j.contains("reconnect")) {
            auto& r = j["reconnect"];
            read_key(r, "max_attempts", cfg.reconnect.max_attempts);
            read_key(r, "backoff_base_ms", cfg.reconnect.backoff_base_ms);
            read_key(r, "backoff_multiplier", cfg.reconnect.backoff_multiplier);
            read_key(r, "backoff_cap_ms", cfg.reconnect.backoff_cap_ms);
        }

        if (j.contains("transcript")) {
            auto& t = j["transcript"];
            read_key(t, "flush_dwell_ms", cfg.transcript.flush_dwell_ms);
            read_key(t, "duplicate_threshold", cfg.transcript.duplicate_threshold);
            read_key(t, "recent_window", cfg.transcript.recent_window);
        }

        if (j.contains("health")) {
            auto& h = j["health"];
            read_key(h, "sweep_interval_ms", cfg.health.sweep_interval_ms);
            read_key(h, "stale_after_ms", cfg.health.stale_after_ms);
        }

        if (j.contains("downstream")) {
            auto& d = j["downstream"];
            read_key(d, "enabled", cfg.downstream.enabled);
            read_key(d, "url", cfg.downstream.url);
            read_key(d, "timeout_ms", cfg.downstream.timeout_ms);
        }

        if (j.contains("archive")) {
            auto& a = j["archive"];
            read_key(a, "enabled", cfg.archive.enabled);
            read_key(a, "dir", cfg.archive.dir);
            read_key(a, "segment_ms", cfg.archive.segment_ms);
        }

        if (j.contains("store")) {
            auto& s = j["store"];
            read_key(s, "enabled", cfg.store.enabled);
            read_key(s, "path", cfg.store.path);
            read_key(s, "retention_days", cfg.store.retention_days);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        cfg = Config{};
    }

    apply_env(cfg);
    cfg.validate();
    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (!dir.empty()) {
        auto config_path = fs::path(dir) / "config.json";
        if (fs::exists(config_path)) {
            return load(config_path.string());
        }
    }
    Config cfg;
    apply_env(cfg);
    return cfg;
}

void Config::validate() {
    const Config defaults;

    auto reset = [](auto& field, const auto& fallback, const char* name) {
        std::println(stderr, "config: invalid {}, using default", name);
        field = fallback;
    };

    if (audio.codec != "opus" && audio.codec != "pcm16")
        reset(audio.codec, defaults.audio.codec, "audio.codec");
    if (audio.sample_rate == 0)
        reset(audio.sample_rate, defaults.audio.sample_rate, "audio.sample_rate");
    if (audio.channels == 0 || audio.channels > 2)
        reset(audio.channels, defaults.audio.channels, "audio.channels");

    if (keepalive.mode != "message" && keepalive.mode != "audio" && keepalive.mode != "both")
        reset(keepalive.mode, defaults.keepalive.mode, "keepalive.mode");
    if (keepalive.interval_ms == 0)
        reset(keepalive.interval_ms, defaults.keepalive.interval_ms, "keepalive.interval_ms");
    if (keepalive.silence_samples == 0)
        reset(keepalive.silence_samples, defaults.keepalive.silence_samples, "keepalive.silence_samples");

    if (session.inactivity_timeout_ms == 0)
        reset(session.inactivity_timeout_ms, defaults.session.inactivity_timeout_ms,
              "session.inactivity_timeout_ms");
    if (session.max_pending_packets == 0)
        reset(session.max_pending_packets, defaults.session.max_pending_packets,
              "session.max_pending_packets");

    if (reconnect.backoff_multiplier < 1.0)
        reset(reconnect.backoff_multiplier, defaults.reconnect.backoff_multiplier,
              "reconnect.backoff_multiplier");

    if (transcript.duplicate_threshold < 0.0 || transcript.duplicate_threshold > 1.0)
        reset(transcript.duplicate_threshold, defaults.transcript.duplicate_threshold,
              "transcript.duplicate_threshold");
    if (transcript.flush_dwell_ms == 0)
        reset(transcript.flush_dwell_ms, defaults.transcript.flush_dwell_ms, "transcript.flush_dwell_ms");
    if (transcript.recent_window == 0)
        reset(transcript.recent_window, defaults.transcript.recent_window, "transcript.recent_window");

    if (health.sweep_interval_ms == 0)
        reset(health.sweep_interval_ms, defaults.health.sweep_interval_ms, "health.sweep_interval_ms");
    if (health.stale_after_ms == 0)
        reset(health.stale_after_ms, defaults.health.stale_after_ms, "health.stale_after_ms");

    if (archive.segment_ms == 0)
        reset(archive.segment_ms, defaults.archive.segment_ms, "archive.segment_ms");
}
