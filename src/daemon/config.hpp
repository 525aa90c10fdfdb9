#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Provider {
        std::string url = "wss://api.deepgram.com/v1/listen";
        std::string api_key; // falls back to $DEEPGRAM_API_KEY
        std::string model = "nova-3";
        std::string language = "multi";
        bool smart_format = true;
        bool punctuate = true;
        bool diarize = true;
        bool interim_results = true;
        uint32_t utterance_end_ms = 1000;
        uint32_t endpointing_ms = 500;
        uint32_t connect_timeout_ms = 10000;
    } provider;

    struct Audio {
        std::string codec = "opus"; // "opus" or "pcm16"
        uint32_t sample_rate = 16000;
        uint16_t channels = 1;
        // Device packets start with a fixed header that precedes the codec payload.
        uint32_t header_bytes = 3;
        uint32_t mic_buffer_seconds = 10;
        std::string mic_device; // PipeWire node name; empty: default source

        // Computed from mic_buffer_seconds and sample_rate (no independent config key).
        size_t mic_ring_samples() const {
            return static_cast<size_t>(mic_buffer_seconds) * sample_rate * channels;
        }
    } audio;

    struct KeepAlive {
        uint32_t interval_ms = 10000;
        std::string mode = "audio"; // "message", "audio" or "both"
        uint32_t silence_samples = 1;
    } keepalive;

    struct Session {
        uint32_t inactivity_timeout_ms = 30000;
        size_t max_pending_packets = 1000;
    } session;

    struct Reconnect {
        uint32_t max_attempts = 5;
        uint32_t backoff_base_ms = 1000;
        double backoff_multiplier = 1.5;
        uint32_t backoff_cap_ms = 30000;
    } reconnect;

    struct Transcript {
        uint32_t flush_dwell_ms = 3 * 60 * 1000;
        double duplicate_threshold = 0.85;
        size_t recent_window = 15;
    } transcript;

    struct Health {
        uint32_t sweep_interval_ms = 60 * 1000;
        uint32_t stale_after_ms = 5 * 60 * 1000;
    } health;

    struct Downstream {
        bool enabled = true;
        std::string url = "http://localhost:3000/stream";
        uint32_t timeout_ms = 10000;
    } downstream;

    struct Archive {
        bool enabled = false;
        std::string dir; // empty: <data dir>/archive
        uint32_t segment_ms = 5000;
    } archive;

    struct Store {
        bool enabled = true;
        std::string path; // empty: <data dir>/transcripts.db
        uint32_t retention_days = 14;
    } store;

    static Config load(const std::string& path);
    static Config load_default();

    // Replaces out-of-range values with defaults, reporting each one on stderr.
    void validate();
};
