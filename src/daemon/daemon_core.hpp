#pragma once

#include "audio/archive_sink.hpp"
#include "config.hpp"
#include "downstream/transcript_dispatcher.hpp"
#include "downstream/transcript_sink.hpp"
#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"
#include "session_registry.hpp"
#include "storage/transcript_store.hpp"
#include "upstream/upstream_connection.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

class DaemonCore {
public:
    using UpstreamFactory = std::function<std::unique_ptr<UpstreamConnection>(const std::string& session_id)>;
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               RingBuffer& mic_ring, AudioCapture& mic,
               UpstreamFactory upstream_factory, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the transcript store and builds the downstream and archive sinks.
    // Tests may inject their own sink before calling init().
    bool init();
    void set_transcript_sink(std::unique_ptr<TranscriptSink> sink) { sink_ = std::move(sink); }

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // A session thread ended on its own; reap it.
    void on_sessions_changed();

    // Periodic: tear down sessions with no activity for health.stale_after_ms.
    void health_sweep(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Periodic while listening: forwards captured microphone audio in 20 ms packets.
    void pump_microphone();
    bool microphone_active() const { return !mic_session_.empty(); }

    SessionRegistry& sessions() { return registry_; }
    const Config& config() const { return config_; }

    void shutdown();

private:
    nlohmann::json handle_audio(const nlohmann::json& cmd);
    nlohmann::json handle_connect(const nlohmann::json& cmd);
    nlohmann::json handle_flush(const nlohmann::json& cmd);
    nlohmann::json handle_disconnect(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_listen(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);

    std::expected<std::shared_ptr<Session>, std::string>
        create_session(const std::string& id, const std::string& codec);
    std::expected<std::shared_ptr<Session>, std::string>
        session_for(const std::string& id, const std::string& codec);

    void forward_microphone(size_t packet_samples, bool flush_tail);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    RingBuffer& mic_ring_;
    AudioCapture& mic_;

    UpstreamFactory upstream_factory_;
    NotifyCallback notify_;

    TranscriptStore store_;
    bool store_open_ = false;
    std::unique_ptr<TranscriptSink> sink_;
    std::unique_ptr<ArchiveSink> archive_;
    std::unique_ptr<TranscriptDispatcher> dispatcher_;

    SessionRegistry registry_;
    std::string mic_session_;
    std::vector<int16_t> mic_scratch_;
};
