#pragma once

#include "audio/archive_sink.hpp"
#include "audio/audio_segmenter.hpp"
#include "audio/frame_decoder.hpp"
#include "config.hpp"
#include "platform/linux/timerfd_timers.hpp"
#include "transcript/transcript_accumulator.hpp"
#include "upstream/connection_supervisor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

enum class CloseReason { Explicit, Inactive, Terminated, Stale, Shutdown };

const char* to_string(CloseReason r);

struct SessionStatus {
    std::string id;
    std::string codec;
    SupervisorState state;
    uint32_t attempts;
    uint64_t packets;
    uint64_t decode_errors;
    uint64_t fragments;
    uint64_t flushes;
    double idle_seconds;
    double age_seconds;
    bool ended;
};

// One speaker session: decoder, upstream supervisor, accumulator and optional
// archival segmenter, all driven by a private thread and epoll loop. Other
// threads only post commands; every component is touched by that thread alone.
class Session {
public:
    using FlushCallback = std::function<void(const std::string& session_id, const std::string& text)>;
    using EndedCallback = std::function<void(const std::string& session_id)>;

    struct Hooks {
        ConnectionFactory connections;
        ArchiveSink* archive = nullptr;
        FlushCallback on_flush;
        EndedCallback on_ended;
    };

    Session(std::string id, const Config& config, std::unique_ptr<FrameDecoder> decoder,
            Hooks hooks, bool verbose = false);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    bool start();

    void post_audio(std::vector<uint8_t> packet);
    void post_connect();
    void post_flush();

    // The first reason wins; later requests are ignored.
    void request_close(CloseReason reason);
    void join();

    const std::string& id() const { return id_; }
    bool ended() const { return ended_.load(std::memory_order_acquire); }
    bool closing() const { return close_requested_.load(std::memory_order_acquire); }
    std::chrono::steady_clock::time_point last_activity() const;
    SessionStatus status() const;

private:
    struct AudioCmd { std::vector<uint8_t> packet; };
    struct ConnectCmd {};
    struct FlushCmd {};
    struct CloseCmd { CloseReason reason; };
    using Command = std::variant<AudioCmd, ConnectCmd, FlushCmd, CloseCmd>;

    void post(Command cmd);
    void run();
    void drain_commands();
    void handle(AudioCmd& cmd);
    void on_provider_message(const std::string& payload);
    void on_socket_changed(int old_fd, int new_fd);
    void on_timer(TimerKind kind);
    void finish(CloseReason reason);
    void teardown();
    void touch();
    void log(const std::string& msg);

    std::string id_;
    Config config_;
    bool verbose_;
    Hooks hooks_;
    std::unique_ptr<FrameDecoder> decoder_;

    TimerfdTimers timers_;
    std::unique_ptr<ConnectionSupervisor> supervisor_;
    std::unique_ptr<TranscriptAccumulator> accumulator_;
    std::unique_ptr<AudioSegmenter> segmenter_;

    int epoll_fd_ = -1;
    int cmd_fd_ = -1;
    int provider_fd_ = -1;

    std::mutex cmd_mutex_;
    std::deque<Command> commands_;

    bool done_ = false;
    CloseReason close_reason_ = CloseReason::Explicit;

    std::chrono::steady_clock::time_point created_;
    std::atomic<int64_t> last_activity_ns_;
    std::atomic<bool> close_requested_{false};
    std::atomic<bool> ended_{false};
    std::atomic<SupervisorState> state_{SupervisorState::Idle};
    std::atomic<uint32_t> attempts_{0};
    std::atomic<uint64_t> packets_{0};
    std::atomic<uint64_t> decode_errors_{0};
    std::atomic<uint64_t> fragments_{0};
    std::atomic<uint64_t> flushes_{0};

    std::jthread thread_;
};
