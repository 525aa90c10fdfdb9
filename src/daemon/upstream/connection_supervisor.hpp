#pragma once

#include "config.hpp"
#include "platform/timer_service.hpp"
#include "upstream/upstream_connection.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

enum class SupervisorState { Idle, Connecting, Open, Closing, Closed, Failing, Backoff, Terminated };

const char* to_string(SupervisorState s);

// Drives one session's UpstreamConnection: connect, keep-alive, reconnect with
// backoff, inactivity auto-close. Runs entirely on the owning session's thread;
// timer expiries and socket readiness are fed in by that thread's loop.
class ConnectionSupervisor {
public:
    struct Callbacks {
        std::function<void(const std::string&)> on_message;
        // Reconnect budget exhausted; the connection is already released.
        std::function<void()> on_terminated;
        // No genuine audio for the inactivity timeout.
        std::function<void()> on_inactive;
        // The pollable provider socket changed (-1 for none).
        std::function<void(int old_fd, int new_fd)> on_socket_changed;
        // Polled after a blocking connect; true discards the new connection.
        std::function<bool()> cancelled;
    };

    ConnectionSupervisor(const Config& config, std::string label, ConnectionFactory factory,
                         TimerService& timers, Callbacks callbacks, bool verbose = false);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    // Idle -> Connecting. True once the connection is open.
    bool start();

    // Genuine audio: re-arms the inactivity timer, sends when Open and queues
    // otherwise. A send failure reconnects at once and replays the payload.
    void send_audio(std::span<const int16_t> pcm);

    void on_readable();
    void on_keepalive_timer();
    void on_inactivity_timer();
    void on_backoff_timer();

    // Graceful close; cancels timers and any pending reconnect.
    void close();

    SupervisorState state() const { return state_; }
    uint32_t attempts() const { return attempts_; }
    size_t pending_packets() const { return pending_.size(); }
    int socket_fd() const;

    std::chrono::milliseconds backoff_delay(uint32_t attempt) const;

private:
    bool connect();
    void handle_failure(const std::string& why, bool immediate);
    bool replay_pending();
    void enqueue(std::span<const int16_t> pcm);
    void unregister_socket();
    void release_connection();
    void cancel_timers();
    void log(const std::string& msg);

    Config::Provider provider_;
    Config::KeepAlive keepalive_;
    Config::Session session_;
    Config::Reconnect reconnect_;
    uint16_t channels_;
    std::string label_;
    ConnectionFactory factory_;
    TimerService& timers_;
    Callbacks cb_;
    bool verbose_;

    std::unique_ptr<UpstreamConnection> conn_;
    SupervisorState state_ = SupervisorState::Idle;
    uint32_t attempts_ = 0;
    int registered_fd_ = -1;
    std::deque<std::vector<int16_t>> pending_;
};
