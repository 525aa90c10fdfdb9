#include "upstream/connection_supervisor.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <print>

using namespace std::chrono;

const char* to_string(SupervisorState s) {
    switch (s) {
    case SupervisorState::Idle: return "idle";
    case SupervisorState::Connecting: return "connecting";
    case SupervisorState::Open: return "open";
    case SupervisorState::Closing: return "closing";
    case SupervisorState::Closed: return "closed";
    case SupervisorState::Failing: return "failing";
    case SupervisorState::Backoff: return "backoff";
    case SupervisorState::Terminated: return "terminated";
    }
    return "unknown";
}

ConnectionSupervisor::ConnectionSupervisor(const Config& config, std::string label,
                                           ConnectionFactory factory, TimerService& timers,
                                           Callbacks callbacks, bool verbose)
    : provider_(config.provider), keepalive_(config.keepalive), session_(config.session),
      reconnect_(config.reconnect), channels_(config.audio.channels), label_(std::move(label)),
      factory_(std::move(factory)), timers_(timers), cb_(std::move(callbacks)),
      verbose_(verbose) {}

ConnectionSupervisor::~ConnectionSupervisor() {
    release_connection();
}

int ConnectionSupervisor::socket_fd() const {
    return conn_ ? conn_->fd() : -1;
}

milliseconds ConnectionSupervisor::backoff_delay(uint32_t attempt) const {
    double ms = reconnect_.backoff_base_ms *
                std::pow(reconnect_.backoff_multiplier, attempt > 0 ? attempt - 1 : 0);
    ms = std::min(ms, static_cast<double>(reconnect_.backoff_cap_ms));
    return milliseconds(static_cast<int64_t>(ms));
}

bool ConnectionSupervisor::start() {
    if (state_ != SupervisorState::Idle) return state_ == SupervisorState::Open;
    timers_.arm(TimerKind::Inactivity, milliseconds(session_.inactivity_timeout_ms));
    return connect();
}

bool ConnectionSupervisor::connect() {
    release_connection();
    state_ = SupervisorState::Connecting;

    conn_ = factory_ ? factory_() : nullptr;
    if (!conn_) {
        handle_failure("no connection available", false);
        return false;
    }

    bool ok = conn_->open(milliseconds(provider_.connect_timeout_ms));

    if (cb_.cancelled && cb_.cancelled()) {
        log("close requested during connect, discarding connection");
        release_connection();
        state_ = SupervisorState::Closing;
        return false;
    }

    if (!ok) {
        handle_failure("connect failed", false);
        return false;
    }

    state_ = SupervisorState::Open;
    attempts_ = 0;
    std::println(stderr, "session {}: provider connected", label_);
    registered_fd_ = conn_->fd();
    if (cb_.on_socket_changed) cb_.on_socket_changed(-1, registered_fd_);
    timers_.arm(TimerKind::KeepAlive, milliseconds(keepalive_.interval_ms), true);

    return replay_pending();
}

void ConnectionSupervisor::handle_failure(const std::string& why, bool immediate) {
    state_ = SupervisorState::Failing;
    release_connection();
    timers_.cancel(TimerKind::KeepAlive);

    attempts_++;
    if (attempts_ > reconnect_.max_attempts) {
        std::println(stderr, "session {}: {} ({} attempts), giving up", label_, why,
                     attempts_);
        state_ = SupervisorState::Terminated;
        cancel_timers();
        if (!pending_.empty()) {
            std::println(stderr, "session {}: discarding {} queued packets", label_,
                         pending_.size());
            pending_.clear();
        }
        if (cb_.on_terminated) cb_.on_terminated();
        return;
    }

    if (immediate) {
        std::println(stderr, "session {}: {}, reconnecting (attempt {}/{})", label_, why,
                     attempts_, reconnect_.max_attempts);
        connect();
        return;
    }

    auto delay = backoff_delay(attempts_);
    std::println(stderr, "session {}: {}, retrying in {} ms (attempt {}/{})", label_, why,
                 delay.count(), attempts_, reconnect_.max_attempts);
    state_ = SupervisorState::Backoff;
    timers_.arm(TimerKind::Backoff, delay);
}

bool ConnectionSupervisor::replay_pending() {
    if (!pending_.empty()) log(std::format("replaying {} queued packets", pending_.size()));

    while (!pending_.empty()) {
        auto r = conn_->send_audio(pending_.front());
        if (!r) {
            // Stays at the head for the next connection.
            handle_failure("replay failed: " + r.error(), false);
            return false;
        }
        pending_.pop_front();
    }
    return true;
}

void ConnectionSupervisor::enqueue(std::span<const int16_t> pcm) {
    if (!pending_.empty() && pending_.size() >= session_.max_pending_packets) {
        std::println(stderr, "session {}: pending queue full, dropping oldest packet", label_);
        pending_.pop_front();
    }
    pending_.emplace_back(pcm.begin(), pcm.end());
}

void ConnectionSupervisor::send_audio(std::span<const int16_t> pcm) {
    switch (state_) {
    case SupervisorState::Closing:
    case SupervisorState::Closed:
    case SupervisorState::Terminated:
        log("audio after close ignored");
        return;
    default:
        break;
    }

    timers_.arm(TimerKind::Inactivity, milliseconds(session_.inactivity_timeout_ms));

    if (state_ != SupervisorState::Open) {
        enqueue(pcm);
        if (state_ == SupervisorState::Idle) connect();
        return;
    }

    auto r = conn_->send_audio(pcm);
    if (!r) {
        // Retried once against the new connection via the replay queue.
        pending_.emplace_front(pcm.begin(), pcm.end());
        handle_failure("send failed: " + r.error(), true);
    }
}

void ConnectionSupervisor::on_readable() {
    if (state_ != SupervisorState::Open || !conn_) return;

    auto r = conn_->receive();
    if (!r) {
        handle_failure(r.error(), false);
        return;
    }
    for (const auto& msg : *r) {
        if (cb_.on_message) cb_.on_message(msg);
    }
}

void ConnectionSupervisor::on_keepalive_timer() {
    if (state_ != SupervisorState::Open || !conn_) return;

    std::expected<void, std::string> r;
    if (keepalive_.mode == "message" || keepalive_.mode == "both") {
        r = conn_->send_keepalive();
    }
    if (r && (keepalive_.mode == "audio" || keepalive_.mode == "both")) {
        std::vector<int16_t> silence(static_cast<size_t>(keepalive_.silence_samples) * channels_, 0);
        r = conn_->send_audio(silence);
    }

    if (!r) {
        handle_failure("keep-alive failed: " + r.error(), true);
        return;
    }
    log("keep-alive sent");
}

void ConnectionSupervisor::on_inactivity_timer() {
    switch (state_) {
    case SupervisorState::Closing:
    case SupervisorState::Closed:
    case SupervisorState::Terminated:
        return;
    default:
        break;
    }
    std::println(stderr, "session {}: no audio for {} ms, closing", label_,
                 session_.inactivity_timeout_ms);
    if (cb_.on_inactive) cb_.on_inactive();
}

void ConnectionSupervisor::on_backoff_timer() {
    if (state_ != SupervisorState::Backoff) return;
    if (cb_.cancelled && cb_.cancelled()) return;
    connect();
}

void ConnectionSupervisor::close() {
    if (state_ == SupervisorState::Closed) return;
    bool terminated = state_ == SupervisorState::Terminated;
    state_ = SupervisorState::Closing;
    cancel_timers();

    if (conn_) {
        unregister_socket();
        conn_->close();
        conn_.reset();
    }
    if (!pending_.empty()) {
        std::println(stderr, "session {}: closed with {} unsent packets", label_,
                     pending_.size());
        pending_.clear();
    }
    state_ = terminated ? SupervisorState::Terminated : SupervisorState::Closed;
}

void ConnectionSupervisor::unregister_socket() {
    if (registered_fd_ < 0) return;
    int old_fd = registered_fd_;
    registered_fd_ = -1;
    if (cb_.on_socket_changed) cb_.on_socket_changed(old_fd, -1);
}

void ConnectionSupervisor::release_connection() {
    unregister_socket();
    conn_.reset();
}

void ConnectionSupervisor::cancel_timers() {
    timers_.cancel(TimerKind::KeepAlive);
    timers_.cancel(TimerKind::Inactivity);
    timers_.cancel(TimerKind::Backoff);
}

void ConnectionSupervisor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "session {}: {}", label_, msg);
    }
}
