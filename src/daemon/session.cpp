#include "session.hpp"

#include "upstream/provider_message.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

using namespace std::chrono;

namespace {

int64_t now_ns() {
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

const char* to_string(CloseReason r) {
    switch (r) {
    case CloseReason::Explicit: return "disconnect";
    case CloseReason::Inactive: return "inactivity";
    case CloseReason::Terminated: return "reconnect budget exhausted";
    case CloseReason::Stale: return "stale";
    case CloseReason::Shutdown: return "shutdown";
    }
    return "unknown";
}

Session::Session(std::string id, const Config& config, std::unique_ptr<FrameDecoder> decoder,
                 Hooks hooks, bool verbose)
    : id_(std::move(id)), config_(config), verbose_(verbose), hooks_(std::move(hooks)),
      decoder_(std::move(decoder)), created_(steady_clock::now()),
      last_activity_ns_(now_ns()) {}

Session::~Session() {
    request_close(CloseReason::Shutdown);
    join();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (cmd_fd_ >= 0) ::close(cmd_fd_);
}

bool Session::start() {
    if (!timers_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "session {}: epoll_create1 failed: {}", id_, std::strerror(errno));
        return false;
    }

    cmd_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (cmd_fd_ < 0) {
        std::println(stderr, "session {}: eventfd failed: {}", id_, std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    bool ok = add_fd(cmd_fd_);
    for (auto kind : {TimerKind::KeepAlive, TimerKind::Inactivity, TimerKind::FlushDwell,
                      TimerKind::Backoff}) {
        ok = ok && add_fd(timers_.fd(kind));
    }
    if (!ok) {
        std::println(stderr, "session {}: epoll_ctl failed: {}", id_, std::strerror(errno));
        return false;
    }

    supervisor_ = std::make_unique<ConnectionSupervisor>(
        config_, id_, hooks_.connections, timers_,
        ConnectionSupervisor::Callbacks{
            .on_message = [this](const std::string& m) { on_provider_message(m); },
            .on_terminated = [this] { finish(CloseReason::Terminated); },
            .on_inactive = [this] { finish(CloseReason::Inactive); },
            .on_socket_changed = [this](int o, int n) { on_socket_changed(o, n); },
            .cancelled = [this] { return close_requested_.load(std::memory_order_acquire); },
        },
        verbose_);

    accumulator_ = std::make_unique<TranscriptAccumulator>(
        config_.transcript, timers_, [this](const std::string& text) {
            flushes_.fetch_add(1, std::memory_order_relaxed);
            std::println(stderr, "session {}: flushed {} chars", id_, text.size());
            if (hooks_.on_flush) hooks_.on_flush(id_, text);
        });

    if (hooks_.archive) {
        segmenter_ = std::make_unique<AudioSegmenter>(
            config_.audio.sample_rate, config_.audio.channels,
            milliseconds(config_.archive.segment_ms), [this](AudioSegment seg) {
                auto r = hooks_.archive->store(id_, seg);
                if (!r) {
                    std::println(stderr, "session {}: archive segment {} failed: {}", id_,
                                 seg.index, r.error());
                }
            });
    }

    thread_ = std::jthread([this] { run(); });
    return true;
}

void Session::post(Command cmd) {
    {
        std::lock_guard lock(cmd_mutex_);
        commands_.push_back(std::move(cmd));
    }
    uint64_t val = 1;
    if (::write(cmd_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "session {}: eventfd write failed: {}", id_, std::strerror(errno));
    }
}

void Session::post_audio(std::vector<uint8_t> packet) {
    touch();
    post(AudioCmd{std::move(packet)});
}

void Session::post_connect() {
    touch();
    post(ConnectCmd{});
}

void Session::post_flush() {
    post(FlushCmd{});
}

void Session::request_close(CloseReason reason) {
    if (close_requested_.exchange(true, std::memory_order_acq_rel)) return;
    if (cmd_fd_ < 0) return;
    post(CloseCmd{reason});
}

void Session::join() {
    if (!thread_.joinable()) return;
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
        return;
    }
    thread_.join();
}

void Session::touch() {
    last_activity_ns_.store(now_ns(), std::memory_order_relaxed);
}

steady_clock::time_point Session::last_activity() const {
    return steady_clock::time_point(nanoseconds(last_activity_ns_.load(std::memory_order_relaxed)));
}

SessionStatus Session::status() const {
    auto now = steady_clock::now();
    return SessionStatus{
        .id = id_,
        .codec = decoder_ ? std::string(decoder_->codec()) : "",
        .state = state_.load(std::memory_order_relaxed),
        .attempts = attempts_.load(std::memory_order_relaxed),
        .packets = packets_.load(std::memory_order_relaxed),
        .decode_errors = decode_errors_.load(std::memory_order_relaxed),
        .fragments = fragments_.load(std::memory_order_relaxed),
        .flushes = flushes_.load(std::memory_order_relaxed),
        .idle_seconds = duration<double>(now - last_activity()).count(),
        .age_seconds = duration<double>(now - created_).count(),
        .ended = ended(),
    };
}

void Session::run() {
    log("worker started");
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    while (!done_) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "session {}: epoll_wait error: {}", id_, std::strerror(errno));
            finish(CloseReason::Shutdown);
            break;
        }

        for (int i = 0; i < n && !done_; i++) {
            int fd = events[i].data.fd;

            if (fd == cmd_fd_) {
                uint64_t val;
                (void)::read(cmd_fd_, &val, sizeof(val));
                drain_commands();
            } else if (fd == provider_fd_) {
                supervisor_->on_readable();
            } else if (auto kind = timers_.kind_for_fd(fd)) {
                // Zero means the timer was re-armed or cancelled after firing.
                if (timers_.consume(*kind) > 0) on_timer(*kind);
            }

            state_.store(supervisor_->state(), std::memory_order_relaxed);
            attempts_.store(supervisor_->attempts(), std::memory_order_relaxed);
        }
    }

    teardown();
}

void Session::drain_commands() {
    std::deque<Command> batch;
    {
        std::lock_guard lock(cmd_mutex_);
        batch.swap(commands_);
    }

    for (auto& cmd : batch) {
        if (done_) break;
        if (auto* audio = std::get_if<AudioCmd>(&cmd)) {
            handle(*audio);
        } else if (std::holds_alternative<ConnectCmd>(cmd)) {
            if (!closing()) supervisor_->start();
        } else if (std::holds_alternative<FlushCmd>(cmd)) {
            accumulator_->flush();
        } else if (auto* close = std::get_if<CloseCmd>(&cmd)) {
            finish(close->reason);
        }
    }
}

void Session::handle(AudioCmd& cmd) {
    packets_.fetch_add(1, std::memory_order_relaxed);

    auto pcm = decoder_->decode(cmd.packet);
    if (!pcm) {
        decode_errors_.fetch_add(1, std::memory_order_relaxed);
        std::println(stderr, "session {}: dropped packet: {}", id_, pcm.error());
        return;
    }
    if (pcm->empty()) return;

    if (segmenter_) segmenter_->push(*pcm);

    // A pending close must not start a new connection.
    if (closing() && supervisor_->state() != SupervisorState::Open) {
        log("audio after close request not forwarded");
        return;
    }
    supervisor_->send_audio(*pcm);
}

void Session::on_provider_message(const std::string& payload) {
    auto ev = parse_provider_message(payload);
    if (!ev) {
        std::println(stderr, "session {}: ignoring provider message: {}", id_, ev.error());
        return;
    }

    switch (ev->type) {
    case ProviderEventType::Transcript: {
        touch();
        auto result = accumulator_->accept(TranscriptFragment{
            .text = ev->text,
            .speaker = ev->speaker,
            .is_final = ev->is_final,
        });
        if (result == AcceptResult::Appended) {
            fragments_.fetch_add(1, std::memory_order_relaxed);
            log(std::format("final fragment (speaker {}): {}",
                            ev->speaker ? std::to_string(*ev->speaker) : "-", ev->text));
        } else if (result == AcceptResult::Duplicate) {
            log("duplicate fragment dropped: " + ev->text);
        }
        break;
    }
    case ProviderEventType::Error:
        std::println(stderr, "session {}: provider error: {}", id_, ev->error);
        break;
    case ProviderEventType::Metadata:
        log("provider metadata");
        break;
    case ProviderEventType::UtteranceEnd:
        log("utterance end");
        break;
    case ProviderEventType::SpeechStarted:
        log("speech started");
        break;
    case ProviderEventType::Unknown:
        log("unrecognised provider message");
        break;
    }
}

void Session::on_socket_changed(int old_fd, int new_fd) {
    if (old_fd >= 0) {
        // The descriptor may already be closed by the connection.
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, old_fd, nullptr);
        if (provider_fd_ == old_fd) provider_fd_ = -1;
    }
    if (new_fd >= 0) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = new_fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, new_fd, &ev) < 0) {
            std::println(stderr, "session {}: epoll_ctl provider socket failed: {}", id_,
                         std::strerror(errno));
        }
        provider_fd_ = new_fd;
    }
}

void Session::on_timer(TimerKind kind) {
    switch (kind) {
    case TimerKind::KeepAlive: supervisor_->on_keepalive_timer(); break;
    case TimerKind::Inactivity: supervisor_->on_inactivity_timer(); break;
    case TimerKind::FlushDwell: accumulator_->on_flush_timer(); break;
    case TimerKind::Backoff: supervisor_->on_backoff_timer(); break;
    }
}

void Session::finish(CloseReason reason) {
    if (done_) return;
    done_ = true;
    close_reason_ = reason;
    close_requested_.store(true, std::memory_order_release);
}

void Session::teardown() {
    std::println(stderr, "session {}: closing ({})", id_, to_string(close_reason_));

    // Flush before the connection goes away so the block is never lost.
    accumulator_->flush();
    if (segmenter_) segmenter_->finish();
    supervisor_->close();
    timers_.cancel(TimerKind::FlushDwell);

    state_.store(supervisor_->state(), std::memory_order_relaxed);
    ended_.store(true, std::memory_order_release);
    if (hooks_.on_ended) hooks_.on_ended(id_);
}

void Session::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "session {}: {}", id_, msg);
    }
}
