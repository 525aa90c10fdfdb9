#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"
#include "upstream/curl_ws_connection.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

constexpr long kMicPumpNs = 20 * 1000 * 1000;

bool arm_timerfd(int fd, long interval_ns) {
    itimerspec spec{};
    spec.it_value.tv_sec = interval_ns / 1000000000L;
    spec.it_value.tv_nsec = interval_ns % 1000000000L;
    spec.it_interval = spec.it_value;
    return timerfd_settime(fd, 0, &spec, nullptr) == 0;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      listen_url_(build_listen_url(config_.provider, config_.audio)),
      ring_buf_(config_.audio.mic_ring_samples()),
      audio_capture_(ring_buf_, config_.audio.sample_rate, config_.audio.channels,
                     config_.audio.mic_device),
      core_(config_, verbose_, ring_buf_, audio_capture_,
            // UpstreamFactory
            [this](const std::string& session_id) -> std::unique_ptr<UpstreamConnection> {
                return std::make_unique<CurlWsConnection>(listen_url_, config_.provider.api_key,
                                                          session_id);
            },
            // NotifyCallback: runs on session threads
            [this]() {
                uint64_t val = 1;
                if (::write(session_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    core_.shutdown();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (session_event_fd_ >= 0) ::close(session_event_fd_);
    if (sweep_timer_fd_ >= 0) ::close(sweep_timer_fd_);
    if (mic_timer_fd_ >= 0) ::close(mic_timer_fd_);
}

bool LinuxEventLoop::init() {
    // Block before any worker thread exists so every thread inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Session-ended notifications may arrive as soon as the first session exists.
    session_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (session_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (transcript store, downstream, archive)
    if (!core_.init()) return false;

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Fleet health sweep and microphone pump
    sweep_timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    mic_timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (sweep_timer_fd_ < 0 || mic_timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    if (!arm_timerfd(sweep_timer_fd_, static_cast<long>(config_.health.sweep_interval_ms) * 1000000L)) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(session_event_fd_, EPOLLIN) ||
        !add_fd(sweep_timer_fd_, EPOLLIN) ||
        !add_fd(mic_timer_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;
            uint64_t val;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == session_event_fd_) {
                ::read(session_event_fd_, &val, sizeof(val));
                core_.on_sessions_changed();
                sync_mic_pump();
                continue;
            }

            if (fd == sweep_timer_fd_) {
                ::read(sweep_timer_fd_, &val, sizeof(val));
                core_.health_sweep();
                sync_mic_pump();
                continue;
            }

            if (fd == mic_timer_fd_) {
                ::read(mic_timer_fd_, &val, sizeof(val));
                core_.pump_microphone();
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown: every session flushes before the process exits
    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool alive = ipc_server_.read_commands(fd, cmds);

    for (const auto& cmd : cmds) {
        nlohmann::json response;
        if (!cmd.is_object()) {
            response = {{"status", "error"}, {"message", "malformed command"}};
        } else {
            auto cmd_str = cmd.contains("cmd") && cmd["cmd"].is_string()
                               ? cmd["cmd"].get<std::string>()
                               : std::string();
            response = core_.handle_command(cmd_str, cmd);
        }
        if (alive && !ipc_server_.send_response(fd, response)) alive = false;
    }
    sync_mic_pump();

    if (!alive) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        ipc_server_.close_client(fd);
    }
}

void LinuxEventLoop::sync_mic_pump() {
    bool want = core_.microphone_active();
    if (want == mic_pump_armed_) return;

    if (!arm_timerfd(mic_timer_fd_, want ? kMicPumpNs : 0)) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return;
    }
    mic_pump_armed_ = want;
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[streamscribe] {}", msg);
    }
}
