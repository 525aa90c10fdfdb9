#include "platform/linux/timerfd_timers.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

timespec to_timespec(std::chrono::milliseconds ms) {
    return timespec{
        .tv_sec = static_cast<time_t>(ms.count() / 1000),
        .tv_nsec = static_cast<long>((ms.count() % 1000) * 1000000),
    };
}

} // namespace

TimerfdTimers::TimerfdTimers() {
    fds_.fill(-1);
}

TimerfdTimers::~TimerfdTimers() {
    for (int fd : fds_) {
        if (fd >= 0) ::close(fd);
    }
}

bool TimerfdTimers::init() {
    for (auto& fd : fds_) {
        fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
        if (fd < 0) {
            std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
            return false;
        }
    }
    return true;
}

void TimerfdTimers::arm(TimerKind kind, std::chrono::milliseconds delay, bool periodic) {
    itimerspec spec{};
    spec.it_value = to_timespec(delay);
    // An all-zero it_value disarms the timer, so fire "now" instead.
    if (spec.it_value.tv_sec == 0 && spec.it_value.tv_nsec == 0) spec.it_value.tv_nsec = 1;
    if (periodic) spec.it_interval = to_timespec(delay);

    if (timerfd_settime(fd(kind), 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}

void TimerfdTimers::cancel(TimerKind kind) {
    itimerspec spec{};
    if (timerfd_settime(fd(kind), 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}

std::optional<TimerKind> TimerfdTimers::kind_for_fd(int fd) const {
    for (size_t i = 0; i < fds_.size(); i++) {
        if (fds_[i] == fd) return static_cast<TimerKind>(i);
    }
    return std::nullopt;
}

uint64_t TimerfdTimers::consume(TimerKind kind) {
    uint64_t expirations = 0;
    if (::read(fd(kind), &expirations, sizeof(expirations)) != sizeof(expirations)) {
        return 0;
    }
    return expirations;
}
