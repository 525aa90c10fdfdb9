#pragma once

#include "platform/timer_service.hpp"

#include <array>
#include <cstdint>
#include <optional>

class TimerfdTimers : public TimerService {
public:
    TimerfdTimers();
    ~TimerfdTimers() override;

    TimerfdTimers(const TimerfdTimers&) = delete;
    TimerfdTimers& operator=(const TimerfdTimers&) = delete;

    bool init();

    void arm(TimerKind kind, std::chrono::milliseconds delay, bool periodic = false) override;
    void cancel(TimerKind kind) override;

    int fd(TimerKind kind) const { return fds_[static_cast<size_t>(kind)]; }
    std::optional<TimerKind> kind_for_fd(int fd) const;

    // Reads the expiration count; 0 if the timer was re-armed or cancelled
    // after it became readable.
    uint64_t consume(TimerKind kind);

private:
    std::array<int, kTimerKindCount> fds_;
};
