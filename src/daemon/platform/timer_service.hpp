#pragma once

#include <chrono>
#include <cstddef>

enum class TimerKind { KeepAlive, Inactivity, FlushDwell, Backoff };

inline constexpr size_t kTimerKindCount = 4;

// Per-session one-shot or periodic timers. Arming a timer replaces any pending
// expiry of the same kind.
class TimerService {
public:
    virtual ~TimerService() = default;
    virtual void arm(TimerKind kind, std::chrono::milliseconds delay, bool periodic = false) = 0;
    virtual void cancel(TimerKind kind) = 0;
};
