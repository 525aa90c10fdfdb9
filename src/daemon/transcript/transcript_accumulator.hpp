#pragma once

#include "config.hpp"
#include "platform/timer_service.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <string>

struct TranscriptFragment {
    std::string text;
    std::optional<int> speaker;
    bool is_final = false;
    std::chrono::steady_clock::time_point arrived = std::chrono::steady_clock::now();
};

enum class AcceptResult { Appended, Duplicate, Interim, Empty };

// Buffers final fragments into one speaker-annotated block per session.
// Consecutive same-speaker fragments are joined with a space; a speaker change
// starts a new line with a "Speaker <n>: " label. Near-duplicates of recently
// accepted fragments are dropped. The block is released through the flush
// handler after the dwell timeout, on explicit flush, or at teardown.
class TranscriptAccumulator {
public:
    using FlushHandler = std::function<void(const std::string& text)>;

    TranscriptAccumulator(const Config::Transcript& config, TimerService& timers,
                          FlushHandler on_flush);

    AcceptResult accept(const TranscriptFragment& fragment);

    // Returns the released block; empty (and no handler call) if nothing was buffered.
    std::string flush();

    void on_flush_timer() { flush(); }

    const std::string& text() const { return buffer_; }
    size_t fragment_count() const { return fragments_; }
    std::optional<int> last_speaker() const { return last_speaker_; }

private:
    bool is_duplicate(const std::string& normalized) const;

    Config::Transcript config_;
    TimerService& timers_;
    FlushHandler on_flush_;

    std::string buffer_;
    size_t fragments_ = 0;
    std::optional<int> last_speaker_;
    std::deque<std::string> recent_;
};
