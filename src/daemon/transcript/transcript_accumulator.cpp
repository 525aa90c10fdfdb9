#include "transcript/transcript_accumulator.hpp"

#include "transcript/similarity.hpp"

#include <format>

TranscriptAccumulator::TranscriptAccumulator(const Config::Transcript& config,
                                             TimerService& timers, FlushHandler on_flush)
    : config_(config), timers_(timers), on_flush_(std::move(on_flush)) {}

bool TranscriptAccumulator::is_duplicate(const std::string& normalized) const {
    for (const auto& prev : recent_) {
        if (similarity::dice(prev, normalized) > config_.duplicate_threshold) return true;
    }
    return false;
}

AcceptResult TranscriptAccumulator::accept(const TranscriptFragment& fragment) {
    if (!fragment.is_final) return AcceptResult::Interim;

    auto start = fragment.text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return AcceptResult::Empty;
    auto end = fragment.text.find_last_not_of(" \t\n\r");
    std::string text = fragment.text.substr(start, end - start + 1);

    auto normalized = similarity::normalize(text);
    if (is_duplicate(normalized)) return AcceptResult::Duplicate;

    if (fragment.speaker && fragment.speaker != last_speaker_) {
        if (!buffer_.empty()) buffer_ += '\n';
        buffer_ += std::format("Speaker {}: {}", *fragment.speaker, text);
        last_speaker_ = fragment.speaker;
    } else {
        if (!buffer_.empty()) buffer_ += ' ';
        buffer_ += text;
    }
    fragments_++;

    recent_.push_back(std::move(normalized));
    while (recent_.size() > config_.recent_window) recent_.pop_front();

    timers_.arm(TimerKind::FlushDwell, std::chrono::milliseconds(config_.flush_dwell_ms));
    return AcceptResult::Appended;
}

std::string TranscriptAccumulator::flush() {
    timers_.cancel(TimerKind::FlushDwell);
    if (buffer_.empty()) return {};

    std::string text = std::move(buffer_);
    buffer_.clear();
    fragments_ = 0;
    last_speaker_.reset();

    if (on_flush_) on_flush_(text);
    return text;
}
