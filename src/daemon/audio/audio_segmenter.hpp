#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

struct AudioSegment {
    uint64_t index = 0;
    std::vector<int16_t> samples;
    uint32_t sample_rate = 0;
    uint16_t channels = 1;
};

// Cuts the decoded stream into fixed-length segments for archival. Pacing only:
// the provider-bound stream is forwarded independently and never waits on this.
class AudioSegmenter {
public:
    using SegmentHandler = std::function<void(AudioSegment)>;

    AudioSegmenter(uint32_t sample_rate, uint16_t channels,
                   std::chrono::milliseconds segment_length, SegmentHandler on_segment);

    // May emit zero or more segments.
    void push(std::span<const int16_t> pcm);

    // Emits whatever is buffered as a final short segment.
    void finish();

    size_t buffered_samples() const { return pending_.size(); }
    uint64_t segments_emitted() const { return next_index_; }
    size_t target_samples() const { return target_samples_; }

private:
    void emit();

    uint32_t sample_rate_;
    uint16_t channels_;
    size_t target_samples_;
    SegmentHandler on_segment_;
    std::vector<int16_t> pending_;
    uint64_t next_index_ = 0;
};
