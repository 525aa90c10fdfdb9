#include "audio/audio_segmenter.hpp"

#include <algorithm>
#include <utility>

AudioSegmenter::AudioSegmenter(uint32_t sample_rate, uint16_t channels,
                               std::chrono::milliseconds segment_length,
                               SegmentHandler on_segment)
    : sample_rate_(sample_rate), channels_(channels),
      target_samples_(std::max<size_t>(
          1, static_cast<size_t>(sample_rate) * channels * segment_length.count() / 1000)),
      on_segment_(std::move(on_segment)) {
    pending_.reserve(target_samples_);
}

void AudioSegmenter::push(std::span<const int16_t> pcm) {
    while (!pcm.empty()) {
        size_t take = std::min(pcm.size(), target_samples_ - pending_.size());
        pending_.insert(pending_.end(), pcm.begin(), pcm.begin() + take);
        pcm = pcm.subspan(take);

        if (pending_.size() == target_samples_) {
            emit();
        }
    }
}

void AudioSegmenter::finish() {
    if (!pending_.empty()) emit();
}

void AudioSegmenter::emit() {
    AudioSegment seg{
        .index = next_index_++,
        .samples = std::move(pending_),
        .sample_rate = sample_rate_,
        .channels = channels_,
    };
    pending_ = {};
    pending_.reserve(target_samples_);
    if (on_segment_) on_segment_(std::move(seg));
}
