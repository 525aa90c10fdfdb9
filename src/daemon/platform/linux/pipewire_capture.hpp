#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <pipewire/pipewire.h>
#include <string>

// PipeWire input stream writing interleaved S16 frames into a RingBuffer.
// The process callback runs on PipeWire's realtime thread and only touches
// the ring and the atomics.
class PipeWireCapture : public AudioCapture {
public:
    // An empty target lets the session manager pick the default source.
    PipeWireCapture(RingBuffer& ring, uint32_t sample_rate, uint16_t channels,
                    std::string target = {});
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_acquire); }
    std::string error() const override;

    uint64_t frames_captured() const { return frames_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    bool fail(const char* what, int res);
    void release();

    RingBuffer& ring_;
    uint32_t sample_rate_;
    uint16_t channels_;
    std::string target_;

    std::atomic<bool> capturing_{false};
    std::atomic<uint64_t> frames_{0};

    mutable std::mutex error_mutex_;
    std::string error_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
