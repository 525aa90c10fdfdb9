#include "platform/linux/pipewire_capture.hpp"

#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(RingBuffer& ring, uint32_t sample_rate, uint16_t channels,
                                 std::string target)
    : ring_(ring), sample_rate_(sample_rate), channels_(channels), target_(std::move(target)) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

std::string PipeWireCapture::error() const {
    std::lock_guard lock(error_mutex_);
    return error_;
}

bool PipeWireCapture::fail(const char* what, int res) {
    if (res < 0) {
        std::println(stderr, "microphone: {}: {}", what, spa_strerror(res));
    } else {
        std::println(stderr, "microphone: {}", what);
    }
    release();
    return false;
}

void PipeWireCapture::release() {
    if (loop_) pw_thread_loop_stop(loop_);
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

bool PipeWireCapture::start() {
    if (is_capturing()) return true;
    {
        std::lock_guard lock(error_mutex_);
        error_.clear();
    }

    loop_ = pw_thread_loop_new("streamscribe-mic", nullptr);
    if (!loop_) return fail("failed to create thread loop", 0);

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_APP_NAME, "streamscribe",
        PW_KEY_NODE_NAME, "streamscribe-microphone",
        nullptr);
    if (!target_.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, target_.c_str());
    }

    stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop_), "streamscribe-microphone",
                                   props, &stream_events_, this);
    if (!stream_) return fail("failed to create stream", 0);

    // Ask for exactly what sessions consume so nothing downstream resamples.
    uint8_t pod[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(pod, sizeof(pod));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = channels_);
    const spa_pod* params[] = {spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info)};

    auto flags = static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT |
                                              PW_STREAM_FLAG_MAP_BUFFERS |
                                              PW_STREAM_FLAG_RT_PROCESS);
    if (int res = pw_stream_connect(stream_, PW_DIRECTION_INPUT, PW_ID_ANY, flags, params, 1);
        res < 0) {
        return fail("stream connect failed", res);
    }

    // The ring is only reset while no producer is running.
    ring_.reset();
    frames_.store(0, std::memory_order_relaxed);
    capturing_.store(true, std::memory_order_release);

    if (int res = pw_thread_loop_start(loop_); res < 0) {
        capturing_.store(false, std::memory_order_release);
        return fail("thread loop start failed", res);
    }

    std::println(stderr, "microphone: capturing {} Hz, {} ch{}", sample_rate_, channels_,
                 target_.empty() ? "" : " from " + target_);
    return true;
}

void PipeWireCapture::stop() {
    if (!capturing_.exchange(false, std::memory_order_acq_rel)) return;
    release();
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    const auto& d = buf->buffer->datas[0];
    if (d.data && self->capturing_.load(std::memory_order_relaxed)) {
        // Whole frames only, so channels never swap places in the ring.
        size_t frame_bytes = sizeof(int16_t) * self->channels_;
        size_t frames = d.chunk->size / frame_bytes;
        auto* samples = reinterpret_cast<const int16_t*>(static_cast<const uint8_t*>(d.data) +
                                                         d.chunk->offset);
        self->ring_.write({samples, frames * self->channels_});
        self->frames_.fetch_add(frames, std::memory_order_relaxed);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (state != PW_STREAM_STATE_ERROR) return;

    std::println(stderr, "microphone: stream {} -> {}: {}", pw_stream_state_as_string(old),
                 pw_stream_state_as_string(state), error ? error : "unknown error");
    std::lock_guard lock(self->error_mutex_);
    self->error_ = error ? error : "stream error";
}
