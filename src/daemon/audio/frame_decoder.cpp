#include "audio/frame_decoder.hpp"

#include <cstring>
#include <format>
#include <opus/opus.h>
#include <print>

OpusFrameDecoder::OpusFrameDecoder(uint32_t sample_rate, uint16_t channels, size_t header_bytes)
    : sample_rate_(sample_rate), channels_(channels), header_bytes_(header_bytes),
      // Opus frames are at most 120 ms.
      max_frame_samples_(static_cast<int>(sample_rate * 120 / 1000)) {}

OpusFrameDecoder::~OpusFrameDecoder() {
    if (decoder_) opus_decoder_destroy(decoder_);
}

bool OpusFrameDecoder::init() {
    int err = OPUS_OK;
    decoder_ = opus_decoder_create(static_cast<opus_int32>(sample_rate_), channels_, &err);
    if (err != OPUS_OK || !decoder_) {
        std::println(stderr, "decoder: opus_decoder_create({} Hz, {} ch) failed: {}",
                     sample_rate_, channels_, opus_strerror(err));
        decoder_ = nullptr;
        return false;
    }
    return true;
}

std::expected<std::vector<int16_t>, std::string>
OpusFrameDecoder::decode(std::span<const uint8_t> packet) {
    if (!decoder_) {
        return std::unexpected("decoder not initialised");
    }
    if (packet.size() <= header_bytes_) {
        return std::unexpected(std::format("short packet ({} bytes)", packet.size()));
    }

    auto payload = packet.subspan(header_bytes_);
    std::vector<int16_t> pcm(static_cast<size_t>(max_frame_samples_) * channels_);

    int n = opus_decode(decoder_, payload.data(), static_cast<opus_int32>(payload.size()),
                        pcm.data(), max_frame_samples_, 0);
    if (n < 0) {
        if (++consecutive_errors_ >= kMaxConsecutiveErrors) {
            std::println(stderr, "decoder: {} consecutive opus errors, resetting codec state",
                         consecutive_errors_);
            reset();
        }
        return std::unexpected(std::string("opus: ") + opus_strerror(n));
    }

    consecutive_errors_ = 0;
    pcm.resize(static_cast<size_t>(n) * channels_);
    return pcm;
}

void OpusFrameDecoder::reset() {
    if (decoder_) opus_decoder_ctl(decoder_, OPUS_RESET_STATE);
    consecutive_errors_ = 0;
}

std::expected<std::vector<int16_t>, std::string>
Pcm16FrameDecoder::decode(std::span<const uint8_t> packet) {
    size_t frame_bytes = sizeof(int16_t) * channels_;
    if (packet.empty() || packet.size() % frame_bytes != 0) {
        return std::unexpected(std::format("pcm16 packet of {} bytes is not whole frames",
                                           packet.size()));
    }
    std::vector<int16_t> pcm(packet.size() / sizeof(int16_t));
    std::memcpy(pcm.data(), packet.data(), packet.size());
    return pcm;
}

std::expected<std::unique_ptr<FrameDecoder>, std::string>
make_frame_decoder(const std::string& codec, uint32_t sample_rate, uint16_t channels,
                   size_t header_bytes) {
    if (codec == "pcm16") {
        return std::make_unique<Pcm16FrameDecoder>(channels);
    }
    if (codec == "opus") {
        auto dec = std::make_unique<OpusFrameDecoder>(sample_rate, channels, header_bytes);
        if (!dec->init()) {
            return std::unexpected("opus decoder initialisation failed");
        }
        return dec;
    }
    return std::unexpected("unknown codec: " + codec);
}
