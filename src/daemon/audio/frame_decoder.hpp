#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct OpusDecoder;

// Turns one inbound packet into interleaved int16 PCM. Implementations keep
// codec state across packets; a failed packet leaves that state usable.
class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;
    virtual std::expected<std::vector<int16_t>, std::string>
        decode(std::span<const uint8_t> packet) = 0;
    virtual void reset() = 0;
    virtual std::string_view codec() const = 0;
};

class OpusFrameDecoder : public FrameDecoder {
public:
    OpusFrameDecoder(uint32_t sample_rate, uint16_t channels, size_t header_bytes);
    ~OpusFrameDecoder() override;

    OpusFrameDecoder(const OpusFrameDecoder&) = delete;
    OpusFrameDecoder& operator=(const OpusFrameDecoder&) = delete;

    // False if libopus rejected the sample rate / channel combination.
    bool init();

    std::expected<std::vector<int16_t>, std::string>
        decode(std::span<const uint8_t> packet) override;
    void reset() override;
    std::string_view codec() const override { return "opus"; }

    int consecutive_errors() const { return consecutive_errors_; }

    static constexpr int kMaxConsecutiveErrors = 5;

private:
    uint32_t sample_rate_;
    uint16_t channels_;
    size_t header_bytes_;
    int max_frame_samples_;
    int consecutive_errors_ = 0;
    OpusDecoder* decoder_ = nullptr;
};

// Little-endian s16 pass-through for sources that already send linear PCM.
class Pcm16FrameDecoder : public FrameDecoder {
public:
    explicit Pcm16FrameDecoder(uint16_t channels = 1) : channels_(channels) {}

    std::expected<std::vector<int16_t>, std::string>
        decode(std::span<const uint8_t> packet) override;
    void reset() override {}
    std::string_view codec() const override { return "pcm16"; }

private:
    uint16_t channels_;
};

std::expected<std::unique_ptr<FrameDecoder>, std::string>
make_frame_decoder(const std::string& codec, uint32_t sample_rate, uint16_t channels,
                   size_t header_bytes);
