#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

// Raw PCM int16 <-> in-memory WAV files.
namespace wav {

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + 44, samples.data(), data_size);
    }

    return out;
}

struct Pcm {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
};

// Parses a 16-bit PCM WAV file, walking chunks until "data".
// Returns nullopt for anything that is not 16-bit linear PCM.
inline std::optional<Pcm> parse(std::span<const uint8_t> file) {
    auto r16 = [&file](size_t off) { uint16_t v; std::memcpy(&v, file.data() + off, 2); return v; };
    auto r32 = [&file](size_t off) { uint32_t v; std::memcpy(&v, file.data() + off, 4); return v; };
    auto tag = [&file](size_t off, const char* t) { return std::memcmp(file.data() + off, t, 4) == 0; };

    if (file.size() < 12 || !tag(0, "RIFF") || !tag(8, "WAVE")) return std::nullopt;

    Pcm pcm;
    bool have_fmt = false;
    size_t pos = 12;
    while (pos + 8 <= file.size()) {
        uint32_t chunk_size = r32(pos + 4);
        size_t body = pos + 8;
        if (body + chunk_size > file.size()) chunk_size = static_cast<uint32_t>(file.size() - body);

        if (tag(pos, "fmt ") && chunk_size >= 16) {
            if (r16(body) != 1 || r16(body + 14) != 16) return std::nullopt;
            pcm.channels = r16(body + 2);
            pcm.sample_rate = r32(body + 4);
            have_fmt = true;
        } else if (tag(pos, "data")) {
            if (!have_fmt) return std::nullopt;
            pcm.samples.resize(chunk_size / sizeof(int16_t));
            std::memcpy(pcm.samples.data(), file.data() + body, pcm.samples.size() * sizeof(int16_t));
            return pcm;
        }
        pos = body + chunk_size + (chunk_size & 1);
    }
    return std::nullopt;
}

} // namespace wav
