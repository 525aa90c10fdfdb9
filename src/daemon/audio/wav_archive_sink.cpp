#include "audio/wav_archive_sink.hpp"
#include "wav.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <string_view>

namespace fs = std::filesystem;

WavArchiveSink::WavArchiveSink(std::string root_dir) : root_(std::move(root_dir)) {}

std::string WavArchiveSink::sanitize(const std::string& session_id) {
    std::string out = session_id;
    for (auto& c : out) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        if (!ok) c = '_';
    }
    // Keep "." and ".." from escaping the archive root.
    if (out.empty() || out == "." || out == "..") out = "_" + out;
    return out;
}

std::string WavArchiveSink::segment_path(const std::string& session_id, uint64_t index) const {
    return (fs::path(root_) / sanitize(session_id) / std::format("segment_{:06}.wav", index))
        .string();
}

uint64_t WavArchiveSink::scan_next_index(const std::string& dir_name) const {
    constexpr std::string_view prefix = "segment_";
    constexpr std::string_view suffix = ".wav";

    uint64_t next = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(fs::path(root_) / dir_name, ec)) {
        std::string name = entry.path().filename().string();
        if (name.size() <= prefix.size() + suffix.size() || !name.starts_with(prefix) ||
            !name.ends_with(suffix)) {
            continue;
        }
        const char* first = name.data() + prefix.size();
        const char* last = name.data() + name.size() - suffix.size();
        uint64_t index = 0;
        auto [ptr, err] = std::from_chars(first, last, index);
        if (err == std::errc{} && ptr == last) next = std::max(next, index + 1);
    }
    return next;
}

uint64_t WavArchiveSink::reserve_index(const std::string& dir_name, uint64_t wanted) {
    std::lock_guard lock(mutex_);
    auto it = next_index_.find(dir_name);
    if (it == next_index_.end()) {
        it = next_index_.emplace(dir_name, scan_next_index(dir_name)).first;
    }
    uint64_t index = std::max(wanted, it->second);
    it->second = index + 1;
    return index;
}

std::expected<void, std::string>
WavArchiveSink::store(const std::string& session_id, const AudioSegment& segment) {
    if (segment.samples.empty()) {
        return std::unexpected("empty segment");
    }

    uint64_t index = reserve_index(sanitize(session_id), segment.index);
    fs::path path = segment_path(session_id, index);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return std::unexpected(std::format("mkdir {}: {}", path.parent_path().string(),
                                           ec.message()));
    }

    auto data = wav::encode(segment.samples, segment.sample_rate, segment.channels);

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path.string());
    }
    f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!f) {
        return std::unexpected("write failed: " + path.string());
    }
    return {};
}
