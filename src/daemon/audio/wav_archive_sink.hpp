#pragma once

#include "audio/archive_sink.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

// Writes each segment to <root>/<session>/segment_<NNNNNN>.wav. File indexes
// only grow per session id, across Session instances and daemon restarts; an
// existing segment is never overwritten. Safe to share between session threads.
class WavArchiveSink : public ArchiveSink {
public:
    explicit WavArchiveSink(std::string root_dir);

    std::expected<void, std::string>
        store(const std::string& session_id, const AudioSegment& segment) override;

    // Session ids are opaque strings; anything outside [A-Za-z0-9._-] becomes '_'.
    static std::string sanitize(const std::string& session_id);

    std::string segment_path(const std::string& session_id, uint64_t index) const;

private:
    // The segment's own index, or the next free one for this id if that is taken.
    uint64_t reserve_index(const std::string& dir_name, uint64_t wanted);
    uint64_t scan_next_index(const std::string& dir_name) const;

    std::string root_;
    std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> next_index_;
};
