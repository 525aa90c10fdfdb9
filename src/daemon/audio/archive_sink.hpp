#pragma once

#include "audio/audio_segmenter.hpp"

#include <expected>
#include <string>

class ArchiveSink {
public:
    virtual ~ArchiveSink() = default;
    virtual std::expected<void, std::string>
        store(const std::string& session_id, const AudioSegment& segment) = 0;
};
