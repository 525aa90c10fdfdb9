#pragma once

#include <expected>
#include <string>

// Downstream analysis collaborator receiving each flushed block.
class TranscriptSink {
public:
    virtual ~TranscriptSink() = default;
    virtual std::expected<void, std::string>
        deliver(const std::string& session_id, const std::string& text) = 0;
};
