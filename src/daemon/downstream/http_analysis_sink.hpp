#pragma once

#include "downstream/transcript_sink.hpp"

#include <cstdint>
#include <string>

// POSTs {"text": ..., "sessionId": ...} as JSON; any non-2xx status is a failure.
class HttpAnalysisSink : public TranscriptSink {
public:
    HttpAnalysisSink(std::string url, uint32_t timeout_ms);

    std::expected<void, std::string>
        deliver(const std::string& session_id, const std::string& text) override;

    const std::string& url() const { return url_; }

private:
    std::string url_;
    uint32_t timeout_ms_;
};
