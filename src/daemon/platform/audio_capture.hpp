#pragma once

#include <string>

// Local microphone feeding the daemon's sample ring.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;

    // Set when the stream failed after start(); cleared by the next start().
    virtual std::string error() const { return {}; }
};
