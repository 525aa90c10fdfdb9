#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

enum class ConnectionState { Connecting, Open, Closed, Failed };

// One streaming socket to the STT provider. Single-owner, single-use: once
// Closed or Failed a connection is discarded and a fresh one is opened.
class UpstreamConnection {
public:
    virtual ~UpstreamConnection() = default;

    // Blocks until the handshake completes or the timeout expires.
    virtual bool open(std::chrono::milliseconds timeout) = 0;

    virtual std::expected<void, std::string> send_audio(std::span<const int16_t> pcm) = 0;
    virtual std::expected<void, std::string> send_keepalive() = 0;

    // Drains every complete text message currently readable. An error means the
    // socket failed or the peer closed it.
    virtual std::expected<std::vector<std::string>, std::string> receive() = 0;

    // Graceful close; safe to call in any state.
    virtual void close() = 0;

    // Pollable descriptor while Open, -1 otherwise.
    virtual int fd() const = 0;
    virtual ConnectionState state() const = 0;
    virtual std::chrono::steady_clock::time_point last_io() const = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<UpstreamConnection>()>;

inline const char* to_string(ConnectionState s) {
    switch (s) {
    case ConnectionState::Connecting: return "connecting";
    case ConnectionState::Open: return "open";
    case ConnectionState::Closed: return "closed";
    case ConnectionState::Failed: return "failed";
    }
    return "unknown";
}
