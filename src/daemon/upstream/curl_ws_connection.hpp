#pragma once

#include "config.hpp"
#include "upstream/upstream_connection.hpp"

#include <curl/curl.h>
#include <string>

// Deepgram-style live-listen socket on top of libcurl's WebSocket API
// (CURLOPT_CONNECT_ONLY=2 plus curl_ws_send/curl_ws_recv).
class CurlWsConnection : public UpstreamConnection {
public:
    CurlWsConnection(std::string url, std::string api_key, std::string label);
    ~CurlWsConnection() override;

    CurlWsConnection(const CurlWsConnection&) = delete;
    CurlWsConnection& operator=(const CurlWsConnection&) = delete;

    bool open(std::chrono::milliseconds timeout) override;
    std::expected<void, std::string> send_audio(std::span<const int16_t> pcm) override;
    std::expected<void, std::string> send_keepalive() override;
    std::expected<std::vector<std::string>, std::string> receive() override;
    void close() override;

    int fd() const override { return state_ == ConnectionState::Open ? static_cast<int>(sock_) : -1; }
    ConnectionState state() const override { return state_; }
    std::chrono::steady_clock::time_point last_io() const override { return last_io_; }

private:
    std::expected<void, std::string> send_frame(const void* data, size_t len, unsigned flags);
    bool wait_writable(int timeout_ms);
    void fail(const std::string& why);
    void release();

    std::string url_;
    std::string api_key_;
    std::string label_;

    CURL* curl_ = nullptr;
    curl_slist* headers_ = nullptr;
    curl_socket_t sock_ = CURL_SOCKET_BAD;
    ConnectionState state_ = ConnectionState::Connecting;
    std::chrono::steady_clock::time_point last_io_{};
    std::string partial_;
};

// Full listen URL: provider.url plus the encoding/model/diarization query.
std::string build_listen_url(const Config::Provider& provider, const Config::Audio& audio);
