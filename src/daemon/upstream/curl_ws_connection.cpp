#include "upstream/curl_ws_connection.hpp"

#include <format>
#include <poll.h>
#include <print>

namespace {

constexpr size_t kRecvChunk = 16 * 1024;
constexpr int kSendStallMs = 2000;

const char* flag(bool b) { return b ? "true" : "false"; }

std::string escape(CURL* curl, const std::string& s) {
    char* out = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
    if (!out) return s;
    std::string r(out);
    curl_free(out);
    return r;
}

} // namespace

std::string build_listen_url(const Config::Provider& p, const Config::Audio& a) {
    CURL* curl = curl_easy_init();
    std::string model = curl ? escape(curl, p.model) : p.model;
    std::string language = curl ? escape(curl, p.language) : p.language;
    if (curl) curl_easy_cleanup(curl);

    char sep = p.url.find('?') == std::string::npos ? '?' : '&';
    return std::format(
        "{}{}encoding=linear16&sample_rate={}&channels={}&model={}&language={}"
        "&smart_format={}&punctuate={}&diarize={}&interim_results={}"
        "&utterance_end_ms={}&endpointing={}",
        p.url, sep, a.sample_rate, a.channels, model, language,
        flag(p.smart_format), flag(p.punctuate), flag(p.diarize), flag(p.interim_results),
        p.utterance_end_ms, p.endpointing_ms);
}

CurlWsConnection::CurlWsConnection(std::string url, std::string api_key, std::string label)
    : url_(std::move(url)), api_key_(std::move(api_key)), label_(std::move(label)) {}

CurlWsConnection::~CurlWsConnection() {
    close();
}

bool CurlWsConnection::open(std::chrono::milliseconds timeout) {
    if (curl_) release();
    state_ = ConnectionState::Connecting;

    curl_ = curl_easy_init();
    if (!curl_) {
        fail("curl_easy_init failed");
        return false;
    }

    if (!api_key_.empty()) {
        auto auth = "Authorization: Token " + api_key_;
        headers_ = curl_slist_append(headers_, auth.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        fail(std::string("connect: ") + curl_easy_strerror(res));
        return false;
    }

    if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock_) != CURLE_OK ||
        sock_ == CURL_SOCKET_BAD) {
        fail("no active socket after handshake");
        return false;
    }

    state_ = ConnectionState::Open;
    last_io_ = std::chrono::steady_clock::now();
    return true;
}

bool CurlWsConnection::wait_writable(int timeout_ms) {
    pollfd pfd{.fd = static_cast<int>(sock_), .events = POLLOUT, .revents = 0};
    return ::poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLOUT);
}

std::expected<void, std::string>
CurlWsConnection::send_frame(const void* data, size_t len, unsigned flags) {
    if (state_ != ConnectionState::Open) {
        return std::unexpected(std::format("not open ({})", to_string(state_)));
    }

    auto* p = static_cast<const char*>(data);
    size_t off = 0;
    do {
        size_t sent = 0;
        CURLcode res = curl_ws_send(curl_, p + off, len - off, &sent, 0, flags);
        if (res == CURLE_AGAIN) {
            if (!wait_writable(kSendStallMs)) {
                fail("send stalled");
                return std::unexpected("send stalled");
            }
            continue;
        }
        if (res != CURLE_OK) {
            std::string why = std::string("send: ") + curl_easy_strerror(res);
            fail(why);
            return std::unexpected(why);
        }
        off += sent;
    } while (off < len);

    last_io_ = std::chrono::steady_clock::now();
    return {};
}

std::expected<void, std::string> CurlWsConnection::send_audio(std::span<const int16_t> pcm) {
    return send_frame(pcm.data(), pcm.size_bytes(), CURLWS_BINARY);
}

std::expected<void, std::string> CurlWsConnection::send_keepalive() {
    static constexpr std::string_view msg = R"({"type":"KeepAlive"})";
    return send_frame(msg.data(), msg.size(), CURLWS_TEXT);
}

std::expected<std::vector<std::string>, std::string> CurlWsConnection::receive() {
    std::vector<std::string> messages;
    if (state_ != ConnectionState::Open) {
        return std::unexpected(std::format("not open ({})", to_string(state_)));
    }

    char buf[kRecvChunk];
    for (;;) {
        size_t n = 0;
        curl_ws_frame* meta = nullptr;
        CURLcode res = curl_ws_recv(curl_, buf, sizeof(buf), &n, &meta);
        if (res == CURLE_AGAIN) break;
        if (res != CURLE_OK) {
            std::string why = std::string("recv: ") + curl_easy_strerror(res);
            fail(why);
            return std::unexpected(why);
        }
        last_io_ = std::chrono::steady_clock::now();
        if (!meta) continue;

        if (meta->flags & CURLWS_CLOSE) {
            fail("closed by provider");
            return std::unexpected("closed by provider");
        }
        if (!(meta->flags & CURLWS_TEXT)) continue;

        partial_.append(buf, n);
        if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
            messages.push_back(std::move(partial_));
            partial_.clear();
        }
    }
    return messages;
}

void CurlWsConnection::close() {
    if (state_ == ConnectionState::Open) {
        static constexpr std::string_view msg = R"({"type":"CloseStream"})";
        if (auto r = send_frame(msg.data(), msg.size(), CURLWS_TEXT); r) {
            size_t sent = 0;
            curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
        }
    }
    release();
    if (state_ != ConnectionState::Failed) state_ = ConnectionState::Closed;
}

void CurlWsConnection::fail(const std::string& why) {
    std::println(stderr, "upstream {}: {}", label_, why);
    release();
    state_ = ConnectionState::Failed;
}

void CurlWsConnection::release() {
    if (curl_) { curl_easy_cleanup(curl_); curl_ = nullptr; }
    if (headers_) { curl_slist_free_all(headers_); headers_ = nullptr; }
    sock_ = CURL_SOCKET_BAD;
    partial_.clear();
}
