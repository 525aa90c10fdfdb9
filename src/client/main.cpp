#include "base64.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"
#include "wav.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>
#include <span>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace {

constexpr uint32_t kRawSampleRate = 16000;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  connect SESSION [--codec opus|pcm16]  Open a provider connection now");
    std::println(stderr, "  send SESSION FILE [--realtime]        Stream a WAV or raw s16le file");
    std::println(stderr, "  flush SESSION                         Release the buffered transcript");
    std::println(stderr, "  disconnect SESSION                    Flush, close and remove a session");
    std::println(stderr, "  status [SESSION]                      Show sessions");
    std::println(stderr, "  history [--limit N] [--session ID]    Show stored transcripts");
    std::println(stderr, "  listen [SESSION]                      Stream the local microphone");
    std::println(stderr, "  stop                                  Stop the microphone");
}

bool check(const json& response) {
    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return false;
    }
    return true;
}

void print_session(const json& s) {
    std::println("{:<20} {:<6} {:<10} packets={} fragments={} flushes={} idle={:.1f}s{}",
                 s.value("session_id", ""), s.value("codec", ""), s.value("state", ""),
                 s.value("packets", 0), s.value("fragments", 0), s.value("flushes", 0),
                 s.value("idle_seconds", 0.0),
                 s.value("attempts", 0) > 0
                     ? std::format(" attempts={}", s.value("attempts", 0))
                     : std::string());
}

int stream_file(UnixSocketClient& client, const std::string& session, const std::string& path,
                bool realtime) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        std::println(stderr, "Cannot open {}", path);
        return 1;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    wav::Pcm pcm;
    if (auto parsed = wav::parse(bytes)) {
        pcm = std::move(*parsed);
    } else if (bytes.size() >= 4 && std::memcmp(bytes.data(), "RIFF", 4) == 0) {
        std::println(stderr, "{}: only 16-bit PCM WAV files are supported", path);
        return 1;
    } else {
        // Headerless: little-endian s16 mono
        pcm.sample_rate = kRawSampleRate;
        pcm.channels = 1;
        pcm.samples.resize(bytes.size() / sizeof(int16_t));
        std::memcpy(pcm.samples.data(), bytes.data(), pcm.samples.size() * sizeof(int16_t));
    }

    if (pcm.samples.empty() || pcm.sample_rate < 50 || pcm.channels == 0) {
        std::println(stderr, "No audio in {}", path);
        return 1;
    }

    size_t packet_samples = static_cast<size_t>(pcm.sample_rate) * pcm.channels / 50;
    std::println(stderr, "Streaming {:.1f}s of {} Hz audio into {}",
                 static_cast<double>(pcm.samples.size()) / (pcm.sample_rate * pcm.channels),
                 pcm.sample_rate, session);

    auto next = std::chrono::steady_clock::now();
    for (size_t off = 0; off < pcm.samples.size(); off += packet_samples) {
        size_t n = std::min(packet_samples, pcm.samples.size() - off);
        std::span<const uint8_t> raw(reinterpret_cast<const uint8_t*>(pcm.samples.data() + off),
                                     n * sizeof(int16_t));

        json cmd = {
            {"cmd", "audio"},
            {"session_id", session},
            {"codec", "pcm16"},
            {"data", base64::encode(raw)},
        };
        json response;
        if (!client.request(cmd, response, 5000)) {
            std::println(stderr, "Lost connection to daemon");
            return 1;
        }
        if (!check(response)) return 1;

        if (realtime) {
            next += std::chrono::milliseconds(20);
            std::this_thread::sleep_until(next);
        }
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    std::string codec;
    std::string session_filter;
    bool realtime = false;
    int limit = 10;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--codec" && i + 1 < argc) {
            codec = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--session" && i + 1 < argc) {
            session_filter = argv[++i];
        } else if (arg == "--realtime") {
            realtime = true;
        } else {
            positional.push_back(arg);
        }
    }

    auto need = [&](size_t n) {
        if (positional.size() < n) {
            usage(argv[0]);
            std::exit(1);
        }
    };

    // Build command JSON
    json cmd;
    if (command == "connect") {
        need(1);
        cmd = {{"cmd", "connect"}, {"session_id", positional[0]}};
        if (!codec.empty()) cmd["codec"] = codec;
    } else if (command == "send") {
        need(2);
    } else if (command == "flush" || command == "disconnect") {
        need(1);
        cmd = {{"cmd", command}, {"session_id", positional[0]}};
    } else if (command == "status") {
        cmd = {{"cmd", "status"}};
        if (!positional.empty()) cmd["session_id"] = positional[0];
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
        if (!session_filter.empty()) cmd["session_id"] = session_filter;
    } else if (command == "listen") {
        cmd = {{"cmd", "listen"}};
        if (!positional.empty()) cmd["session_id"] = positional[0];
    } else if (command == "stop") {
        cmd = {{"cmd", "stop"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is streamscribe running?");
        return 1;
    }

    if (command == "send") {
        return stream_file(client, positional[0], positional[1], realtime);
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (!check(response)) return 1;

    // Display response
    if (command == "status") {
        if (response.contains("sessions")) {
            if (response["sessions"].empty()) std::println("No active sessions");
            for (auto& s : response["sessions"]) print_session(s);
            auto& mic = response["microphone"];
            if (mic.value("listening", false)) {
                std::println("Microphone: listening into {}", mic.value("session_id", ""));
            }
            if (mic.contains("error")) {
                std::println("Microphone error: {}", mic.value("error", ""));
            }
        } else {
            print_session(response);
        }
    } else if (command == "history") {
        for (auto& entry : response["entries"]) {
            std::println("[{}] {}", entry.value("created_at", ""), entry.value("session_id", ""));
            std::println("{}", entry.value("text", ""));
        }
    } else if (response.contains("session_id")) {
        std::println("OK ({})", response["session_id"].get<std::string>());
    } else {
        std::println("OK");
    }

    return 0;
}
