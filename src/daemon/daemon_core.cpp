#include "daemon_core.hpp"

#include "audio/frame_decoder.hpp"
#include "audio/wav_archive_sink.hpp"
#include "base64.hpp"
#include "downstream/http_analysis_sink.hpp"
#include "platform/platform_paths.hpp"

#include <cstring>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

constexpr const char* kDefaultMicSession = "microphone";

json error(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

json to_json(const SessionStatus& s) {
    return {
        {"session_id", s.id},
        {"codec", s.codec},
        {"state", to_string(s.state)},
        {"attempts", s.attempts},
        {"packets", s.packets},
        {"decode_errors", s.decode_errors},
        {"fragments", s.fragments},
        {"flushes", s.flushes},
        {"idle_seconds", s.idle_seconds},
        {"age_seconds", s.age_seconds},
    };
}

std::string data_path(const std::string& configured, const std::string& leaf) {
    if (!configured.empty()) return configured;
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/" + leaf;
    return "/tmp/streamscribe/" + leaf;
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       RingBuffer& mic_ring, AudioCapture& mic,
                       UpstreamFactory upstream_factory, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      mic_ring_(mic_ring), mic_(mic),
      upstream_factory_(std::move(upstream_factory)),
      notify_(std::move(notify)),
      registry_([this](const std::string& id, const std::string& codec) {
          return create_session(id, codec);
      }) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init() {
    if (config_.store.enabled) {
        auto db_path = data_path(config_.store.path, "transcripts.db");
        store_open_ = store_.open(db_path);
        if (store_open_) {
            int purged = store_.purge_expired();
            if (purged > 0) log(std::format("Purged {} expired transcripts", purged));
        } else {
            std::println(stderr, "Warning: transcript store failed to open, history disabled");
        }
    }

    if (!sink_ && config_.downstream.enabled) {
        sink_ = std::make_unique<HttpAnalysisSink>(config_.downstream.url,
                                                   config_.downstream.timeout_ms);
    }

    if (config_.archive.enabled) {
        auto dir = data_path(config_.archive.dir, "archive");
        archive_ = std::make_unique<WavArchiveSink>(dir);
        log("Archiving audio segments to " + dir);
    }

    if (config_.provider.api_key.empty()) {
        std::println(stderr, "Warning: no provider API key (set provider.api_key or DEEPGRAM_API_KEY)");
    }

    dispatcher_ = std::make_unique<TranscriptDispatcher>(
        store_open_ ? &store_ : nullptr, sink_.get(), config_.store.retention_days, verbose_);
    dispatcher_->start();
    return true;
}

std::expected<std::shared_ptr<Session>, std::string>
DaemonCore::create_session(const std::string& id, const std::string& codec) {
    const auto& name = codec.empty() ? config_.audio.codec : codec;
    size_t header = name == "opus" ? config_.audio.header_bytes : 0;

    auto decoder = make_frame_decoder(name, config_.audio.sample_rate, config_.audio.channels,
                                      header);
    if (!decoder) return std::unexpected(decoder.error());

    auto session = std::make_shared<Session>(
        id, config_, std::move(*decoder),
        Session::Hooks{
            .connections = [this, id] { return upstream_factory_(id); },
            .archive = archive_.get(),
            .on_flush = [this](const std::string& sid, const std::string& text) {
                if (dispatcher_) dispatcher_->submit(sid, text);
            },
            .on_ended = [this](const std::string&) {
                if (notify_) notify_();
            },
        },
        verbose_);

    if (!session->start()) {
        return std::unexpected("failed to start session worker");
    }
    std::println(stderr, "session {}: created ({})", id, name);
    return session;
}

std::expected<std::shared_ptr<Session>, std::string>
DaemonCore::session_for(const std::string& id, const std::string& codec) {
    auto session = registry_.get_or_create(id, codec);
    if (!session) return session;

    auto active = (*session)->status().codec;
    if (!codec.empty() && active != codec) {
        return std::unexpected(std::format("session {} uses codec {}", id, active));
    }
    return session;
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    try {
        if (cmd_str == "audio") return handle_audio(cmd);
        if (cmd_str == "connect") return handle_connect(cmd);
        if (cmd_str == "flush") return handle_flush(cmd);
        if (cmd_str == "disconnect") return handle_disconnect(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "history") return handle_history(cmd);
        if (cmd_str == "listen") return handle_listen(cmd);
        if (cmd_str == "stop") return handle_stop(cmd);
    } catch (const json::exception& e) {
        // Wrongly typed fields, e.g. a numeric session_id
        return error(std::string("bad command: ") + e.what());
    }
    return error("unknown command");
}

json DaemonCore::handle_audio(const json& cmd) {
    auto id = cmd.value("session_id", "");
    if (id.empty()) return error("missing session_id");

    auto data = cmd.value("data", "");
    auto packet = base64::decode(data);
    if (!packet || packet->empty()) return error("invalid audio data");

    auto session = session_for(id, cmd.value("codec", ""));
    if (!session) return error(session.error());

    (*session)->post_audio(std::move(*packet));
    return {{"status", "ok"}};
}

json DaemonCore::handle_connect(const json& cmd) {
    auto id = cmd.value("session_id", "");
    if (id.empty()) return error("missing session_id");

    auto session = session_for(id, cmd.value("codec", ""));
    if (!session) return error(session.error());

    (*session)->post_connect();
    return {{"status", "ok"}, {"session_id", id}};
}

json DaemonCore::handle_flush(const json& cmd) {
    auto id = cmd.value("session_id", "");
    auto session = registry_.find(id);
    if (!session) return error("unknown session");

    session->post_flush();
    return {{"status", "ok"}};
}

json DaemonCore::handle_disconnect(const json& cmd) {
    auto id = cmd.value("session_id", "");
    if (!registry_.remove(id, CloseReason::Explicit)) return error("unknown session");

    if (id == mic_session_) {
        mic_.stop();
        mic_session_.clear();
    }
    log("Session " + id + " disconnected");
    return {{"status", "ok"}};
}

json DaemonCore::handle_status(const json& cmd) {
    auto id = cmd.value("session_id", "");
    if (!id.empty()) {
        auto session = registry_.find(id);
        if (!session) return error("unknown session");
        auto resp = to_json(session->status());
        resp["status"] = "ok";
        return resp;
    }

    json sessions = json::array();
    for (const auto& s : registry_.snapshot()) sessions.push_back(to_json(s));

    json resp = {
        {"status", "ok"},
        {"sessions", std::move(sessions)},
        {"microphone", {{"listening", microphone_active()}, {"session_id", mic_session_}}},
    };
    if (auto mic_error = mic_.error(); !mic_error.empty()) {
        resp["microphone"]["error"] = mic_error;
    }
    if (dispatcher_) {
        resp["dispatched"] = dispatcher_->delivered();
        resp["dispatch_failures"] = dispatcher_->failed();
    }
    return resp;
}

json DaemonCore::handle_history(const json& cmd) {
    if (!store_open_) return error("transcript store disabled");

    int limit = cmd.value("limit", 10);
    auto records = store_.recent(limit, cmd.value("session_id", ""));

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& r : records) {
        resp["entries"].push_back({
            {"id", r.id},
            {"session_id", r.session_id},
            {"text", r.text},
            {"created_at", r.created_at},
            {"expires_at", r.expires_at},
        });
    }
    return resp;
}

json DaemonCore::handle_listen(const json& cmd) {
    if (microphone_active()) return error("already listening");

    auto id = cmd.value("session_id", kDefaultMicSession);
    auto session = session_for(id, "pcm16");
    if (!session) return error(session.error());

    if (!mic_.start()) {
        registry_.remove(id, CloseReason::Explicit);
        return error("failed to start microphone capture");
    }

    mic_session_ = id;
    (*session)->post_connect();
    log("Listening on microphone into session " + id);
    return {{"status", "ok"}, {"session_id", id}};
}

json DaemonCore::handle_stop(const json& /*cmd*/) {
    if (!microphone_active()) return error("not listening");

    mic_.stop();
    forward_microphone(config_.audio.sample_rate * config_.audio.channels / 50, true);

    auto id = std::move(mic_session_);
    mic_session_.clear();
    registry_.remove(id, CloseReason::Explicit);
    log("Stopped listening, session " + id + " closing");
    return {{"status", "ok"}, {"session_id", id}};
}

void DaemonCore::pump_microphone() {
    if (!microphone_active()) return;
    forward_microphone(config_.audio.sample_rate * config_.audio.channels / 50, false);
}

void DaemonCore::forward_microphone(size_t packet_samples, bool flush_tail) {
    if (size_t dropped = mic_ring_.take_dropped(); dropped > 0) {
        std::println(stderr, "audio: microphone ring overflow, {} samples dropped", dropped);
    }

    while (mic_ring_.available() >= packet_samples ||
           (flush_tail && mic_ring_.available() > 0)) {
        mic_scratch_.clear();
        mic_ring_.drain(mic_scratch_, packet_samples);

        // Ended sessions are replaced on the next packet.
        auto session = registry_.get_or_create(mic_session_, "pcm16");
        if (!session) {
            std::println(stderr, "audio: microphone session unavailable: {}", session.error());
            return;
        }

        std::vector<uint8_t> packet(mic_scratch_.size() * sizeof(int16_t));
        std::memcpy(packet.data(), mic_scratch_.data(), packet.size());
        (*session)->post_audio(std::move(packet));
    }
}

void DaemonCore::on_sessions_changed() {
    size_t reaped = registry_.reap();
    if (reaped > 0) log(std::format("Reaped {} ended session(s)", reaped));
}

void DaemonCore::health_sweep(std::chrono::steady_clock::time_point now) {
    auto evicted = registry_.sweep(now, std::chrono::milliseconds(config_.health.stale_after_ms));
    for (const auto& id : evicted) {
        std::println(stderr, "session {}: stale, evicting", id);
        if (id == mic_session_) {
            mic_.stop();
            mic_session_.clear();
        }
    }
}

void DaemonCore::shutdown() {
    if (microphone_active()) {
        mic_.stop();
        mic_session_.clear();
    }

    registry_.close_all(CloseReason::Shutdown);

    if (dispatcher_) {
        log("Delivering pending transcripts...");
        dispatcher_->stop();
    }
    store_.close();
    store_open_ = false;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[streamscribe] {}", msg);
    }
}
