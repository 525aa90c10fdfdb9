#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Line-delimited JSON connection to the daemon's control socket.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    virtual bool recv(nlohmann::json& response, int timeout_ms = 30000) = 0;
    virtual void close() = 0;

    // One command, one response. False if either direction failed.
    bool request(const nlohmann::json& cmd, nlohmann::json& response, int timeout_ms = 30000) {
        return send(cmd) && recv(response, timeout_ms);
    }
};
