#pragma once

#include "session.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Process-wide map from session id to Session. get_or_create is the only way
// in; concurrent callers for one id converge on a single instance. Detached
// sessions finish tearing down on their own threads and are joined by reap().
class SessionRegistry {
public:
    using Factory = std::function<std::expected<std::shared_ptr<Session>, std::string>(
        const std::string& id, const std::string& codec)>;

    explicit SessionRegistry(Factory factory);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Returns the live session for id, creating it if absent or already ended.
    // The codec only applies to a newly created session.
    std::expected<std::shared_ptr<Session>, std::string>
        get_or_create(const std::string& id, const std::string& codec);

    std::shared_ptr<Session> find(const std::string& id) const;

    // Detaches the session and asks it to flush and close. False if unknown.
    bool remove(const std::string& id, CloseReason reason = CloseReason::Explicit);

    // Detaches sessions that ended on their own and joins finished workers.
    size_t reap();

    // Closes every session idle for longer than stale_after. Returns the ids.
    std::vector<std::string> sweep(std::chrono::steady_clock::time_point now,
                                   std::chrono::milliseconds stale_after);

    // Closes and joins everything.
    void close_all(CloseReason reason = CloseReason::Shutdown);

    std::vector<SessionStatus> snapshot() const;
    size_t size() const;

private:
    void retire_locked(std::map<std::string, std::shared_ptr<Session>>::iterator it,
                       CloseReason reason);

    Factory factory_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::vector<std::shared_ptr<Session>> retiring_;
};
