#include "session_registry.hpp"

#include <iterator>

SessionRegistry::SessionRegistry(Factory factory) : factory_(std::move(factory)) {}

SessionRegistry::~SessionRegistry() {
    close_all();
}

std::expected<std::shared_ptr<Session>, std::string>
SessionRegistry::get_or_create(const std::string& id, const std::string& codec) {
    if (id.empty()) {
        return std::unexpected("empty session id");
    }

    std::lock_guard lock(mutex_);

    auto it = sessions_.find(id);
    if (it != sessions_.end()) {
        if (!it->second->ended() && !it->second->closing()) return it->second;
        // Ended but not yet reaped: make room for a fresh session.
        retiring_.push_back(std::move(it->second));
        sessions_.erase(it);
    }

    auto created = factory_(id, codec);
    if (!created) return std::unexpected(created.error());

    sessions_.emplace(id, *created);
    return *created;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

void SessionRegistry::retire_locked(std::map<std::string, std::shared_ptr<Session>>::iterator it,
                                    CloseReason reason) {
    it->second->request_close(reason);
    retiring_.push_back(std::move(it->second));
    sessions_.erase(it);
}

bool SessionRegistry::remove(const std::string& id, CloseReason reason) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    retire_locked(it, reason);
    return true;
}

size_t SessionRegistry::reap() {
    std::vector<std::shared_ptr<Session>> finished;
    {
        std::lock_guard lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->ended()) {
                retiring_.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
        std::erase_if(retiring_, [&finished](std::shared_ptr<Session>& s) {
            if (!s->ended()) return false;
            finished.push_back(std::move(s));
            return true;
        });
    }

    // Outside the lock: an ended worker may still be inside its ended hook.
    for (auto& s : finished) s->join();
    return finished.size();
}

std::vector<std::string> SessionRegistry::sweep(std::chrono::steady_clock::time_point now,
                                                std::chrono::milliseconds stale_after) {
    std::vector<std::string> evicted;
    std::lock_guard lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        auto idle = now - it->second->last_activity();
        if (idle > stale_after) {
            evicted.push_back(it->first);
            auto next = std::next(it);
            retire_locked(it, CloseReason::Stale);
            it = next;
        } else {
            ++it;
        }
    }
    return evicted;
}

void SessionRegistry::close_all(CloseReason reason) {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, s] : sessions_) {
            s->request_close(reason);
            all.push_back(std::move(s));
        }
        sessions_.clear();
        for (auto& s : retiring_) all.push_back(std::move(s));
        retiring_.clear();
    }
    for (auto& s : all) s->join();
}

std::vector<SessionStatus> SessionRegistry::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<SessionStatus> out;
    out.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_) out.push_back(s->status());
    return out;
}

size_t SessionRegistry::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}
