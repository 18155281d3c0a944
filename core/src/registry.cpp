#include "mcpforge/registry.h"

#include <stdexcept>

namespace mcpforge {

SessionInfo Session::info() const {
    SessionInfo si;
    si.id = id;
    si.language = language;
    si.working_dir = working_dir;
    si.pid = process ? process->pid() : -1;
    si.status = (process && !process->exited()) ? SessionStatus::RUNNING : SessionStatus::TERMINATED;
    return si;
}

void SessionRegistry::insert(std::shared_ptr<Session> s) {
    if (!s || s->id.empty()) throw std::runtime_error("registry: session without id");
    std::lock_guard<std::mutex> lk(mu_);
    auto res = sessions_.emplace(s->id, s);
    if (!res.second) {
        throw std::runtime_error("registry: duplicate id: " + s->id);
    }
}

std::shared_ptr<Session> SessionRegistry::get(const SessionId& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<Session> SessionRegistry::take(const SessionId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    std::shared_ptr<Session> s = std::move(it->second);
    sessions_.erase(it);
    return s;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::drain() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions_.size());
    for (auto& kv : sessions_) out.push_back(std::move(kv.second));
    sessions_.clear();
    return out;
}

std::vector<SessionId> SessionRegistry::ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<SessionId> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) out.push_back(kv.first);
    return out;
}

} // namespace mcpforge
