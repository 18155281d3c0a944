#pragma once

#include "launcher.h"
#include "mcp_client.h"
#include "types.h"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpforge {

// A running worker: one live process plus one connected client.
// Teardown order: client first (stdin EOF), then the process group.
struct Session {
    SessionId id;
    Language language{Language::JAVASCRIPT};
    std::string working_dir;
    std::unique_ptr<ChildProcess> process;
    std::unique_ptr<McpClient> client;

    SessionInfo info() const;
};

// Concurrency-safe session table. Holds shared_ptrs so callers can run
// protocol round-trips without holding the table lock. Only live entries are
// kept; ids are UUIDv4 from new_session_id(), so a removed id never comes back.
class SessionRegistry {
public:
    // Throws std::runtime_error on an empty or duplicate id.
    void insert(std::shared_ptr<Session> s);

    std::shared_ptr<Session> get(const SessionId& id) const;

    // Removes and returns the entry (nullptr if absent).
    std::shared_ptr<Session> take(const SessionId& id);

    // Removes and returns every entry.
    std::vector<std::shared_ptr<Session>> drain();

    std::vector<SessionId> ids() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<SessionId, std::shared_ptr<Session>> sessions_;
};

} // namespace mcpforge
