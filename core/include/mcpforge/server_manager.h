#pragma once

#include "build.h"
#include "config.h"
#include "cpq.h"
#include "log.h"
#include "registry.h"
#include "types.h"

#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpforge {

// Lifecycle controller: owns the session registry and orchestrates
// build -> launch -> handshake, and every teardown path.
//
// All public operations are safe to call concurrently. Core failures are
// thrown as ForgeError; partial resources are released before the throw.
class ServerManager {
public:
    explicit ServerManager(ForgeConfig cfg);
    ~ServerManager();
    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    // language is the wire name ("typescript" / "javascript" / "python").
    SessionId create(const std::string& source, const std::string& language,
                     const DependencyManifest* deps = nullptr);
    SessionId create(const std::string& source, Language lang,
                     const DependencyManifest* deps = nullptr);

    std::vector<ToolDescriptor> list_tools(const SessionId& id);

    // Raw result object of the worker.
    std::string invoke(const SessionId& id, const std::string& tool, const std::string& args_json);

    // Tears the old session down and creates a new one in the same language.
    // The old id is invalid afterwards; the returned id replaces it.
    SessionId update(const SessionId& id, const std::string& new_source);

    void remove(const SessionId& id);

    std::vector<SessionId> list() const;

    // Tears down every session; the registry is empty on return.
    void shutdown_all();

    std::optional<SessionInfo> describe(const SessionId& id) const;

    const ForgeConfig& config() const { return cfg_; }

private:
    struct ExitEvent {
        SessionId id;
        int exit_code{-1};
    };

    void reaper_loop();
    void teardown(const std::shared_ptr<Session>& s, const char* reason);
    std::shared_ptr<Session> require(const SessionId& id) const;

    ForgeConfig cfg_;
    BuildPipeline pipeline_;
    SessionRegistry registry_;
    EventLog events_;

    ConcurrentPriorityQueue<ExitEvent> exits_;
    std::thread reaper_;
};

} // namespace mcpforge
