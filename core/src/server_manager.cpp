#include "mcpforge/server_manager.h"
#include "mcpforge/errors.h"
#include "mcpforge/ids.h"
#include "mcpforge/serialization.h"

namespace mcpforge {

namespace {

std::string short_id(const SessionId& id) {
    return id.substr(0, 8);
}

} // namespace

ServerManager::ServerManager(ForgeConfig cfg)
    : cfg_(std::move(cfg)),
      pipeline_(cfg_),
      events_(cfg_.event_log_path) {
    reaper_ = std::thread([this] { reaper_loop(); });
}

ServerManager::~ServerManager() {
    shutdown_all();
    exits_.shutdown();
    if (reaper_.joinable()) reaper_.join();
}

// ---- create ----

SessionId ServerManager::create(const std::string& source, const std::string& language,
                                const DependencyManifest* deps) {
    auto lang = parse_language(language);
    if (!lang) throw ForgeError::unsupported_language(language);
    return create(source, *lang, deps);
}

SessionId ServerManager::create(const std::string& source, Language lang,
                                const DependencyManifest* deps) {
    SessionId id = new_session_id();
    const std::string tag = "worker " + short_id(id);
    log_info("manager", "creating " + std::string(language_name(lang)) + " server " + id);

    BuildArtifact art;
    try {
        art = pipeline_.build(id, source, lang, deps);
    } catch (const ForgeError& e) {
        events_.event("create_failed", "{\"id\":" + json_quote(id) + ",\"stage\":\"build\",\"error\":" +
                      json_quote(e.what()) + "}");
        throw;
    }

    auto s = std::make_shared<Session>();
    s->id = id;
    s->language = lang;
    s->working_dir = art.working_dir;

    try {
        s->process = ChildProcess::spawn(art.launch, [this, id](int code) {
            if (!exits_.push(0, ExitEvent{id, code})) {
                log_debug("manager", "exit of " + id + " after shutdown");
            }
        }, tag);

        McpClient::Options opt;
        opt.handshake_timeout_ms = cfg_.handshake_timeout_ms;
        opt.request_timeout_ms = cfg_.request_timeout_ms;
        opt.client_name = cfg_.client_name;
        opt.client_version = cfg_.client_version;
        opt.log_tag = tag;
        int to_child = s->process->take_stdin_fd();
        int from_child = s->process->take_stdout_fd();
        s->client = std::make_unique<McpClient>(to_child, from_child, opt);
        s->client->connect();

        registry_.insert(s);
    } catch (const std::exception& e) {
        log_error("manager", "create " + id + " failed: " + e.what());
        events_.event("create_failed", "{\"id\":" + json_quote(id) + ",\"stage\":\"launch\",\"error\":" +
                      json_quote(e.what()) + "}");
        teardown(s, "create failed");
        throw;
    }

    // The worker may have died between handshake and insert; its exit event
    // then found no entry, so apply it here.
    if (s->process->exited()) {
        if (auto dead = registry_.take(id)) teardown(dead, "exited");
        events_.event("create_failed", "{\"id\":" + json_quote(id) + ",\"stage\":\"handshake\",\"error\":\"exited\"}");
        throw ForgeError::handshake_failed("worker exited right after the handshake");
    }

    log_info("manager", "server " + id + " running (pid " + std::to_string(s->process->pid()) + ")");
    events_.event("session_created", "{\"id\":" + json_quote(id) + ",\"language\":" +
                  json_quote(language_name(lang)) + ",\"pid\":" + std::to_string(s->process->pid()) + "}");
    return id;
}

// ---- queries ----

std::shared_ptr<Session> ServerManager::require(const SessionId& id) const {
    auto s = registry_.get(id);
    if (!s) throw ForgeError::not_found(id);
    return s;
}

std::vector<ToolDescriptor> ServerManager::list_tools(const SessionId& id) {
    auto s = require(id);
    return s->client->list_tools();
}

std::string ServerManager::invoke(const SessionId& id, const std::string& tool, const std::string& args_json) {
    auto s = require(id);
    log_debug("manager", "invoke " + tool + " on " + id);
    return s->client->call_tool(tool, args_json);
}

std::vector<SessionId> ServerManager::list() const {
    return registry_.ids();
}

std::optional<SessionInfo> ServerManager::describe(const SessionId& id) const {
    auto s = registry_.get(id);
    if (!s) return std::nullopt;
    return s->info();
}

// ---- teardown paths ----

SessionId ServerManager::update(const SessionId& id, const std::string& new_source) {
    auto s = registry_.take(id);
    if (!s) throw ForgeError::not_found(id);
    Language lang = s->language;

    teardown(s, "updated");
    events_.event("session_removed", "{\"id\":" + json_quote(id) + ",\"reason\":\"update\"}");

    SessionId new_id = create(new_source, lang, nullptr);
    log_info("manager", "server " + id + " replaced by " + new_id);
    return new_id;
}

void ServerManager::remove(const SessionId& id) {
    auto s = registry_.take(id);
    if (!s) throw ForgeError::not_found(id);
    teardown(s, "deleted");
    events_.event("session_removed", "{\"id\":" + json_quote(id) + ",\"reason\":\"delete\"}");
}

void ServerManager::shutdown_all() {
    auto all = registry_.drain();
    if (all.empty()) return;
    log_info("manager", "shutting down " + std::to_string(all.size()) + " server(s)");
    for (const auto& s : all) {
        try {
            teardown(s, "shutdown");
            events_.event("session_removed", "{\"id\":" + json_quote(s->id) + ",\"reason\":\"shutdown\"}");
        } catch (const std::exception& e) {
            log_error("manager", "shutdown of " + s->id + " failed: " + e.what());
        }
    }
}

// Client first (stdin EOF lets a well-behaved worker exit on its own), then the
// process group, then the working directory.
void ServerManager::teardown(const std::shared_ptr<Session>& s, const char* reason) {
    if (!s) return;
    log_debug("manager", "tearing down " + s->id + " (" + reason + ")");

    if (s->client) s->client->close();
    if (s->process) {
        s->process->terminate(cfg_.terminate_grace_ms);
        if (!s->process->wait_for_exit(cfg_.terminate_grace_ms + 5000)) {
            log_warn("cleanup", std::string(error_kind_name(ErrorKind::INTERNAL_CLEANUP_ERROR)) +
                     ": pid " + std::to_string(s->process->pid()) + " not reaped");
        } else {
            log_debug("manager", "server " + s->id + " stopped with code " +
                      std::to_string(s->process->exit_code()));
        }
    }
    pipeline_.remove_working_dir(s->working_dir);
}

void ServerManager::reaper_loop() {
    ConcurrentPriorityQueue<ExitEvent>::Item item;
    while (exits_.pop(item)) {
        const ExitEvent& ev = item.value;
        auto s = registry_.take(ev.id);
        if (!s) continue;  // explicit teardown got there first

        log_warn("manager", "server " + ev.id + " exited with code " + std::to_string(ev.exit_code));
        try {
            teardown(s, "exited");
        } catch (const std::exception& e) {
            log_error("manager", "cleanup of " + ev.id + " failed: " + e.what());
        }
        events_.event("session_exited", "{\"id\":" + json_quote(ev.id) + ",\"exit_code\":" +
                      std::to_string(ev.exit_code) + "}");
    }
}

} // namespace mcpforge
