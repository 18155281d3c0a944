#include "mcpforge/build.h"
#include "mcpforge/errors.h"
#include "mcpforge/json_mini.h"
#include "mcpforge/log.h"
#include "mcpforge/proc.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

extern char** environ;

namespace fs = std::filesystem;

namespace mcpforge {

namespace {

constexpr const char* kDefaultPath = "/usr/local/bin:/usr/bin:/bin";

void write_file(const fs::path& p, const std::string& data) {
    std::ofstream f(p, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!f) {
        throw ForgeError(ErrorKind::BUILD_FAILED, "cannot write " + p.string());
    }
    f << data;
    f.close();
    if (!f) {
        throw ForgeError(ErrorKind::BUILD_FAILED, "cannot write " + p.string());
    }
}

std::string slurp(const std::string& path, bool* ok) {
    std::ifstream f(path);
    if (!f) {
        *ok = false;
        return {};
    }
    std::stringstream ss;
    ss << f.rdbuf();
    *ok = true;
    return ss.str();
}

ProcLimits build_limits(const ForgeConfig& cfg) {
    ProcLimits lim;
    lim.timeout_ms = cfg.build_timeout_ms;
    return lim;
}

// Excerpt reported with build/install failures. tsc reports on stdout.
std::string failure_excerpt(const ProcResult& r) {
    if (!r.error.empty()) return r.error;
    if (r.timed_out) return "timed out\n" + tail_excerpt(r.err.empty() ? r.out : r.err);
    return tail_excerpt(r.err.empty() ? r.out : r.err);
}

void log_output(const std::string& tag, const ProcResult& r) {
    if (!r.out.empty()) log_debug(tag, "stdout: " + tail_excerpt(r.out, 2048));
    if (!r.err.empty()) log_debug(tag, "stderr: " + tail_excerpt(r.err, 2048));
}

// ---- Node (TypeScript / JavaScript) ----

class NodeBackend : public LanguageBackend {
public:
    void install_dependencies(const std::string& wd,
                              const std::string& source,
                              const DependencyManifest& deps,
                              const ForgeConfig& cfg) const override {
        write_file(fs::path(wd) / "package.json",
                   node_package_json(deps, cfg.app_package_json, uses_esm_syntax(source)));

        std::vector<std::string> argv = {resolve_command_path(cfg.npm_bin), "install"};
        log_info("build", "npm install in " + wd);
        ProcResult r;
        if (!proc_run_capture(argv, wd, ProcEnv{}, build_limits(cfg), &r) || r.timed_out || r.exit_code != 0) {
            log_output("npm", r);
            throw ForgeError::dependency_install_failed("npm", r.exit_code, failure_excerpt(r));
        }
        log_output("npm", r);
    }

    void link_shared(const std::string& wd,
                     const std::string& source,
                     const ForgeConfig& cfg) const override {
        std::error_code ec;
        fs::create_directory_symlink(cfg.shared_node_modules, fs::path(wd) / "node_modules", ec);
        if (ec) {
            log_warn("build", "cannot link " + cfg.shared_node_modules + " into " + wd + ": " + ec.message());
        } else {
            log_debug("build", "linked shared node_modules into " + wd);
        }
        if (uses_esm_syntax(source)) {
            write_file(fs::path(wd) / "package.json",
                       "{\"name\":\"mcp-dynamic-server\",\"version\":\"1.0.0\",\"type\":\"module\"}\n");
        }
    }

    BuildArtifact artifact(const std::string& wd, const ForgeConfig& cfg) const override {
        BuildArtifact a;
        a.working_dir = wd;
        a.entry_path = (fs::path(wd) / "index.js").string();
        a.launch.command = resolve_command_path(cfg.node_bin);
        a.launch.args = {a.entry_path};
        a.launch.cwd = wd;
        a.launch.env = base_launch_env(cfg);
        return a;
    }
};

class JavaScriptBackend final : public NodeBackend {
public:
    Language language() const override { return Language::JAVASCRIPT; }
    const char* source_file() const override { return "index.js"; }
};

class TypeScriptBackend final : public NodeBackend {
public:
    Language language() const override { return Language::TYPESCRIPT; }
    const char* source_file() const override { return "index.ts"; }

    void compile(const std::string& wd, const ForgeConfig& cfg) const override {
        std::string src = (fs::path(wd) / source_file()).string();
        std::vector<std::string> argv = {
            resolve_command_path(cfg.npx_bin), "tsc",
            "--allowJs", src,
            "--outDir", wd,
            "--target", "ES2020",
            "--module", "NodeNext",
            "--moduleResolution", "NodeNext",
            "--esModuleInterop",
            "--skipLibCheck",
            "--resolveJsonModule",
        };

        // tsc comes from the shared pre-installed set.
        ProcEnv env;
        const char* path = std::getenv("PATH");
        env["PATH"] = (fs::path(cfg.shared_node_modules) / ".bin").string() + ":" +
                      ((path && *path) ? std::string(path) : std::string(kDefaultPath));
        env["NODE_PATH"] = cfg.shared_node_modules;

        log_info("build", "compiling " + src);
        ProcResult r;
        if (!proc_run_capture(argv, wd, env, build_limits(cfg), &r) || r.timed_out || r.exit_code != 0) {
            log_output("tsc", r);
            throw ForgeError::build_failed(r.exit_code, failure_excerpt(r));
        }
        log_output("tsc", r);
    }
};

// ---- Python ----

class PythonBackend final : public LanguageBackend {
public:
    Language language() const override { return Language::PYTHON; }
    const char* source_file() const override { return "server.py"; }

    void install_dependencies(const std::string& wd,
                              const std::string&,
                              const DependencyManifest& deps,
                              const ForgeConfig& cfg) const override {
        write_file(fs::path(wd) / "requirements.txt", python_requirements(deps));

        std::vector<std::string> argv = {
            resolve_command_path(cfg.pip_bin), "install",
            "-r", "requirements.txt",
            "--target", (fs::path(wd) / "site-packages").string(),
        };
        log_info("build", "pip install in " + wd);
        ProcResult r;
        if (!proc_run_capture(argv, wd, ProcEnv{}, build_limits(cfg), &r) || r.timed_out || r.exit_code != 0) {
            log_output("pip", r);
            throw ForgeError::dependency_install_failed("pip", r.exit_code, failure_excerpt(r));
        }
        log_output("pip", r);
    }

    void link_shared(const std::string&, const std::string&, const ForgeConfig&) const override {
        // the interpreter's own site-packages
    }

    BuildArtifact artifact(const std::string& wd, const ForgeConfig& cfg) const override {
        BuildArtifact a;
        a.working_dir = wd;
        a.entry_path = (fs::path(wd) / source_file()).string();
        a.launch.command = resolve_command_path(cfg.python_bin);
        a.launch.args = {a.entry_path};
        a.launch.cwd = wd;
        a.launch.env = base_launch_env(cfg);
        a.launch.env["PYTHONUNBUFFERED"] = "1";

        std::error_code ec;
        fs::path site = fs::path(wd) / "site-packages";
        if (fs::is_directory(site, ec)) {
            auto it = a.launch.env.find("PYTHONPATH");
            std::string prev = (it != a.launch.env.end()) ? it->second : std::string();
            a.launch.env["PYTHONPATH"] = prev.empty() ? site.string() : site.string() + ":" + prev;
        }
        return a;
    }
};

} // namespace

void LanguageBackend::compile(const std::string&, const ForgeConfig&) const {}

std::unique_ptr<LanguageBackend> make_backend(Language lang) {
    switch (lang) {
        case Language::TYPESCRIPT: return std::make_unique<TypeScriptBackend>();
        case Language::JAVASCRIPT: return std::make_unique<JavaScriptBackend>();
        case Language::PYTHON:     return std::make_unique<PythonBackend>();
    }
    throw ForgeError::unsupported_language(std::to_string((int)lang));
}

std::map<std::string, std::string> base_launch_env(const ForgeConfig& cfg) {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        size_t eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    auto it = env.find("PATH");
    if (it == env.end() || it->second.empty()) env["PATH"] = kDefaultPath;
    env["NODE_PATH"] = cfg.shared_node_modules;
    return env;
}

bool uses_esm_syntax(const std::string& source) {
    std::istringstream in(source);
    std::string line;
    bool in_comment = false;
    while (std::getline(in, line)) {
        size_t i = line.find_first_not_of(" \t\r");
        if (i == std::string::npos) continue;
        if (in_comment) {
            size_t end = line.find("*/", i);
            if (end == std::string::npos) continue;
            in_comment = false;
            i = line.find_first_not_of(" \t\r", end + 2);
            if (i == std::string::npos) continue;
        }
        if (line.compare(i, 2, "/*") == 0) {
            if (line.find("*/", i + 2) == std::string::npos) in_comment = true;
            continue;
        }
        if (line.compare(i, 2, "//") == 0) continue;

        for (const char* kw : {"import", "export"}) {
            size_t n = std::char_traits<char>::length(kw);
            if (line.compare(i, n, kw) != 0 || i + n >= line.size()) continue;
            char next = line[i + n];
            // import(...) is a dynamic import and works from CommonJS too.
            if (next == ' ' || next == '\t' || next == '{' || next == '*' || next == '"' || next == '\'') {
                return true;
            }
        }
    }
    return false;
}

std::string node_package_json(const DependencyManifest& deps, const std::string& app_package_json, bool esm) {
    json_mini::Doc pkg(json_object_new_object());
    json_object_object_add(pkg.root, "name", json_object_new_string("mcp-dynamic-server"));
    json_object_object_add(pkg.root, "version", json_object_new_string("1.0.0"));
    if (esm) json_object_object_add(pkg.root, "type", json_object_new_string("module"));
    json_object* dj = json_object_new_object();
    json_object_object_add(pkg.root, "dependencies", dj);

    bool ok = false;
    std::string app = slurp(app_package_json, &ok);
    if (!ok) {
        log_debug("build", "no application package.json at " + app_package_json);
    } else {
        json_mini::Doc ad = json_mini::parse(app);
        json_object* app_deps = json_mini::get(ad.root, "dependencies");
        if (!json_mini::is_object(app_deps)) {
            log_warn("build", "application package.json has no usable dependencies: " + app_package_json);
        } else {
            json_object_object_foreach(app_deps, key, val) {
                std::string k(key);
                if ((k.rfind("@modelcontextprotocol", 0) == 0 || k == "mcp") &&
                    val && json_object_is_type(val, json_type_string)) {
                    json_object_object_add(dj, key, json_object_new_string(json_object_get_string(val)));
                }
            }
        }
    }

    for (const auto& kv : deps) {
        json_object_object_add(dj, kv.first.c_str(), json_object_new_string(kv.second.c_str()));
    }
    return std::string(json_object_to_json_string_ext(pkg.root, JSON_C_TO_STRING_PRETTY)) + "\n";
}

std::string python_requirements(const DependencyManifest& deps) {
    std::string out;
    bool first = true;
    for (const auto& kv : deps) {
        if (!first) out += "\n";
        out += kv.first + kv.second;
        first = false;
    }
    return out;
}

// ---- BuildPipeline ----

BuildPipeline::BuildPipeline(ForgeConfig cfg) : cfg_(std::move(cfg)) {
    std::error_code ec;
    fs::create_directories(cfg_.servers_dir, ec);
    if (ec) {
        log_warn("build", "cannot create servers dir " + cfg_.servers_dir + ": " + ec.message());
        return;
    }
    fs::permissions(cfg_.servers_dir, fs::perms::all, fs::perm_options::replace, ec);
    log_debug("build", "servers dir " + cfg_.servers_dir);
}

std::string BuildPipeline::working_dir_for(const SessionId& id) const {
    return (fs::path(cfg_.servers_dir) / id).string();
}

void BuildPipeline::remove_working_dir(const std::string& wd) const {
    if (wd.empty()) return;
    std::error_code ec;
    fs::remove_all(wd, ec);
    if (ec) {
        log_warn("cleanup", std::string(error_kind_name(ErrorKind::INTERNAL_CLEANUP_ERROR)) +
                 ": cannot remove " + wd + ": " + ec.message());
    }
}

BuildArtifact BuildPipeline::build(const SessionId& id,
                                   const std::string& source,
                                   Language lang,
                                   const DependencyManifest* deps) {
    std::unique_ptr<LanguageBackend> backend = make_backend(lang);
    std::string wd = working_dir_for(id);

    std::error_code ec;
    fs::create_directories(wd, ec);
    if (ec) {
        throw ForgeError(ErrorKind::BUILD_FAILED, "cannot create working directory " + wd + ": " + ec.message());
    }
    fs::permissions(wd, fs::perms::all, fs::perm_options::replace, ec);

    try {
        if (deps && !deps->empty()) {
            backend->install_dependencies(wd, source, *deps, cfg_);
        } else {
            backend->link_shared(wd, source, cfg_);
        }

        write_file(fs::path(wd) / backend->source_file(), source);
        backend->compile(wd, cfg_);

        BuildArtifact a = backend->artifact(wd, cfg_);
        log_info("build", std::string(language_name(lang)) + " worker ready in " + wd);
        return a;
    } catch (const std::exception& e) {
        log_error("build", std::string(language_name(lang)) + " build failed: " + e.what());
        remove_working_dir(wd);
        throw;
    }
}

} // namespace mcpforge
