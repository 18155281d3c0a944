#pragma once

#include "config.h"
#include "types.h"

#include <map>
#include <memory>
#include <string>

namespace mcpforge {

struct BuildArtifact {
    std::string working_dir;
    std::string entry_path;   // file the launch command runs
    LaunchSpec launch;
};

// Per-language build strategy. One instance per language, stateless.
class LanguageBackend {
public:
    virtual ~LanguageBackend() = default;

    virtual Language language() const = 0;

    // File name the submitted source is written to.
    virtual const char* source_file() const = 0;

    // Writes the manifest file and runs the package manager.
    // Throws ForgeError(DEPENDENCY_INSTALL_FAILED).
    virtual void install_dependencies(const std::string& wd,
                                      const std::string& source,
                                      const DependencyManifest& deps,
                                      const ForgeConfig& cfg) const = 0;

    // Fast path when no manifest was supplied. Failures are logged, never thrown.
    virtual void link_shared(const std::string& wd,
                             const std::string& source,
                             const ForgeConfig& cfg) const = 0;

    // Throws ForgeError(BUILD_FAILED). Default: nothing to compile.
    virtual void compile(const std::string& wd, const ForgeConfig& cfg) const;

    virtual BuildArtifact artifact(const std::string& wd, const ForgeConfig& cfg) const = 0;
};

std::unique_ptr<LanguageBackend> make_backend(Language lang);

// Supervisor environment + PATH default + NODE_PATH, the base of every launch env.
std::map<std::string, std::string> base_launch_env(const ForgeConfig& cfg);

// True when the source has a top-level import/export statement. Node only
// loads such a file from a package marked "type":"module"; everything else
// stays CommonJS so require() keeps working.
bool uses_esm_syntax(const std::string& source);

// Contents of the package.json written for a Node worker with dependencies:
// MCP SDK entries from the application package.json first, caller entries win.
std::string node_package_json(const DependencyManifest& deps,
                              const std::string& app_package_json,
                              bool esm);

// One "name+constraint" per line.
std::string python_requirements(const DependencyManifest& deps);

// Allocates the working directory, writes the source, installs or links
// dependencies, compiles and resolves the launch triple. On any failure the
// working directory is removed before the error propagates.
class BuildPipeline {
public:
    explicit BuildPipeline(ForgeConfig cfg);

    BuildArtifact build(const SessionId& id,
                        const std::string& source,
                        Language lang,
                        const DependencyManifest* deps);

    std::string working_dir_for(const SessionId& id) const;

    // Best-effort recursive removal; failures are logged as cleanup errors.
    void remove_working_dir(const std::string& wd) const;

    const ForgeConfig& config() const { return cfg_; }

private:
    ForgeConfig cfg_;
};

} // namespace mcpforge
