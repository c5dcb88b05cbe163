#pragma once

#include <stash/result.hpp>
#include <stash/config.hpp>
#include <stash/header.hpp>
#include <stash/inventory.hpp>
#include <stash/process.hpp>
#include <stash/store.hpp>
#include <string>
#include <vector>

namespace stash {

struct RunRequest {
    std::string name;
    std::string path;           // cached script file handed to the runner
    DependencyHeader header;
    bool repaired = false;      // header was added before running
};

// Hands cached scripts to an external runner ("uv run" by default) which
// reads the metadata header to provision dependencies.
class ScriptRunner {
public:
    ScriptRunner(Inventory& inventory, LocalStore& local, RunnerConfig config,
                 HeaderDefaults defaults = {});

    // Make sure the body is cached and carries a well-formed header
    Result<RunRequest> prepare(const std::string& name, bool refresh = false);

    // Runner command, script path, then args exactly as given
    std::vector<std::string> command_line(const RunRequest& request,
                                          const std::vector<std::string>& args) const;

    // Output captured
    Result<CommandResult> run(const RunRequest& request, const std::vector<std::string>& args);

    // Terminal attached; returns the script's exit code. Both forms stop
    // the script after the configured timeout.
    Result<int> run_attached(const RunRequest& request, const std::vector<std::string>& args);

private:
    Inventory& inventory_;
    LocalStore& local_;
    RunnerConfig config_;
    HeaderDefaults defaults_;
};

} // namespace stash
