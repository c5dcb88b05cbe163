#include <stash/runner.hpp>
#include <stash/log.hpp>

namespace stash {

ScriptRunner::ScriptRunner(Inventory& inventory, LocalStore& local, RunnerConfig config,
                           HeaderDefaults defaults)
    : inventory_(inventory), local_(local),
      config_(std::move(config)), defaults_(std::move(defaults)) {}

Result<RunRequest> ScriptRunner::prepare(const std::string& name, bool refresh) {
    auto body = inventory_.fetch_script(name, refresh);
    if (body.is_err()) return std::move(body).error();

    RunRequest req;
    req.name = name;
    req.path = local_.script_path(name);

    auto decoded = decode_header(body.value());
    if (!decoded.header) {
        if (decoded.malformed()) {
            log::warn("'%s': %s", name.c_str(), decoded.problem.c_str());
        }
        HeaderDefaults defaults = defaults_;
        auto entry = inventory_.lookup(name);
        if (entry.is_ok()) {
            defaults.description = entry.value().description;
            defaults.tags.assign(entry.value().tags.begin(), entry.value().tags.end());
        }
        std::string repaired = ensure_header(body.value(), defaults);
        STASH_TRY(local_.cache_script(name, repaired));
        decoded = decode_header(repaired);
        if (!decoded.header) {
            return StashError{StashError::Parse,
                "could not attach a metadata header to '" + name + "'",
                "edit " + req.path + " by hand"};
        }
        req.repaired = true;
        log::info("added a metadata header to '%s'", name.c_str());
    }

    req.header = std::move(*decoded.header);
    return Result<RunRequest>::ok(std::move(req));
}

std::vector<std::string> ScriptRunner::command_line(const RunRequest& request,
                                                    const std::vector<std::string>& args) const {
    std::vector<std::string> argv = config_.command;
    argv.push_back(request.path);
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

Result<CommandResult> ScriptRunner::run(const RunRequest& request,
                                        const std::vector<std::string>& args) {
    auto argv = command_line(request, args);
    log::debug("running '%s' with %zu args", request.name.c_str(), args.size());
    return run_command(argv, "", config_.timeout_seconds);
}

Result<int> ScriptRunner::run_attached(const RunRequest& request,
                                       const std::vector<std::string>& args) {
    auto argv = command_line(request, args);
    log::debug("running '%s' with %zu args", request.name.c_str(), args.size());
    return run_interactive(argv, "", config_.timeout_seconds);
}

} // namespace stash
