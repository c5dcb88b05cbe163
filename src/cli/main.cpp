// stash: keep a personal inventory of single-file scripts in sync across
// machines through a remote document store.
//
//     stash [--root DIR] [-v|-q] <command> [args]
//
// Run `stash help` for the command list.

#include <stash/config.hpp>
#include <stash/discovery.hpp>
#include <stash/http.hpp>
#include <stash/inventory.hpp>
#include <stash/log.hpp>
#include <stash/remote.hpp>
#include <stash/result.hpp>
#include <stash/runner.hpp>
#include <stash/store.hpp>
#include <stash/sync.hpp>

#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace stash;

static CancelToken g_cancel;

extern "C" void on_sigint(int) {
    g_cancel.cancel();
}

static const char* kUsage =
    "usage: stash [--root DIR] [-v|--verbose] [-q|--quiet] <command> [args]\n"
    "\n"
    "commands:\n"
    "  sync                      merge local and remote inventories, then push\n"
    "  pull                      adopt remote changes without writing remotely\n"
    "  push                      same as sync\n"
    "  list [--tag T]            show the local inventory\n"
    "  add NAME FILE|- [--tag T]... [--description D] [--force]\n"
    "                            add a script (or replace its body with --force)\n"
    "  remove NAME               drop a script locally and delete its document\n"
    "  publish NAME              upload a script body now\n"
    "  cat NAME [--refresh]      print a script body\n"
    "  run [--refresh] NAME [ARGS...]\n"
    "                            run a script; ARGS are passed through unchanged\n"
    "  discover                  look for the mapping record among your documents\n"
    "  adopt DOCUMENT_ID         use DOCUMENT_ID as the mapping record\n";

// ---------------------------------------------------------------------------
// Exit codes
// ---------------------------------------------------------------------------

static int exit_code_for(const StashError& err) {
    switch (err.code) {
        case StashError::AuthenticationFailed:  return 3;
        case StashError::CorruptLocalState:
        case StashError::CorruptRemoteState:    return 4;
        case StashError::SyncConflict:          return 5;
        case StashError::AmbiguousMapping:      return 6;
        case StashError::SyncAlreadyInProgress: return 7;
        case StashError::Cancelled:             return 130;
        case StashError::InvalidArg:            return 2;
        default:                                return 1;
    }
}

static int fail(const StashError& err) {
    std::cerr << err.format() << "\n";
    return exit_code_for(err);
}

// ---------------------------------------------------------------------------
// Application wiring
// ---------------------------------------------------------------------------

struct App {
    std::string root;
    Config config;
    LocalStore local;
    CurlTransport transport;
    GistClient remote;
    InventoryDiscovery discovery;
    Inventory inventory;

    App(std::string r, Config cfg, std::string token)
        : root(std::move(r)),
          config(std::move(cfg)),
          local(root),
          remote(transport, GistClientOptions{config.remote.api_url, std::move(token),
                                              config.remote.owner, 100,
                                              config.remote.timeout_seconds}),
          discovery(remote, local, RetryPolicy::from_config(config.sync), config.remote.owner),
          inventory(local, remote, InventoryOptions{RetryPolicy::from_config(config.sync),
                                                    config.remote.private_documents,
                                                    config.sync.lock_stale_seconds,
                                                    HeaderDefaults{}}) {}

    SyncEngine engine() {
        SyncEngineOptions opts;
        opts.retry = RetryPolicy::from_config(config.sync);
        opts.private_documents = config.remote.private_documents;
        opts.lock_stale_seconds = config.sync.lock_stale_seconds;
        opts.owner = config.remote.owner;
        return SyncEngine(local, remote, discovery, std::move(opts));
    }
};

static Result<std::string> read_input(const std::string& path) {
    if (path == "-") {
        std::string content((std::istreambuf_iterator<char>(std::cin)),
                            std::istreambuf_iterator<char>());
        return Result<std::string>::ok(std::move(content));
    }
    return read_file(path);
}

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static int cmd_sync(App& app, SyncMode mode) {
    auto report = app.engine().run(mode, g_cancel);
    if (!report.ok()) return fail(*report.error);

    if (!report.adopted_from_remote.empty()) {
        std::cout << "from remote: " << join(report.adopted_from_remote) << "\n";
    }
    if (!report.created_documents.empty()) {
        std::cout << "published:   " << join(report.created_documents) << "\n";
    }
    if (!report.updated_documents.empty()) {
        std::cout << "uploaded:    " << join(report.updated_documents) << "\n";
    }
    if (report.document_id.empty()) {
        std::cout << "no remote mapping record yet\n";
    } else {
        std::cout << "mapping " << report.document_id
                  << (report.mapping_written ? " updated" : " unchanged") << "\n";
    }
    return 0;
}

static int cmd_list(App& app, const std::vector<std::string>& args) {
    std::string tag;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--tag" && i + 1 < args.size()) {
            tag = args[++i];
        } else {
            return fail(StashError{StashError::InvalidArg, "unexpected argument '" + args[i] + "'"});
        }
    }

    auto entries = app.inventory.list();
    if (entries.is_err()) return fail(entries.error());

    for (const auto& e : entries.value()) {
        if (!tag.empty() && !e.tags.count(tag)) continue;
        std::cout << e.script_name;
        if (!e.is_published()) std::cout << "  (unpublished)";
        if (!e.description.empty()) std::cout << "  " << e.description;
        if (!e.tags.empty()) {
            std::cout << "  [" << join(std::vector<std::string>(e.tags.begin(), e.tags.end())) << "]";
        }
        std::cout << "\n";
    }
    return 0;
}

static int cmd_add(App& app, const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::set<std::string> tags;
    std::string description;
    bool force = false;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--tag" && i + 1 < args.size()) {
            tags.insert(args[++i]);
        } else if (args[i] == "--description" && i + 1 < args.size()) {
            description = args[++i];
        } else if (args[i] == "--force") {
            force = true;
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.size() != 2) {
        return fail(StashError{StashError::InvalidArg, "add takes NAME and FILE",
                               "use '-' to read the body from stdin"});
    }

    auto content = read_input(positional[1]);
    if (content.is_err()) return fail(content.error());

    const std::string& name = positional[0];
    if (force && app.inventory.lookup(name).is_ok()) {
        auto updated = app.inventory.update(name, content.value());
        if (updated.is_err()) return fail(updated.error());
        std::cout << "updated " << name << "\n";
        return 0;
    }

    auto added = app.inventory.add(name, content.value(), tags, description);
    if (added.is_err()) return fail(added.error());
    std::cout << "added " << name << " (publish with 'stash push')\n";
    return 0;
}

static int cmd_remove(App& app, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return fail(StashError{StashError::InvalidArg, "remove takes exactly one NAME"});
    }
    auto removed = app.inventory.remove(args[0]);
    if (removed.is_err()) return fail(removed.error());
    std::cout << "removed " << args[0] << "\n";
    return 0;
}

static int cmd_publish(App& app, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return fail(StashError{StashError::InvalidArg, "publish takes exactly one NAME"});
    }
    auto entry = app.inventory.publish(args[0]);
    if (entry.is_err()) return fail(entry.error());
    std::cout << args[0] << " -> " << entry.value().document_id << "\n";
    return 0;
}

static int cmd_cat(App& app, const std::vector<std::string>& args) {
    std::string name;
    bool refresh = false;
    for (const auto& a : args) {
        if (a == "--refresh") refresh = true;
        else name = a;
    }
    if (name.empty()) {
        return fail(StashError{StashError::InvalidArg, "cat takes a NAME"});
    }
    auto body = app.inventory.fetch_script(name, refresh);
    if (body.is_err()) return fail(body.error());
    std::cout << body.value();
    return 0;
}

static int cmd_run(App& app, const std::vector<std::string>& args) {
    size_t i = 0;
    bool refresh = false;
    if (i < args.size() && args[i] == "--refresh") {
        refresh = true;
        ++i;
    }
    if (i >= args.size()) {
        return fail(StashError{StashError::InvalidArg, "run takes a NAME"});
    }
    std::string name = args[i++];
    std::vector<std::string> script_args(args.begin() + static_cast<long>(i), args.end());

    ScriptRunner runner(app.inventory, app.local, app.config.runner);
    auto request = runner.prepare(name, refresh);
    if (request.is_err()) return fail(request.error());

    auto code = runner.run_attached(request.value(), script_args);
    if (code.is_err()) return fail(code.error());
    return code.value();
}

static int cmd_discover(App& app) {
    auto found = app.discovery.discover();
    if (found.is_err()) return fail(found.error());
    if (found.value().kind != DiscoveryResult::Found) {
        return fail(found.value().to_error());
    }
    std::cout << "adopted " << found.value().document_id << " ("
              << found.value().record.entries.size() << " entries)\n";
    return 0;
}

static int cmd_adopt(App& app, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return fail(StashError{StashError::InvalidArg, "adopt takes exactly one DOCUMENT_ID"});
    }
    auto adopted = app.discovery.adopt(args[0]);
    if (adopted.is_err()) return fail(adopted.error());
    std::cout << "adopted " << args[0] << " (" << adopted.value().record.entries.size()
              << " entries); run 'stash pull' to merge it\n";
    return 0;
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

static bool needs_token(const std::string& command) {
    return command == "sync" || command == "pull" || command == "push" ||
           command == "publish" || command == "discover" || command == "adopt";
}

int main(int argc, char** argv) {
    std::string root;
    int verbosity = 0;
    int i = 1;
    for (; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--root" && i + 1 < argc) {
            root = argv[++i];
        } else if (a == "-v" || a == "--verbose") {
            ++verbosity;
        } else if (a == "-q" || a == "--quiet") {
            --verbosity;
        } else {
            break;
        }
    }
    if (i >= argc || std::strcmp(argv[i], "help") == 0 || std::strcmp(argv[i], "--help") == 0) {
        std::cout << kUsage;
        return i >= argc ? 2 : 0;
    }

    std::string command = argv[i++];
    std::vector<std::string> args(argv + i, argv + argc);

    if (root.empty()) root = default_root();
    log::set_color_enabled(isatty(STDERR_FILENO) != 0);

    auto config = Config::effective(root);
    if (config.is_err()) return fail(config.error());

    auto level = log::parse_level(config.value().log.level);
    if (level.is_err()) return fail(level.error());
    int lvl = static_cast<int>(level.value()) - verbosity;
    if (lvl < log::Trace) lvl = log::Trace;
    if (lvl > log::Error) lvl = log::Error;
    log::set_level(static_cast<log::Level>(lvl));

    if (!config.value().log.file.empty()) {
        fs::path file(config.value().log.file);
        if (file.is_relative()) file = fs::path(root) / file;
        std::error_code ec;
        fs::create_directories(file.parent_path(), ec);
        auto opened = log::set_log_file(file.string());
        if (opened.is_err()) {
            log::warn("log file disabled: %s", opened.error().message.c_str());
        }
    }

    std::string token;
    auto tok = config.value().token();
    if (tok.is_ok()) {
        token = tok.value();
    } else if (needs_token(command)) {
        return fail(tok.error());
    } else {
        log::debug("%s", tok.error().message.c_str());
    }

    std::signal(SIGINT, on_sigint);

    App app(root, std::move(config).value(), std::move(token));

    int rc;
    if (command == "sync" || command == "push") rc = cmd_sync(app, SyncMode::Push);
    else if (command == "pull") rc = cmd_sync(app, SyncMode::Pull);
    else if (command == "list") rc = cmd_list(app, args);
    else if (command == "add") rc = cmd_add(app, args);
    else if (command == "remove") rc = cmd_remove(app, args);
    else if (command == "publish") rc = cmd_publish(app, args);
    else if (command == "cat") rc = cmd_cat(app, args);
    else if (command == "run") rc = cmd_run(app, args);
    else if (command == "discover") rc = cmd_discover(app);
    else if (command == "adopt") rc = cmd_adopt(app, args);
    else {
        std::cerr << kUsage;
        rc = fail(StashError{StashError::InvalidArg, "unknown command '" + command + "'"});
    }
    return rc;
}
