#include <stash/config.hpp>
#include <stash/log.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace stash {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Typed key readers
// ---------------------------------------------------------------------------

static StashError wrong_type(const std::string& key, const char* expected) {
    return StashError{StashError::Config,
        "config key '" + key + "' must be " + expected};
}

static Status read_string(const toml::table& tbl, const std::string& section,
                          const char* key, std::string& out,
                          std::unordered_set<std::string>& set) {
    auto node = tbl[key];
    if (!node) return ok_status();
    std::string dotted = section + "." + key;
    if (!node.is_string()) return wrong_type(dotted, "a string");
    out = std::string(*node.value<std::string>());
    set.insert(dotted);
    return ok_status();
}

static Status read_int(const toml::table& tbl, const std::string& section,
                       const char* key, int& out, int min_value,
                       std::unordered_set<std::string>& set) {
    auto node = tbl[key];
    if (!node) return ok_status();
    std::string dotted = section + "." + key;
    if (!node.is_integer()) return wrong_type(dotted, "an integer");
    int64_t v = *node.value<int64_t>();
    if (v < min_value || v > 86400000) {
        return StashError{StashError::Config,
            "config key '" + dotted + "' is out of range: " + std::to_string(v)};
    }
    out = static_cast<int>(v);
    set.insert(dotted);
    return ok_status();
}

static Status read_bool(const toml::table& tbl, const std::string& section,
                        const char* key, bool& out,
                        std::unordered_set<std::string>& set) {
    auto node = tbl[key];
    if (!node) return ok_status();
    std::string dotted = section + "." + key;
    if (!node.is_boolean()) return wrong_type(dotted, "a boolean");
    out = *node.value<bool>();
    set.insert(dotted);
    return ok_status();
}

static Status read_string_array(const toml::table& tbl, const std::string& section,
                                const char* key, std::vector<std::string>& out,
                                std::unordered_set<std::string>& set) {
    auto node = tbl[key];
    if (!node) return ok_status();
    std::string dotted = section + "." + key;
    auto arr = node.as_array();
    if (!arr) return wrong_type(dotted, "an array of strings");

    std::vector<std::string> values;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!elem.is_string() || !s) return wrong_type(dotted, "an array of strings");
        values.push_back(std::string(*s));
    }
    out = std::move(values);
    set.insert(dotted);
    return ok_status();
}

// ---------------------------------------------------------------------------
// Config::parse
// ---------------------------------------------------------------------------

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StashError{StashError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;
    auto& set = cfg.explicit_keys;

    // [remote] section
    if (auto remote = doc["remote"].as_table()) {
        STASH_TRY(read_string(*remote, "remote", "api-url", cfg.remote.api_url, set));
        STASH_TRY(read_string(*remote, "remote", "owner", cfg.remote.owner, set));
        STASH_TRY(read_string(*remote, "remote", "token-env", cfg.remote.token_env, set));
        STASH_TRY(read_int(*remote, "remote", "timeout", cfg.remote.timeout_seconds, 1, set));
        STASH_TRY(read_bool(*remote, "remote", "private", cfg.remote.private_documents, set));
    }

    // [sync] section
    if (auto sync = doc["sync"].as_table()) {
        STASH_TRY(read_int(*sync, "sync", "attempts", cfg.sync.attempts, 1, set));
        STASH_TRY(read_int(*sync, "sync", "backoff-ms", cfg.sync.backoff_ms, 0, set));
        STASH_TRY(read_int(*sync, "sync", "max-backoff-ms", cfg.sync.max_backoff_ms, 0, set));
        STASH_TRY(read_int(*sync, "sync", "lock-stale-seconds", cfg.sync.lock_stale_seconds, 1, set));
    }

    // [runner] section
    if (auto runner = doc["runner"].as_table()) {
        STASH_TRY(read_string_array(*runner, "runner", "command", cfg.runner.command, set));
        STASH_TRY(read_int(*runner, "runner", "timeout", cfg.runner.timeout_seconds, 0, set));
        if (cfg.runner.command.empty()) {
            return StashError{StashError::Config,
                "config key 'runner.command' cannot be empty"};
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        STASH_TRY(read_string(*lg, "log", "level", cfg.log.level, set));
        STASH_TRY(read_string(*lg, "log", "file", cfg.log.file, set));
        auto lvl = log::parse_level(cfg.log.level);
        if (lvl.is_err()) {
            return StashError{StashError::Config,
                lvl.error().message, lvl.error().hint};
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StashError{StashError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

bool Config::is_set(const std::string& dotted_key) const {
    return explicit_keys.count(dotted_key) > 0;
}

void Config::merge(const Config& other) {
    auto take = [&](const char* key, auto& dst, const auto& src) {
        if (other.is_set(key)) {
            dst = src;
            explicit_keys.insert(key);
        }
    };

    take("remote.api-url", remote.api_url, other.remote.api_url);
    take("remote.owner", remote.owner, other.remote.owner);
    take("remote.token-env", remote.token_env, other.remote.token_env);
    take("remote.timeout", remote.timeout_seconds, other.remote.timeout_seconds);
    take("remote.private", remote.private_documents, other.remote.private_documents);

    take("sync.attempts", sync.attempts, other.sync.attempts);
    take("sync.backoff-ms", sync.backoff_ms, other.sync.backoff_ms);
    take("sync.max-backoff-ms", sync.max_backoff_ms, other.sync.max_backoff_ms);
    take("sync.lock-stale-seconds", sync.lock_stale_seconds, other.sync.lock_stale_seconds);

    take("runner.command", runner.command, other.runner.command);
    take("runner.timeout", runner.timeout_seconds, other.runner.timeout_seconds);

    take("log.level", log.level, other.log.level);
    take("log.file", log.file, other.log.file);
}

Status Config::apply_env() {
    if (const char* v = std::getenv("STASH_OWNER")) {
        remote.owner = v;
        explicit_keys.insert("remote.owner");
    }
    if (const char* v = std::getenv("STASH_API_URL")) {
        remote.api_url = v;
        explicit_keys.insert("remote.api-url");
    }
    if (const char* v = std::getenv("STASH_TIMEOUT")) {
        char* end = nullptr;
        long secs = std::strtol(v, &end, 10);
        if (end == v || *end != '\0' || secs < 1) {
            return StashError{StashError::Config,
                std::string("STASH_TIMEOUT must be a positive integer, got '") + v + "'"};
        }
        remote.timeout_seconds = static_cast<int>(secs);
        explicit_keys.insert("remote.timeout");
    }
    if (const char* v = std::getenv("STASH_LOG_LEVEL")) {
        auto lvl = log::parse_level(v);
        if (lvl.is_err()) {
            return StashError{StashError::Config,
                "STASH_LOG_LEVEL: " + lvl.error().message, lvl.error().hint};
        }
        this->log.level = v;
        explicit_keys.insert("log.level");
    }
    return ok_status();
}

Result<Config> Config::effective(const std::string& root) {
    Config result;

    std::string path = config_path(root);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        auto file_layer = Config::load(path);
        if (file_layer.is_err()) return std::move(file_layer).error();
        result.merge(file_layer.value());
    }

    STASH_TRY(result.apply_env());
    return Result<Config>::ok(std::move(result));
}

Result<std::string> Config::token() const {
    const char* v = std::getenv(remote.token_env.c_str());
    if (!v || !*v) {
        return StashError{StashError::AuthenticationFailed,
            "no access token in $" + remote.token_env,
            "export a token with the 'gist' scope, or set remote.token-env"};
    }
    return Result<std::string>::ok(std::string(v));
}

std::string default_root() {
    if (const char* home = std::getenv("STASH_HOME")) {
        if (*home) return home;
    }
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return ".stash";
    return std::string(home) + "/.stash";
}

std::string config_path(const std::string& root) {
    return (fs::path(root) / "config.toml").string();
}

} // namespace stash
