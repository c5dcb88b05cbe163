#pragma once

#include <stash/result.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace stash {

// [remote] section
struct RemoteConfig {
    std::string api_url = "https://api.github.com";
    std::string owner;                    // empty: whoever the token belongs to
    std::string token_env = "GITHUB_TOKEN";
    int timeout_seconds = 20;
    bool private_documents = true;
};

// [sync] section
struct SyncConfig {
    int attempts = 3;
    int backoff_ms = 500;
    int max_backoff_ms = 8000;
    int lock_stale_seconds = 3600;
};

// [runner] section
struct RunnerConfig {
    std::vector<std::string> command = {"uv", "run"};
    int timeout_seconds = 0;              // 0: no limit
};

// [log] section
struct LogConfig {
    std::string level = "info";
    std::string file = "stash.log";       // relative to the root directory
};

// Layered configuration: built-in defaults < <root>/config.toml < environment.
// Only keys a layer sets explicitly override the layer below it.
struct Config {
    RemoteConfig remote;
    SyncConfig sync;
    RunnerConfig runner;
    LogConfig log;

    // Dotted keys ("remote.owner") this layer set explicitly
    std::unordered_set<std::string> explicit_keys;

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Merge another layer on top (only its explicit keys win)
    void merge(const Config& other);

    // STASH_OWNER, STASH_API_URL, STASH_TIMEOUT, STASH_LOG_LEVEL
    Status apply_env();

    // Defaults, then <root>/config.toml if present, then environment
    static Result<Config> effective(const std::string& root);

    // Bearer token read from the environment variable named by remote.token_env
    Result<std::string> token() const;

    bool is_set(const std::string& dotted_key) const;
};

// STASH_HOME if set, otherwise ~/.stash
std::string default_root();

std::string config_path(const std::string& root);

} // namespace stash
