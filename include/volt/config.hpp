#pragma once

#include <volt/result.hpp>
#include <volt/log.hpp>
#include <string>
#include <filesystem>

namespace volt {

// File names under the volt root
struct PathsConfig {
    std::string lockfile = "lock.json";
    std::string repos = "repos";
};

// Contents of <volt path>/config.toml:
//
//   [log]
//   level = "debug"
//   color = false
//
//   [paths]
//   lockfile = "lock.json"
//   repos = "repos"
struct Config {
    log::Level log_level = log::Info;
    bool log_color = false;
    PathsConfig paths;

    // Track which fields were explicitly set (for merge / apply)
    bool log_level_set = false;
    bool log_color_set = false;
    bool paths_lockfile_set = false;
    bool paths_repos_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly-set values override this)
    void merge(const Config& other);

    // VOLT_LOG=<level> overrides the configured log level
    Status apply_env();

    // Push the log settings that were set into volt::log
    void apply_logging() const;
};

// Load <volt_path>/config.toml. Returns a default Config if the file is absent.
Result<Config> discover_config(const std::filesystem::path& volt_path);

} // namespace volt
