#include <volt/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace volt {

namespace fs = std::filesystem;

static Result<std::string> read_path_name(const toml::table& tbl,
                                          const char* key) {
    auto s = tbl[key].value<std::string>();
    if (!s) {
        return VoltError{VoltError::Config,
            std::string("config: paths.") + key + " must be a string"};
    }
    if (s->empty()) {
        return VoltError{VoltError::Config,
            std::string("config: paths.") + key + " cannot be empty"};
    }
    return Result<std::string>::ok(std::move(*s));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return VoltError{VoltError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (lg->contains("level")) {
            auto name = (*lg)["level"].value<std::string>();
            if (!name) {
                return VoltError{VoltError::Config,
                    "config: log.level must be a string"};
            }
            if (!log::level_from_name(*name, cfg.log_level)) {
                return VoltError{VoltError::Config,
                    "config: unknown log level '" + *name + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
        if (lg->contains("color")) {
            auto v = (*lg)["color"].value<bool>();
            if (!v) {
                return VoltError{VoltError::Config,
                    "config: log.color must be a boolean"};
            }
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    // [paths] section
    if (auto paths = doc["paths"].as_table()) {
        if (paths->contains("lockfile")) {
            auto v = read_path_name(*paths, "lockfile");
            if (v.is_err()) return std::move(v).error();
            cfg.paths.lockfile = std::move(v).value();
            cfg.paths_lockfile_set = true;
        }
        if (paths->contains("repos")) {
            auto v = read_path_name(*paths, "repos");
            if (v.is_err()) return std::move(v).error();
            cfg.paths.repos = std::move(v).value();
            cfg.paths_repos_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return VoltError{VoltError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) cfg.error().file = path;
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (other.paths_lockfile_set) {
        paths.lockfile = other.paths.lockfile;
        paths_lockfile_set = true;
    }
    if (other.paths_repos_set) {
        paths.repos = other.paths.repos;
        paths_repos_set = true;
    }
}

Status Config::apply_env() {
    const char* env = std::getenv("VOLT_LOG");
    if (!env || *env == '\0') return ok_status();

    if (!log::level_from_name(env, log_level)) {
        return VoltError{VoltError::Config,
            std::string("VOLT_LOG: unknown log level '") + env + "'",
            "use one of: trace, debug, info, warn, error"};
    }
    log_level_set = true;
    return ok_status();
}

void Config::apply_logging() const {
    if (log_level_set) log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

Result<Config> discover_config(const fs::path& volt_path) {
    fs::path config_file = volt_path / "config.toml";
    std::error_code ec;
    if (!fs::exists(config_file, ec)) {
        return Result<Config>::ok(Config{});
    }
    return Config::load(config_file.string());
}

} // namespace volt
