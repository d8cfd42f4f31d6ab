#include <volt/paths.hpp>
#include <cstdlib>

namespace volt {

namespace fs = std::filesystem;

VoltPaths::VoltPaths(fs::path root, PathsConfig names)
    : root_(std::move(root)), names_(std::move(names)) {}

Result<VoltPaths> VoltPaths::discover() {
    const char* volt_path = std::getenv("VOLTPATH");
    if (volt_path && *volt_path != '\0') {
        std::error_code ec;
        fs::path root = fs::absolute(volt_path, ec);
        if (ec) {
            return VoltError{VoltError::IO,
                std::string("cannot resolve VOLTPATH: ") + volt_path};
        }
        return Result<VoltPaths>::ok(VoltPaths(root.lexically_normal()));
    }

    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home || *home == '\0') {
        return VoltError{VoltError::InvalidArg,
            "cannot determine volt directory",
            "set VOLTPATH or HOME"};
    }
    return Result<VoltPaths>::ok(VoltPaths(fs::path(home) / "volt"));
}

fs::path VoltPaths::config_file() const {
    return root_ / "config.toml";
}

fs::path VoltPaths::lockfile() const {
    return root_ / names_.lockfile;
}

fs::path VoltPaths::repos_dir() const {
    return root_ / names_.repos;
}

fs::path VoltPaths::full_repos_path(const std::string& repos_path) const {
    // repos paths are always stored with '/' separators
    fs::path rel = fs::path(repos_path, fs::path::generic_format);
    return (repos_dir() / rel).make_preferred();
}

} // namespace volt
