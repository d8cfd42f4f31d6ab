#pragma once

#include <volt/result.hpp>
#include <volt/config.hpp>
#include <string>
#include <filesystem>

namespace volt {

// Maps logical names to locations under the volt root:
//
//   <root>/config.toml
//   <root>/lock.json
//   <root>/repos/<repos path>/
class VoltPaths {
public:
    explicit VoltPaths(std::filesystem::path root, PathsConfig names = {});

    // $VOLTPATH, falling back to $HOME/volt
    static Result<VoltPaths> discover();

    const std::filesystem::path& root() const { return root_; }
    const PathsConfig& names() const { return names_; }

    std::filesystem::path config_file() const;
    std::filesystem::path lockfile() const;
    std::filesystem::path repos_dir() const;

    // Absolute directory of a repos[]/path value ("github.com/tyru/caw.vim")
    std::filesystem::path full_repos_path(const std::string& repos_path) const;

private:
    std::filesystem::path root_;
    PathsConfig names_;
};

} // namespace volt
