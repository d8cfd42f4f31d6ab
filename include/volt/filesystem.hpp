#pragma once

#include <volt/result.hpp>
#include <string>
#include <filesystem>

namespace volt {

// Filesystem operations the lockfile store depends on.
// LockStore only borrows an instance, so tests can substitute an in-memory one.
class Filesystem {
public:
    virtual ~Filesystem() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual bool is_directory(const std::filesystem::path& path) const = 0;

    // Read the whole file
    virtual Result<std::string> read_file(const std::filesystem::path& path) const = 0;

    // Create or truncate, then write `contents`
    virtual Status write_file(const std::filesystem::path& path,
                              const std::string& contents) = 0;

    // mkdir -p
    virtual Status create_directories(const std::filesystem::path& path) = 0;
};

// std::filesystem backed implementation
class LocalFilesystem : public Filesystem {
public:
    bool exists(const std::filesystem::path& path) const override;
    bool is_directory(const std::filesystem::path& path) const override;
    Result<std::string> read_file(const std::filesystem::path& path) const override;
    Status write_file(const std::filesystem::path& path,
                      const std::string& contents) override;
    Status create_directories(const std::filesystem::path& path) override;
};

} // namespace volt
