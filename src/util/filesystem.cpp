#include <volt/filesystem.hpp>
#include <fstream>
#include <sstream>

namespace volt {

namespace fs = std::filesystem;

bool LocalFilesystem::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LocalFilesystem::is_directory(const fs::path& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

Result<std::string> LocalFilesystem::read_file(const fs::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return VoltError{VoltError::IO,
            "cannot open file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return VoltError{VoltError::IO,
            "cannot read file: " + path.string()};
    }
    return Result<std::string>::ok(ss.str());
}

Status LocalFilesystem::write_file(const fs::path& path,
                                   const std::string& contents) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return VoltError{VoltError::IO,
            "cannot open file for writing: " + path.string()};
    }
    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file.close();
    if (file.fail()) {
        return VoltError{VoltError::IO,
            "cannot write file: " + path.string()};
    }
    return ok_status();
}

Status LocalFilesystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return VoltError{VoltError::IO,
            "cannot create directory " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

} // namespace volt
