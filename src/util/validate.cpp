#include <volt/validate.hpp>
#include <unordered_set>

namespace volt {

static std::string at(const char* list, size_t i) {
    return std::string(list) + "[" + std::to_string(i) + "]";
}

static VoltError missing(const std::string& field) {
    return VoltError{VoltError::Missing, "missing: " + field};
}

// ---------------------------------------------------------------------------
// Required fields
// ---------------------------------------------------------------------------

static Status validate_missing_repos(const LockedRepos& repos, size_t i) {
    std::string where = at("repos", i);

    if (repos.type.empty()) {
        return missing(where + ".type");
    }

    auto type = parse_repos_type(repos.type);
    if (!type) {
        return VoltError{VoltError::InvalidType,
            where + ".type is invalid type: " + repos.type,
            "repos type must be 'git' or 'static'"};
    }

    // git repos carry a version on top of the fields every repos has
    if (*type == ReposType::Git && repos.version.empty()) {
        return missing(where + ".version");
    }
    if (repos.trx_id == 0) {
        return missing(where + ".trx_id");
    }
    if (repos.path.empty()) {
        return missing(where + ".path");
    }
    return ok_status();
}

static Status validate_missing_profile(const Profile& profile, size_t i) {
    std::string where = at("profiles", i);

    if (profile.name.empty()) {
        return missing(where + ".name");
    }
    if (!profile.repos_path) {
        return missing(where + ".repos_path");
    }
    const auto& paths = *profile.repos_path;
    for (size_t j = 0; j < paths.size(); ++j) {
        if (paths[j].empty()) {
            return missing(where + ".repos_path[" + std::to_string(j) + "]");
        }
    }
    return ok_status();
}

Status validate_missing(const LockFile& lock) {
    if (lock.version == 0) return missing("version");
    if (lock.trx_id == 0) return missing("trx_id");

    if (!lock.repos) return missing("repos");
    for (size_t i = 0; i < lock.repos->size(); ++i) {
        VOLT_TRY(validate_missing_repos((*lock.repos)[i], i));
    }

    if (!lock.profiles) return missing("profiles");
    for (size_t i = 0; i < lock.profiles->size(); ++i) {
        VOLT_TRY(validate_missing_profile((*lock.profiles)[i], i));
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Cross-record checks
// ---------------------------------------------------------------------------

static Status check_duplicates(const ReposList& repos, const ProfileList& profiles) {
    std::unordered_set<std::string> seen;
    for (const auto& r : repos) {
        if (!seen.insert(r.path).second) {
            return VoltError{VoltError::Duplicate,
                "duplicate repos '" + r.path + "'"};
        }
    }

    seen.clear();
    for (const auto& p : profiles) {
        if (!seen.insert(p.name).second) {
            return VoltError{VoltError::Duplicate,
                "duplicate profile '" + p.name + "'"};
        }
    }

    for (const auto& p : profiles) {
        seen.clear();
        for (const auto& path : *p.repos_path) {
            if (!seen.insert(path).second) {
                return VoltError{VoltError::Duplicate,
                    "duplicate '" + path + "' (repos_path) in profile '" + p.name + "'"};
            }
        }
    }
    return ok_status();
}

static Status check_references(const LockFile& lock) {
    const auto& repos = *lock.repos;
    const auto& profiles = *lock.profiles;

    if (find_profile_index(profiles, lock.active_profile) < 0) {
        return VoltError{VoltError::DanglingRef,
            "'" + lock.active_profile + "' (active_profile) doesn't exist in profiles"};
    }

    for (size_t i = 0; i < profiles.size(); ++i) {
        const auto& paths = *profiles[i].repos_path;
        for (size_t j = 0; j < paths.size(); ++j) {
            if (find_repos(repos, paths[j]).is_err()) {
                return VoltError{VoltError::DanglingRef,
                    "'" + paths[j] + "' (" + at("profiles", i) +
                    ".repos_path[" + std::to_string(j) + "]) doesn't exist in repos"};
            }
        }
    }
    return ok_status();
}

static Status check_directories(const ReposList& repos, const VoltPaths& paths,
                                const Filesystem& fs) {
    for (size_t i = 0; i < repos.size(); ++i) {
        std::string full = paths.full_repos_path(repos[i].path).string();
        if (!fs.exists(full)) {
            return VoltError{VoltError::Filesystem,
                "'" + full + "' (" + at("repos", i) + ".path) doesn't exist on filesystem"};
        }
        if (!fs.is_directory(full)) {
            return VoltError{VoltError::Filesystem,
                "'" + full + "' (" + at("repos", i) + ".path) is not a directory"};
        }
    }
    return ok_status();
}

static Status check_trx_order(const LockFile& lock) {
    // First repos holding the maximum wins
    int index = -1;
    int64_t max = 0;
    for (size_t i = 0; i < lock.repos->size(); ++i) {
        const auto& r = (*lock.repos)[i];
        if (max < r.trx_id) {
            index = static_cast<int>(i);
            max = r.trx_id;
        }
    }
    if (max > lock.trx_id) {
        return VoltError{VoltError::Ordering,
            "'" + std::to_string(max) + "' (repos[" + std::to_string(index) +
            "].trx_id) is greater than '" + std::to_string(lock.trx_id) + "' (trx_id)"};
    }
    return ok_status();
}

Status validate(const LockFile& lock, const VoltPaths& paths, const Filesystem& fs) {
    VOLT_TRY(validate_missing(lock));

    VOLT_TRY(check_duplicates(*lock.repos, *lock.profiles));
    VOLT_TRY(check_references(lock));
    VOLT_TRY(check_directories(*lock.repos, paths, fs));
    VOLT_TRY(check_trx_order(lock));
    return ok_status();
}

} // namespace volt
