#pragma once

#include <volt/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace volt {

enum class ReposType { Git, Static };

// "git" / "static"
const char* repos_type_name(ReposType t);

// Returns std::nullopt for anything other than "git" or "static"
std::optional<ReposType> parse_repos_type(const std::string& name);

// One installed repository, keyed by its path under the repos directory
struct LockedRepos {
    std::string type;            // "git" or "static"; kept raw until validated
    int64_t trx_id = 0;
    std::string path;            // e.g. "github.com/tyru/caw.vim"
    std::string version;         // commit hash, required for git repos

    bool is_git() const { return type == repos_type_name(ReposType::Git); }

    bool operator==(const LockedRepos& o) const;
    bool operator!=(const LockedRepos& o) const;
};

struct Profile {
    std::string name;
    // std::nullopt means the key was absent, distinct from an empty list
    std::optional<std::vector<std::string>> repos_path;
    bool load_vimrc = false;
    bool load_gvimrc = false;

    bool operator==(const Profile& o) const;
    bool operator!=(const Profile& o) const;
};

using ReposList = std::vector<LockedRepos>;
using ProfileList = std::vector<Profile>;

// In-memory form of lock.json. Zero / std::nullopt fields read as "missing"
// to the validator.
struct LockFile {
    int64_t version = 0;
    int64_t trx_id = 0;
    std::string active_profile;
    bool load_vimrc = false;
    bool load_gvimrc = false;
    std::optional<ReposList> repos;
    std::optional<ProfileList> profiles;

    // State used when no lock.json exists yet: version 1, trx_id 1, no repos,
    // a single empty "default" profile which is active.
    static LockFile initial();

    // Decode a lock.json document. Structure only; see validate() for invariants.
    static Result<LockFile> parse(const std::string& json_str);

    // 2-space indented JSON with a fixed key order. Fails with Parse if a
    // string is not valid UTF-8.
    Result<std::string> to_json() const;

    // Resolve every repos_path entry of `profile` to its repos entry
    Result<ReposList> repos_of_profile(const Profile& profile) const;

    // The profile named by active_profile
    Result<Profile*> current_profile();

    // Bump trx_id and return the new value for stamping updated repos
    int64_t begin_transaction();

    bool operator==(const LockFile& o) const;
    bool operator!=(const LockFile& o) const;
};

// ---------------------------------------------------------------------------
// Collection helpers. Lookups that miss return NotFound errors.
// ---------------------------------------------------------------------------

Result<Profile*> find_profile(ProfileList& profiles, const std::string& name);
Result<const Profile*> find_profile(const ProfileList& profiles, const std::string& name);

// -1 if absent
int find_profile_index(const ProfileList& profiles, const std::string& name);

// Remove the first occurrence of `repos_path` across all profiles, in profile
// order then entry order. Later occurrences are left alone.
Status remove_first_repos_path(ProfileList& profiles, const std::string& repos_path);

Result<LockedRepos*> find_repos(ReposList& repos, const std::string& path);
Result<const LockedRepos*> find_repos(const ReposList& repos, const std::string& path);

// Remove the first repos entry with this path
Status remove_repos(ReposList& repos, const std::string& path);

bool profile_contains(const Profile& profile, const std::string& repos_path);

// -1 if absent
int profile_index_of(const Profile& profile, const std::string& repos_path);

} // namespace volt
