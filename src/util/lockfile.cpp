#include <volt/lockfile.hpp>
#include <nlohmann/json.hpp>
#include <limits>

namespace volt {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

// ---------------------------------------------------------------------------
// ReposType
// ---------------------------------------------------------------------------

const char* repos_type_name(ReposType t) {
    switch (t) {
        case ReposType::Git:    return "git";
        case ReposType::Static: return "static";
    }
    return "";
}

std::optional<ReposType> parse_repos_type(const std::string& name) {
    if (name == "git") return ReposType::Git;
    if (name == "static") return ReposType::Static;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Equality
// ---------------------------------------------------------------------------

bool LockedRepos::operator==(const LockedRepos& o) const {
    return type == o.type && trx_id == o.trx_id &&
           path == o.path && version == o.version;
}

bool LockedRepos::operator!=(const LockedRepos& o) const {
    return !(*this == o);
}

bool Profile::operator==(const Profile& o) const {
    return name == o.name && repos_path == o.repos_path &&
           load_vimrc == o.load_vimrc && load_gvimrc == o.load_gvimrc;
}

bool Profile::operator!=(const Profile& o) const {
    return !(*this == o);
}

bool LockFile::operator==(const LockFile& o) const {
    return version == o.version && trx_id == o.trx_id &&
           active_profile == o.active_profile &&
           load_vimrc == o.load_vimrc && load_gvimrc == o.load_gvimrc &&
           repos == o.repos && profiles == o.profiles;
}

bool LockFile::operator!=(const LockFile& o) const {
    return !(*this == o);
}

// ---------------------------------------------------------------------------
// Decoding helpers
//
// Absent keys and null take the zero value, like the rest of the volt tools
// expect. A value of the wrong JSON type is a parse error.
// ---------------------------------------------------------------------------

static VoltError type_error(const std::string& field, const char* expected) {
    return VoltError{VoltError::Parse,
        "lock.json: " + field + " must be " + expected};
}

static const json* lookup(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

static Result<int64_t> read_int(const json& obj, const char* key,
                                const std::string& field) {
    const json* v = lookup(obj, key);
    if (!v) return Result<int64_t>::ok(0);
    if (!v->is_number_integer()) return type_error(field, "an integer");
    if (v->is_number_unsigned() &&
        v->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return VoltError{VoltError::Parse,
            "lock.json: " + field + " is out of range"};
    }
    return Result<int64_t>::ok(v->get<int64_t>());
}

static Result<std::string> read_string(const json& obj, const char* key,
                                       const std::string& field) {
    const json* v = lookup(obj, key);
    if (!v) return Result<std::string>::ok(std::string{});
    if (!v->is_string()) return type_error(field, "a string");
    return Result<std::string>::ok(v->get<std::string>());
}

static Result<bool> read_bool(const json& obj, const char* key,
                              const std::string& field) {
    const json* v = lookup(obj, key);
    if (!v) return Result<bool>::ok(false);
    if (!v->is_boolean()) return type_error(field, "a boolean");
    return Result<bool>::ok(v->get<bool>());
}

static std::string indexed(const char* list, size_t i) {
    return std::string(list) + "[" + std::to_string(i) + "]";
}

static Result<LockedRepos> parse_repos(const json& node, size_t i) {
    LockedRepos r;
    std::string where = indexed("repos", i);
    if (node.is_null()) return Result<LockedRepos>::ok(std::move(r));
    if (!node.is_object()) return type_error(where, "an object");

    auto type = read_string(node, "type", where + ".type");
    if (type.is_err()) return std::move(type).error();
    r.type = std::move(type).value();

    auto trx = read_int(node, "trx_id", where + ".trx_id");
    if (trx.is_err()) return std::move(trx).error();
    r.trx_id = trx.value();

    auto path = read_string(node, "path", where + ".path");
    if (path.is_err()) return std::move(path).error();
    r.path = std::move(path).value();

    auto version = read_string(node, "version", where + ".version");
    if (version.is_err()) return std::move(version).error();
    r.version = std::move(version).value();

    return Result<LockedRepos>::ok(std::move(r));
}

static Result<Profile> parse_profile(const json& node, size_t i) {
    Profile p;
    std::string where = indexed("profiles", i);
    if (node.is_null()) return Result<Profile>::ok(std::move(p));
    if (!node.is_object()) return type_error(where, "an object");

    auto name = read_string(node, "name", where + ".name");
    if (name.is_err()) return std::move(name).error();
    p.name = std::move(name).value();

    if (const json* list = lookup(node, "repos_path")) {
        if (!list->is_array()) return type_error(where + ".repos_path", "an array");
        std::vector<std::string> paths;
        paths.reserve(list->size());
        for (size_t j = 0; j < list->size(); ++j) {
            const json& elem = (*list)[j];
            if (elem.is_null()) {
                paths.emplace_back();
            } else if (elem.is_string()) {
                paths.push_back(elem.get<std::string>());
            } else {
                return type_error(where + ".repos_path[" + std::to_string(j) + "]",
                                  "a string");
            }
        }
        p.repos_path = std::move(paths);
    }

    auto vimrc = read_bool(node, "load_vimrc", where + ".load_vimrc");
    if (vimrc.is_err()) return std::move(vimrc).error();
    p.load_vimrc = vimrc.value();

    auto gvimrc = read_bool(node, "load_gvimrc", where + ".load_gvimrc");
    if (gvimrc.is_err()) return std::move(gvimrc).error();
    p.load_gvimrc = gvimrc.value();

    return Result<Profile>::ok(std::move(p));
}

// ---------------------------------------------------------------------------
// LockFile
// ---------------------------------------------------------------------------

LockFile LockFile::initial() {
    LockFile lf;
    lf.version = 1;
    lf.trx_id = 1;
    lf.active_profile = "default";
    lf.load_vimrc = true;
    lf.load_gvimrc = true;
    lf.repos = ReposList{};

    Profile def;
    def.name = "default";
    def.repos_path = std::vector<std::string>{};
    def.load_vimrc = true;
    def.load_gvimrc = true;
    lf.profiles = ProfileList{std::move(def)};
    return lf;
}

Result<LockFile> LockFile::parse(const std::string& json_str) {
    json doc;
    try {
        doc = json::parse(json_str);
    } catch (const json::exception& e) {
        return VoltError{VoltError::Parse,
            std::string("lock.json parse error: ") + e.what()};
    }

    if (!doc.is_object()) {
        return VoltError{VoltError::Parse,
            "lock.json: top-level value must be an object"};
    }

    LockFile lf;

    auto version = read_int(doc, "version", "version");
    if (version.is_err()) return std::move(version).error();
    lf.version = version.value();

    auto trx = read_int(doc, "trx_id", "trx_id");
    if (trx.is_err()) return std::move(trx).error();
    lf.trx_id = trx.value();

    auto active = read_string(doc, "active_profile", "active_profile");
    if (active.is_err()) return std::move(active).error();
    lf.active_profile = std::move(active).value();

    auto vimrc = read_bool(doc, "load_vimrc", "load_vimrc");
    if (vimrc.is_err()) return std::move(vimrc).error();
    lf.load_vimrc = vimrc.value();

    auto gvimrc = read_bool(doc, "load_gvimrc", "load_gvimrc");
    if (gvimrc.is_err()) return std::move(gvimrc).error();
    lf.load_gvimrc = gvimrc.value();

    if (const json* list = lookup(doc, "repos")) {
        if (!list->is_array()) return type_error("repos", "an array");
        ReposList repos;
        repos.reserve(list->size());
        for (size_t i = 0; i < list->size(); ++i) {
            auto r = parse_repos((*list)[i], i);
            if (r.is_err()) return std::move(r).error();
            repos.push_back(std::move(r).value());
        }
        lf.repos = std::move(repos);
    }

    if (const json* list = lookup(doc, "profiles")) {
        if (!list->is_array()) return type_error("profiles", "an array");
        ProfileList profiles;
        profiles.reserve(list->size());
        for (size_t i = 0; i < list->size(); ++i) {
            auto p = parse_profile((*list)[i], i);
            if (p.is_err()) return std::move(p).error();
            profiles.push_back(std::move(p).value());
        }
        lf.profiles = std::move(profiles);
    }

    return Result<LockFile>::ok(std::move(lf));
}

Result<std::string> LockFile::to_json() const {
    ordered_json doc;
    doc["version"] = version;
    doc["trx_id"] = trx_id;
    doc["active_profile"] = active_profile;
    doc["load_vimrc"] = load_vimrc;
    doc["load_gvimrc"] = load_gvimrc;

    if (repos) {
        ordered_json arr = ordered_json::array();
        for (const auto& r : *repos) {
            ordered_json obj;
            obj["type"] = r.type;
            obj["trx_id"] = r.trx_id;
            obj["path"] = r.path;
            obj["version"] = r.version;
            arr.push_back(std::move(obj));
        }
        doc["repos"] = std::move(arr);
    } else {
        doc["repos"] = nullptr;
    }

    if (profiles) {
        ordered_json arr = ordered_json::array();
        for (const auto& p : *profiles) {
            ordered_json obj;
            obj["name"] = p.name;
            if (p.repos_path) {
                obj["repos_path"] = *p.repos_path;
            } else {
                obj["repos_path"] = nullptr;
            }
            obj["load_vimrc"] = p.load_vimrc;
            obj["load_gvimrc"] = p.load_gvimrc;
            arr.push_back(std::move(obj));
        }
        doc["profiles"] = std::move(arr);
    } else {
        doc["profiles"] = nullptr;
    }

    try {
        return Result<std::string>::ok(doc.dump(2));
    } catch (const ordered_json::exception& e) {
        return VoltError{VoltError::Parse,
            std::string("lock.json encode error: ") + e.what(),
            "repos paths and profile names must be valid UTF-8"};
    }
}

Result<ReposList> LockFile::repos_of_profile(const Profile& profile) const {
    static const ReposList no_repos;
    const ReposList& all = repos ? *repos : no_repos;

    ReposList result;
    if (!profile.repos_path) return Result<ReposList>::ok(std::move(result));

    for (const auto& path : *profile.repos_path) {
        auto r = find_repos(all, path);
        if (r.is_err()) return std::move(r).error();
        result.push_back(*r.value());
    }
    return Result<ReposList>::ok(std::move(result));
}

Result<Profile*> LockFile::current_profile() {
    if (!profiles) {
        return VoltError{VoltError::NotFound,
            "profile '" + active_profile + "' does not exist"};
    }
    return find_profile(*profiles, active_profile);
}

int64_t LockFile::begin_transaction() {
    return ++trx_id;
}

// ---------------------------------------------------------------------------
// Profiles
// ---------------------------------------------------------------------------

Result<Profile*> find_profile(ProfileList& profiles, const std::string& name) {
    for (auto& p : profiles) {
        if (p.name == name) return Result<Profile*>::ok(&p);
    }
    return VoltError{VoltError::NotFound,
        "profile '" + name + "' does not exist"};
}

Result<const Profile*> find_profile(const ProfileList& profiles,
                                    const std::string& name) {
    for (const auto& p : profiles) {
        if (p.name == name) return Result<const Profile*>::ok(&p);
    }
    return VoltError{VoltError::NotFound,
        "profile '" + name + "' does not exist"};
}

int find_profile_index(const ProfileList& profiles, const std::string& name) {
    for (size_t i = 0; i < profiles.size(); ++i) {
        if (profiles[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

Status remove_first_repos_path(ProfileList& profiles, const std::string& repos_path) {
    for (auto& p : profiles) {
        if (!p.repos_path) continue;
        auto& paths = *p.repos_path;
        for (auto it = paths.begin(); it != paths.end(); ++it) {
            if (*it == repos_path) {
                paths.erase(it);
                return ok_status();
            }
        }
    }
    return VoltError{VoltError::NotFound,
        "no matching profiles[]/repos_path[]: " + repos_path};
}

bool profile_contains(const Profile& profile, const std::string& repos_path) {
    return profile_index_of(profile, repos_path) >= 0;
}

int profile_index_of(const Profile& profile, const std::string& repos_path) {
    if (!profile.repos_path) return -1;
    const auto& paths = *profile.repos_path;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (paths[i] == repos_path) return static_cast<int>(i);
    }
    return -1;
}

// ---------------------------------------------------------------------------
// Repos
// ---------------------------------------------------------------------------

Result<LockedRepos*> find_repos(ReposList& repos, const std::string& path) {
    for (auto& r : repos) {
        if (r.path == path) return Result<LockedRepos*>::ok(&r);
    }
    return VoltError{VoltError::NotFound,
        "repos '" + path + "' does not exist"};
}

Result<const LockedRepos*> find_repos(const ReposList& repos,
                                      const std::string& path) {
    for (const auto& r : repos) {
        if (r.path == path) return Result<const LockedRepos*>::ok(&r);
    }
    return VoltError{VoltError::NotFound,
        "repos '" + path + "' does not exist"};
}

Status remove_repos(ReposList& repos, const std::string& path) {
    for (auto it = repos.begin(); it != repos.end(); ++it) {
        if (it->path == path) {
            repos.erase(it);
            return ok_status();
        }
    }
    return VoltError{VoltError::NotFound,
        "no matching repos[]/path: " + path};
}

} // namespace volt
