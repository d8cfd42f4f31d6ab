// volt_lock.cpp
//
// Inspect the lock.json under $VOLTPATH (or ~/volt):
//
//     ./volt-lock                      # summary of repos + active profile
//     ./volt-lock --profile minimal    # show another profile
//     ./volt-lock --check              # validate only, exit status tells
//
// Log verbosity comes from [log] in config.toml or VOLT_LOG=debug.

#include <volt/config.hpp>
#include <volt/filesystem.hpp>
#include <volt/lock_store.hpp>
#include <volt/log.hpp>
#include <volt/paths.hpp>

#include <iostream>
#include <string>

using namespace volt;

static int fail(const VoltError& err) {
    std::cerr << err.format() << "\n";
    return 1;
}

static void print_profile(const LockFile& lock, const Profile& profile) {
    std::cout << "profile " << profile.name
              << (profile.name == lock.active_profile ? " (active)" : "")
              << "  load_vimrc=" << (profile.load_vimrc ? "true" : "false")
              << " load_gvimrc=" << (profile.load_gvimrc ? "true" : "false")
              << "\n";

    auto repos = lock.repos_of_profile(profile);
    if (repos.is_err()) {
        std::cout << "  <" << repos.error().message << ">\n";
        return;
    }
    for (const auto& r : repos.value()) {
        std::cout << "  " << r.path << "\n";
    }
}

int main(int argc, char* argv[]) {
    bool check_only = false;
    std::string profile_name;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--check") {
            check_only = true;
        } else if (arg == "--profile" && i + 1 < argc) {
            profile_name = argv[++i];
        } else {
            std::cerr << "Usage: volt-lock [--check] [--profile <name>]\n";
            return 2;
        }
    }

    auto root = VoltPaths::discover();
    if (root.is_err()) return fail(root.error());

    auto cfg = discover_config(root.value().root());
    if (cfg.is_err()) return fail(cfg.error());
    auto env = cfg.value().apply_env();
    if (env.is_err()) return fail(env.error());
    cfg.value().apply_logging();

    VoltPaths paths(root.value().root(), cfg.value().paths);
    LocalFilesystem fs;
    LockStore store(paths, fs);

    auto lock = store.load();
    if (lock.is_err()) return fail(lock.error());

    if (check_only) {
        log::info("%s is valid", paths.lockfile().string().c_str());
        return 0;
    }

    const LockFile& lf = lock.value();
    std::cout << "lockfile " << paths.lockfile().string()
              << "  version=" << lf.version
              << " trx_id=" << lf.trx_id << "\n";

    std::cout << "repos (" << lf.repos->size() << ")\n";
    for (const auto& r : *lf.repos) {
        std::cout << "  [" << r.type << "] " << r.path;
        if (r.is_git()) std::cout << " @ " << r.version;
        std::cout << "  trx " << r.trx_id << "\n";
    }

    if (profile_name.empty()) profile_name = lf.active_profile;
    auto profile = find_profile(*lf.profiles, profile_name);
    if (profile.is_err()) return fail(profile.error());
    print_profile(lf, *profile.value());

    return 0;
}
