#include <catch2/catch.hpp>
#include <volt/validate.hpp>
#include "test_helpers.hpp"

using namespace volt;
using volt_test::MemoryFilesystem;
using volt_test::sample_lock;

namespace {

struct Fixture {
    VoltPaths paths{"/volt"};
    MemoryFilesystem fs;
    LockFile lock = sample_lock();

    Fixture() {
        fs.add_dir(paths.full_repos_path("a"));
    }

    LockedRepos add_repos(const std::string& path, int64_t trx_id = 1) {
        LockedRepos r;
        r.type = "static";
        r.trx_id = trx_id;
        r.path = path;
        lock.repos->push_back(r);
        fs.add_dir(paths.full_repos_path(path));
        return r;
    }

    Status run() const {
        return validate(lock, paths, fs);
    }
};

} // namespace

// ===== Valid states =====

TEST_CASE("sample lock state validates", "[validate]") {
    Fixture f;
    REQUIRE(f.run().is_ok());
}

TEST_CASE("initial lock state validates", "[validate]") {
    Fixture f;
    REQUIRE(validate(LockFile::initial(), f.paths, f.fs).is_ok());
}

TEST_CASE("static repos does not need a version", "[validate]") {
    Fixture f;
    f.add_repos("github.com/user/static");
    REQUIRE(f.lock.repos->back().version.empty());
    REQUIRE(f.run().is_ok());
}

TEST_CASE("repos missing from every profile is allowed", "[validate]") {
    Fixture f;
    f.add_repos("unused");
    REQUIRE(f.run().is_ok());
}

TEST_CASE("same repos in two profiles is allowed", "[validate]") {
    Fixture f;
    Profile p;
    p.name = "other";
    p.repos_path = std::vector<std::string>{"a"};
    f.lock.profiles->push_back(p);
    REQUIRE(f.run().is_ok());
}

TEST_CASE("repos trx_id equal to root trx_id is allowed", "[validate]") {
    Fixture f;
    f.lock.trx_id = 5;
    f.add_repos("b", 5);
    REQUIRE(f.run().is_ok());
}

// ===== Missing fields =====

TEST_CASE("missing root fields", "[validate][missing]") {
    Fixture f;

    SECTION("version") {
        f.lock.version = 0;
        auto s = f.run();
        REQUIRE(s.is_err());
        REQUIRE(s.error().code == VoltError::Missing);
        REQUIRE(s.error().message == "missing: version");
    }

    SECTION("trx_id") {
        f.lock.trx_id = 0;
        auto s = f.run();
        REQUIRE(s.is_err());
        REQUIRE(s.error().message == "missing: trx_id");
    }

    SECTION("repos") {
        f.lock.repos.reset();
        auto s = f.run();
        REQUIRE(s.is_err());
        REQUIRE(s.error().code == VoltError::Missing);
        REQUIRE(s.error().message == "missing: repos");
    }

    SECTION("profiles") {
        f.lock.profiles.reset();
        auto s = f.run();
        REQUIRE(s.is_err());
        REQUIRE(s.error().message == "missing: profiles");
    }
}

TEST_CASE("version is checked before trx_id", "[validate][missing]") {
    Fixture f;
    f.lock.version = 0;
    f.lock.trx_id = 0;
    REQUIRE(f.run().error().message == "missing: version");
}

TEST_CASE("empty repos and profiles lists are not missing", "[validate][missing]") {
    Fixture f;
    f.lock.repos = ReposList{};
    f.lock.profiles = ProfileList{};
    f.lock.active_profile = "default";
    // Passes the missing-field phase, fails later on active_profile
    REQUIRE(validate_missing(f.lock).is_ok());
    REQUIRE(f.run().error().code == VoltError::DanglingRef);
}

TEST_CASE("missing repos fields", "[validate][missing]") {
    Fixture f;
    f.add_repos("b");
    auto& b = f.lock.repos->back();

    SECTION("type") {
        b.type.clear();
        REQUIRE(f.run().error().message == "missing: repos[1].type");
    }

    SECTION("git version") {
        b.type = "git";
        REQUIRE(f.run().error().message == "missing: repos[1].version");
    }

    SECTION("git trx_id") {
        b.type = "git";
        b.version = "abc";
        b.trx_id = 0;
        REQUIRE(f.run().error().message == "missing: repos[1].trx_id");
    }

    SECTION("git path") {
        b.type = "git";
        b.version = "abc";
        b.path.clear();
        REQUIRE(f.run().error().message == "missing: repos[1].path");
    }

    SECTION("static trx_id") {
        b.trx_id = 0;
        REQUIRE(f.run().error().message == "missing: repos[1].trx_id");
    }

    SECTION("static path") {
        b.path.clear();
        REQUIRE(f.run().error().message == "missing: repos[1].path");
    }
}

TEST_CASE("git repos reports version before trx_id and path", "[validate][missing]") {
    Fixture f;
    auto& a = f.lock.repos->front();
    a.version.clear();
    a.trx_id = 0;
    a.path.clear();
    REQUIRE(f.run().error().message == "missing: repos[0].version");
}

TEST_CASE("unknown repos type", "[validate][missing]") {
    Fixture f;
    f.lock.repos->front().type = "unknown";
    auto s = f.run();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VoltError::InvalidType);
    REQUIRE(s.error().message == "repos[0].type is invalid type: unknown");
}

TEST_CASE("repos type is case-sensitive", "[validate][missing]") {
    Fixture f;
    f.lock.repos->front().type = "Git";
    REQUIRE(f.run().error().code == VoltError::InvalidType);
}

TEST_CASE("repos errors come before missing profiles", "[validate][missing]") {
    Fixture f;
    f.lock.repos->front().type = "svn";
    f.lock.profiles.reset();
    REQUIRE(f.run().error().code == VoltError::InvalidType);
}

TEST_CASE("missing profile fields", "[validate][missing]") {
    Fixture f;
    Profile p;
    p.name = "second";
    p.repos_path = std::vector<std::string>{"a"};
    f.lock.profiles->push_back(p);
    auto& second = f.lock.profiles->back();

    SECTION("name") {
        second.name.clear();
        REQUIRE(f.run().error().message == "missing: profiles[1].name");
    }

    SECTION("repos_path") {
        second.repos_path.reset();
        REQUIRE(f.run().error().message == "missing: profiles[1].repos_path");
    }

    SECTION("repos_path entry") {
        second.repos_path->push_back("");
        REQUIRE(f.run().error().message == "missing: profiles[1].repos_path[1]");
    }
}

TEST_CASE("missing-field phase does not touch the filesystem", "[validate][missing]") {
    Fixture f;
    f.lock.repos->front().path = "not/on/disk";
    f.lock.profiles->front().repos_path = std::vector<std::string>{"not/on/disk"};
    REQUIRE(validate_missing(f.lock).is_ok());
}

// ===== Duplicates =====

TEST_CASE("duplicate repos path", "[validate][duplicate]") {
    Fixture f;
    f.add_repos("a");
    auto s = f.run();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VoltError::Duplicate);
    REQUIRE(s.error().message == "duplicate repos 'a'");
}

TEST_CASE("duplicate profile name", "[validate][duplicate]") {
    Fixture f;
    Profile dup;
    dup.name = "default";
    dup.repos_path = std::vector<std::string>{};
    f.lock.profiles->push_back(dup);

    auto s = f.run();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VoltError::Duplicate);
    REQUIRE(s.error().message == "duplicate profile 'default'");
}

TEST_CASE("duplicate repos_path entry in a profile", "[validate][duplicate]") {
    Fixture f;
    f.lock.profiles->front().repos_path->push_back("a");
    auto s = f.run();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VoltError::Duplicate);
    REQUIRE(s.error().message == "duplicate 'a' (repos_path) in profile 'default'");
}

TEST_CASE("duplicate repos is reported before duplicate profile", "[validate][duplicate]") {
    Fixture f;
    f.add_repos("a");
    Profile dup;
    dup.name = "default";
    dup.repos_path = std::vector<std::string>{};
    f.lock.profiles->push_back(dup);
    REQUIRE(f.run().error().message == "duplicate repos 'a'");
}

// ===== References =====

TEST_CASE("active profile must exist", "[validate][reference]") {
    Fixture f;
    f.lock.active_profile = "nope";
    auto s = f.run();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VoltError::DanglingRef);
    REQUIRE(s.error().message == "'nope' (active_profile) doesn't exist in profiles");
}

TEST_CASE("duplicate member is reported before missing active profile", "[validate][reference]") {
    Fixture f;
    f.lock.active_profile = "nope";
    f.lock.profiles->front().repos_path->push_back("a");
    REQUIRE(f.run().error().code == VoltError::Duplicate);
}

TEST_CASE("repos_path entry must name a repos", "[validate][reference]") {
    Fixture f;
    f.add_repos("b");
    Profile p;
    p.name = "second";
    p.repos_path = std::vector<std::string>{"b", "ghost"};
    f.lock.profiles->push_back(p);

    auto s = f.run();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VoltError::DanglingRef);
    REQUIRE(s.error().message == "'ghost' (profiles[1].repos_path[1]) doesn't exist in repos");
}

TEST_CASE("first dangling entry in profile order is reported", "[validate][reference]") {
    Fixture f;
    f.lock.profiles->front().repos_path->push_back("x");
    Profile p;
    p.name = "second";
    p.repos_path = std::vector<std::string>{"y"};
    f.lock.profiles->insert(f.lock.profiles->begin(), p);
    REQUIRE(f.run().error().message == "'y' (profiles[0].repos_path[0]) doesn't exist in repos");
}

// ===== Filesystem =====

TEST_CASE("repos directory must exist", "[validate][filesystem]") {
    Fixture f;
    f.lock.repos->push_back(LockedRepos{"static", 1, "gone", ""});

    auto s = f.run();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VoltError::Filesystem);
    std::string full = f.paths.full_repos_path("gone").string();
    REQUIRE(s.error().message == "'" + full + "' (repos[1].path) doesn't exist on filesystem");
}

TEST_CASE("repos path must be a directory", "[validate][filesystem]") {
    Fixture f;
    f.lock.repos->push_back(LockedRepos{"static", 1, "file", ""});
    f.fs.add_file(f.paths.full_repos_path("file"), "not a dir");

    auto s = f.run();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VoltError::Filesystem);
    std::string full = f.paths.full_repos_path("file").string();
    REQUIRE(s.error().message == "'" + full + "' (repos[1].path) is not a directory");
}

TEST_CASE("data errors win over filesystem errors", "[validate][filesystem]") {
    Fixture f;
    f.lock.repos->push_back(LockedRepos{"static", 1, "gone", ""});
    f.lock.active_profile = "nope";
    REQUIRE(f.run().error().code == VoltError::DanglingRef);
}

TEST_CASE("repos path with nested segments resolves under repos dir", "[validate][filesystem]") {
    Fixture f;
    f.add_repos("github.com/tyru/caw.vim");
    REQUIRE(f.fs.is_directory("/volt/repos/github.com/tyru/caw.vim"));
    REQUIRE(f.run().is_ok());
}

// ===== trx_id ordering =====

TEST_CASE("repos trx_id greater than root trx_id", "[validate][trx]") {
    Fixture f;
    f.lock.trx_id = 3;
    f.add_repos("b", 2);
    f.add_repos("c", 7);

    auto s = f.run();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VoltError::Ordering);
    REQUIRE(s.error().message == "'7' (repos[2].trx_id) is greater than '3' (trx_id)");
}

TEST_CASE("first repos at the maximum trx_id is reported", "[validate][trx]") {
    Fixture f;
    f.lock.trx_id = 2;
    f.add_repos("b", 9);
    f.add_repos("c", 9);
    REQUIRE(f.run().error().message == "'9' (repos[1].trx_id) is greater than '2' (trx_id)");
}

TEST_CASE("filesystem errors win over trx_id ordering", "[validate][trx]") {
    Fixture f;
    f.lock.repos->push_back(LockedRepos{"static", 50, "gone", ""});
    REQUIRE(f.run().error().code == VoltError::Filesystem);
}

TEST_CASE("validation errors are flagged as validation", "[validate]") {
    Fixture f;
    f.lock.trx_id = 0;
    REQUIRE(f.run().error().is_validation());
}
