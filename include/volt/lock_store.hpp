#pragma once

#include <volt/result.hpp>
#include <volt/lockfile.hpp>
#include <volt/paths.hpp>
#include <volt/filesystem.hpp>

namespace volt {

// Reads and writes lock.json, validating on both sides so a state that
// breaks an invariant is never returned or persisted.
class LockStore {
public:
    // `fs` is borrowed and must outlive the store
    LockStore(VoltPaths paths, Filesystem& fs);

    // LockFile::initial() if lock.json does not exist (not validated),
    // otherwise the parsed and validated document.
    Result<LockFile> load() const;

    // Validate, create the lockfile directory if needed, then overwrite
    // lock.json. Nothing is written when validation or encoding fails.
    Status save(const LockFile& lock);

    Status validate(const LockFile& lock) const;

    const VoltPaths& paths() const { return paths_; }

private:
    VoltPaths paths_;
    Filesystem& fs_;
};

} // namespace volt
