#include <volt/lock_store.hpp>
#include <volt/validate.hpp>
#include <volt/log.hpp>

namespace volt {

namespace fs = std::filesystem;

LockStore::LockStore(VoltPaths paths, Filesystem& fs)
    : paths_(std::move(paths)), fs_(fs) {}

Status LockStore::validate(const LockFile& lock) const {
    return volt::validate(lock, paths_, fs_);
}

Result<LockFile> LockStore::load() const {
    fs::path lockfile = paths_.lockfile();

    if (!fs_.exists(lockfile)) {
        log::debug("%s not found, using initial lock state", lockfile.string().c_str());
        return Result<LockFile>::ok(LockFile::initial());
    }

    log::debug("reading %s", lockfile.string().c_str());
    auto lock = fs_.read_file(lockfile).and_then(LockFile::parse);
    if (lock.is_err()) {
        if (lock.error().code == VoltError::IO) return lock;
        lock.error().file = lockfile.string();
        return lock;
    }

    auto status = validate(lock.value());
    if (status.is_err()) {
        log::warn("%s is invalid", lockfile.string().c_str());
        return std::move(status).error();
    }

    return lock;
}

Status LockStore::save(const LockFile& lock) {
    VOLT_TRY(validate(lock));

    auto contents = lock.to_json();
    if (contents.is_err()) return std::move(contents).error();

    fs::path lockfile = paths_.lockfile();
    fs::path dir = lockfile.parent_path();
    if (!dir.empty() && !fs_.exists(dir)) {
        log::debug("creating %s", dir.string().c_str());
        VOLT_TRY(fs_.create_directories(dir));
    }

    VOLT_TRY(fs_.write_file(lockfile, contents.value()));
    log::debug("wrote %s (trx_id %lld)", lockfile.string().c_str(),
               static_cast<long long>(lock.trx_id));
    return ok_status();
}

} // namespace volt
