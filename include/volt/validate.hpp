#pragma once

#include <volt/result.hpp>
#include <volt/lockfile.hpp>
#include <volt/paths.hpp>
#include <volt/filesystem.hpp>

namespace volt {

// Required-field checks, in document order. Stops at the first missing field
// (VoltError::Missing) or unknown repos type (VoltError::InvalidType).
Status validate_missing(const LockFile& lock);

// Full validation: validate_missing(), then cross-record checks in this order:
//   1. duplicate repos[]/path
//   2. duplicate profiles[]/name
//   3. duplicate entries in one profile's repos_path
//   4. active_profile names a profile
//   5. every repos_path entry names a repos[]/path
//   6. every repos directory exists on the filesystem
//   7. no repos[]/trx_id exceeds the root trx_id
// The filesystem is only consulted once all data checks have passed.
Status validate(const LockFile& lock, const VoltPaths& paths, const Filesystem& fs);

} // namespace volt
