//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Total order over resource provider API version strings.
///
/// Dated versions (`YYYY-MM-DD` with an optional `-suffix`) rank above undated
/// strings. Dated versions order by date; on the same date the stable version
/// ranks above any suffixed one and suffixes compare case-insensitively.
/// Undated strings compare case-insensitively. Remaining ties fall back to an
/// ordinal comparison.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SEMANTICS_API_VERSION_H
#define LLVMBICEP_SEMANTICS_API_VERSION_H

#include "llvm/ADT/StringRef.h"

namespace llvmbicep
{

/// @brief Compares two API versions.
/// @return Negative when `lhs` ranks below `rhs`, zero when identical, positive otherwise.
[[nodiscard]] int compareApiVersions(llvm::StringRef lhs, llvm::StringRef rhs);

/// @brief Strict weak ordering adapter for @ref compareApiVersions.
struct ApiVersionLess final
{
    bool operator()(llvm::StringRef lhs, llvm::StringRef rhs) const
    {
        return compareApiVersions(lhs, rhs) < 0;
    }
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_SEMANTICS_API_VERSION_H
