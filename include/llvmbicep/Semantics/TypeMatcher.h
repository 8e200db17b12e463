//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Selection of the newest catalog entry for a fully-qualified resource type.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SEMANTICS_TYPE_MATCHER_H
#define LLVMBICEP_SEMANTICS_TYPE_MATCHER_H

#include "llvmbicep/Semantics/ResourceTypes.h"

#include "llvm/ADT/StringRef.h"

#include <optional>
#include <vector>

namespace llvmbicep
{

/// @brief Picks the highest API version among entries whose type equals `fullyQualifiedType`.
///
/// Types compare case-insensitively; versions are ranked by
/// @ref compareApiVersions and the first maximal entry wins.
///
/// @param[in] catalog Candidate references.
/// @param[in] fullyQualifiedType Type to look for.
/// @return Matched reference, or `std::nullopt` when no entry has that type.
[[nodiscard]] std::optional<ResourceTypeReference> matchResourceType(const std::vector<ResourceTypeReference>& catalog,
                                                                     llvm::StringRef fullyQualifiedType);

}  // namespace llvmbicep

#endif  // LLVMBICEP_SEMANTICS_TYPE_MATCHER_H
