//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements resource type matching.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Semantics/TypeMatcher.h"

#include "llvmbicep/Semantics/ApiVersion.h"

namespace llvmbicep
{

std::optional<ResourceTypeReference> matchResourceType(const std::vector<ResourceTypeReference>& catalog,
                                                       llvm::StringRef                           fullyQualifiedType)
{
    const ResourceTypeReference* best = nullptr;
    for (const auto& candidate : catalog)
    {
        if (!llvm::StringRef(candidate.fullyQualifiedType).equals_insensitive(fullyQualifiedType))
        {
            continue;
        }
        if (!best || compareApiVersions(candidate.apiVersion, best->apiVersion) > 0)
        {
            best = &candidate;
        }
    }
    if (!best)
    {
        return std::nullopt;
    }
    return *best;
}

}  // namespace llvmbicep
