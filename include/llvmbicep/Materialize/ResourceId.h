//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Parsed Azure Resource Manager resource identifiers.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_MATERIALIZE_RESOURCE_ID_H
#define LLVMBICEP_MATERIALIZE_RESOURCE_ID_H

#include "llvm/ADT/StringRef.h"

#include <optional>
#include <string>
#include <vector>

namespace llvmbicep
{

/// @brief Structured form of `/.../providers/<namespace>/<type>/<name>[/<type>/<name>]*`.
///
/// Tenant, subscription, resource group, management group and extension
/// scopes are accepted. `/subscriptions/<id>` and
/// `/subscriptions/<id>/resourceGroups/<name>` denote the subscription and
/// resource group resources themselves.
class ResourceId final
{
public:
    /// @brief Parses an identifier.
    /// @return Parsed identifier, or `std::nullopt` when `text` is not a resource identifier.
    [[nodiscard]] static std::optional<ResourceId> parse(llvm::StringRef text);

    /// @brief Identifier text without a trailing slash.
    [[nodiscard]] const std::string& fullyQualifiedId() const
    {
        return fullyQualifiedId_;
    }

    /// @brief Scope prefix preceding the last `providers` segment (empty at tenant scope).
    [[nodiscard]] const std::string& scope() const
    {
        return scope_;
    }

    [[nodiscard]] const std::string& providerNamespace() const
    {
        return providerNamespace_;
    }

    /// @brief Type segments after the namespace, outermost first.
    [[nodiscard]] const std::vector<std::string>& typeSegments() const
    {
        return typeSegments_;
    }

    /// @brief Resource names, outermost first; one per type segment.
    [[nodiscard]] const std::vector<std::string>& nameHierarchy() const
    {
        return nameHierarchy_;
    }

    /// @brief `<namespace>/<type>[/<childType>]*`.
    [[nodiscard]] std::string fullyQualifiedType() const;

private:
    std::string              fullyQualifiedId_;
    std::string              scope_;
    std::string              providerNamespace_;
    std::vector<std::string> typeSegments_;
    std::vector<std::string> nameHierarchy_;
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_MATERIALIZE_RESOURCE_ID_H
