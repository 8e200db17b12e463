//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements resource identifier parsing.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Materialize/ResourceId.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"

namespace llvmbicep
{
namespace
{

using Segments = llvm::SmallVector<llvm::StringRef, 16>;

bool isKeyword(llvm::StringRef segment, llvm::StringRef keyword)
{
    return segment.equals_insensitive(keyword);
}

/// Accepts the scopes that may precede `/providers/`: tenant, subscription,
/// resource group, or any other resource identifier.
bool isValidScope(llvm::ArrayRef<llvm::StringRef> segments, llvm::StringRef scopeText)
{
    if (segments.empty())
    {
        return true;
    }
    if (segments.size() == 2 && isKeyword(segments[0], "subscriptions"))
    {
        return true;
    }
    if (segments.size() == 4 && isKeyword(segments[0], "subscriptions") && isKeyword(segments[2], "resourceGroups"))
    {
        return true;
    }
    return ResourceId::parse(scopeText).has_value();
}

std::string joinScope(llvm::ArrayRef<llvm::StringRef> segments)
{
    std::string out;
    for (const auto segment : segments)
    {
        out += "/";
        out += segment.str();
    }
    return out;
}

}  // namespace

std::optional<ResourceId> ResourceId::parse(llvm::StringRef text)
{
    text = text.trim();
    if (text.empty() || text.front() != '/')
    {
        return std::nullopt;
    }
    if (text.size() > 1 && text.back() == '/')
    {
        text = text.drop_back();
    }

    Segments segments;
    text.drop_front().split(segments, '/', /*MaxSplit=*/-1, /*KeepEmpty=*/true);
    for (const auto segment : segments)
    {
        if (segment.empty())
        {
            return std::nullopt;
        }
    }

    ResourceId id;
    id.fullyQualifiedId_ = text.str();

    for (std::size_t p = segments.size(); p-- > 0;)
    {
        if (!isKeyword(segments[p], "providers"))
        {
            continue;
        }
        const std::size_t rest = segments.size() - p - 1;
        if (rest < 3 || rest % 2 == 0)
        {
            continue;
        }

        const llvm::ArrayRef<llvm::StringRef> scope(segments.data(), p);
        id.scope_ = joinScope(scope);
        if (!isValidScope(scope, id.scope_))
        {
            return std::nullopt;
        }
        id.providerNamespace_ = segments[p + 1].str();
        for (std::size_t i = p + 2; i + 1 < segments.size(); i += 2)
        {
            id.typeSegments_.push_back(segments[i].str());
            id.nameHierarchy_.push_back(segments[i + 1].str());
        }
        return id;
    }

    if (segments.size() == 2 && isKeyword(segments[0], "subscriptions"))
    {
        id.providerNamespace_ = "Microsoft.Resources";
        id.typeSegments_      = {"subscriptions"};
        id.nameHierarchy_     = {segments[1].str()};
        return id;
    }
    if (segments.size() == 4 && isKeyword(segments[0], "subscriptions") && isKeyword(segments[2], "resourceGroups"))
    {
        id.scope_             = joinScope(llvm::ArrayRef<llvm::StringRef>(segments.data(), 2));
        id.providerNamespace_ = "Microsoft.Resources";
        id.typeSegments_      = {"resourceGroups"};
        id.nameHierarchy_     = {segments[3].str()};
        return id;
    }
    return std::nullopt;
}

std::string ResourceId::fullyQualifiedType() const
{
    std::string out = providerNamespace_;
    for (const auto& segment : typeSegments_)
    {
        out += "/";
        out += segment;
    }
    return out;
}

}  // namespace llvmbicep
