//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <vector>

#include "llvmbicep/Semantics/ResourceTypes.h"
#include "llvmbicep/Semantics/TypeMatcher.h"

bool runTypeMatcherTests()
{
    const std::vector<llvmbicep::ResourceTypeReference> catalog{
        {"Microsoft.Storage/storageAccounts", "2021-09-01"},
        {"Microsoft.Storage/storageAccounts", "2023-01-01"},
        {"Microsoft.Storage/storageAccounts", "2023-05-01-preview"},
        {"Microsoft.Network/virtualNetworks", "2023-04-01"},
        {"microsoft.network/virtualnetworks", "2023-04-01"},
    };

    const auto storage = llvmbicep::matchResourceType(catalog, "microsoft.storage/STORAGEACCOUNTS");
    if (!storage || storage->fullyQualifiedType != "Microsoft.Storage/storageAccounts" ||
        storage->apiVersion != "2023-05-01-preview")
    {
        std::cerr << "expected newest storage version by case-insensitive type match\n";
        return false;
    }

    const auto network = llvmbicep::matchResourceType(catalog, "Microsoft.Network/virtualNetworks");
    if (!network || network->fullyQualifiedType != "Microsoft.Network/virtualNetworks")
    {
        std::cerr << "ties must keep the first catalog entry\n";
        return false;
    }

    if (llvmbicep::matchResourceType(catalog, "Microsoft.Network/virtualNetworks/subnets"))
    {
        std::cerr << "child types must not match their parent entries\n";
        return false;
    }

    if (llvmbicep::matchResourceType({}, "Microsoft.Storage/storageAccounts"))
    {
        std::cerr << "empty catalog must not match\n";
        return false;
    }

    const auto reference = llvmbicep::ResourceTypeReference::parse("Microsoft.Web/serverfarms@2022-09-01");
    if (!reference || reference->fullyQualifiedType != "Microsoft.Web/serverfarms" ||
        reference->apiVersion != "2022-09-01" || reference->formatName() != "Microsoft.Web/serverfarms@2022-09-01")
    {
        std::cerr << "type reference parse/format mismatch\n";
        return false;
    }
    if (llvmbicep::ResourceTypeReference::parse("Microsoft.Web/serverfarms@") ||
        llvmbicep::ResourceTypeReference::parse("@2022-09-01") ||
        llvmbicep::ResourceTypeReference::parse("Microsoft.Web/serverfarms"))
    {
        std::cerr << "malformed type references must be rejected\n";
        return false;
    }
    return true;
}
