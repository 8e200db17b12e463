//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements resource declaration synthesis.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Materialize/DeclarationSynthesis.h"

#include "llvmbicep/Frontend/SyntaxFactory.h"
#include "llvmbicep/Materialize/ValueLowering.h"

#include "llvm/ADT/StringExtras.h"

namespace llvmbicep
{

std::string sanitizeIdentifier(llvm::StringRef name)
{
    std::string out;
    out.reserve(name.size());
    for (const char c : name)
    {
        if (llvm::isAlpha(c))
        {
            out.push_back(c);
        }
    }
    return out;
}

llvm::Expected<SyntaxPtr> synthesizeResourceDeclaration(const ResourceId&            resourceId,
                                                        const ResourceTypeReference& type,
                                                        const JsonValue&             body)
{
    auto lowered = lowerJsonValue(body);
    if (!lowered)
    {
        return lowered.takeError();
    }

    const auto&       names = resourceId.nameHierarchy();
    const std::string name  = names.empty() ? std::string() : sanitizeIdentifier(names.back());
    return makeResourceDeclaration(name, type.formatName(), std::move(*lowered));
}

}  // namespace llvmbicep
