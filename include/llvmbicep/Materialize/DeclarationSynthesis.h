//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Construction of resource declarations from fetched payloads.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_MATERIALIZE_DECLARATION_SYNTHESIS_H
#define LLVMBICEP_MATERIALIZE_DECLARATION_SYNTHESIS_H

#include "llvmbicep/Frontend/Syntax.h"
#include "llvmbicep/Materialize/ResourceId.h"
#include "llvmbicep/Semantics/ResourceTypes.h"
#include "llvmbicep/Support/JsonValue.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace llvmbicep
{

/// @brief Keeps only ASCII letters of `name`; the result may be empty.
[[nodiscard]] std::string sanitizeIdentifier(llvm::StringRef name);

/// @brief Builds `resource <name> '<type>@<version>' = <body>`.
///
/// The symbolic name is the sanitized last segment of the identifier's name
/// hierarchy. The declaration never carries the `existing` modifier.
///
/// @param[in] resourceId Remote resource identifier.
/// @param[in] type Matched catalog entry.
/// @param[in] body Remote resource payload.
/// @return Declaration, or @ref SynthesisError when the payload cannot be lowered.
llvm::Expected<SyntaxPtr> synthesizeResourceDeclaration(const ResourceId&            resourceId,
                                                        const ResourceTypeReference& type,
                                                        const JsonValue&             body);

}  // namespace llvmbicep

#endif  // LLVMBICEP_MATERIALIZE_DECLARATION_SYNTHESIS_H
