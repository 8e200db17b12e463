//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Structural conversion of JSON payloads into Bicep expression trees.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_MATERIALIZE_VALUE_LOWERING_H
#define LLVMBICEP_MATERIALIZE_VALUE_LOWERING_H

#include "llvmbicep/Frontend/Syntax.h"
#include "llvmbicep/Support/JsonValue.h"

#include "llvm/Support/Error.h"

namespace llvmbicep
{

/// @brief Lowers a JSON value to an expression.
///
/// Objects keep member order. Numbers that are integers within the 32-bit
/// signed range become integer literals; every other number becomes a string
/// literal holding the number's original text.
///
/// @param[in] value JSON value.
/// @return Expression tree, or @ref SynthesisError for an undefined value.
llvm::Expected<SyntaxPtr> lowerJsonValue(const JsonValue& value);

}  // namespace llvmbicep

#endif  // LLVMBICEP_MATERIALIZE_VALUE_LOWERING_H
