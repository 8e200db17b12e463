//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements read-only property removal.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Transforms/ReadOnlyPropertyRemoval.h"

namespace llvmbicep
{

SyntaxPtr ReadOnlyPropertyRemoval::rewriteObjectProperty(const SyntaxPtr& property, const SyntaxPtr& value)
{
    const TypeProperty* symbol = model_.propertyOf(*property);
    if (symbol && symbol->isReadOnly())
    {
        return nullptr;
    }
    return SyntaxRewriter::rewriteObjectProperty(property, value);
}

}  // namespace llvmbicep
