//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the type casing fixer.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Transforms/TypeCasingFixer.h"

#include "llvmbicep/Frontend/SyntaxFactory.h"

namespace llvmbicep
{

SyntaxPtr TypeCasingFixer::rewriteObjectProperty(const SyntaxPtr& property, const SyntaxPtr& value)
{
    const TypeProperty* symbol = model_.propertyOf(*property);
    if (!symbol || propertyKeyText(*property) == symbol->name)
    {
        return SyntaxRewriter::rewriteObjectProperty(property, value);
    }
    return makeObjectProperty(symbol->name, value);
}

SyntaxPtr TypeCasingFixer::rewriteStringLiteral(const SyntaxPtr& literal)
{
    const TypePtr type = model_.declaredTypeOf(*literal);
    if (!type || type->kind != TypeKind::StringEnum)
    {
        return literal;
    }
    const auto*        current = literal->as<SyntaxNode::StringLiteral>();
    const std::string* allowed = type->findAllowedValue(current->value);
    if (!allowed || *allowed == current->value)
    {
        return literal;
    }
    return makeStringLiteral(*allowed);
}

}  // namespace llvmbicep
