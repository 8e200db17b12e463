//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Base class for bottom-up rewrites over immutable syntax trees.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_TRANSFORMS_SYNTAX_REWRITER_H
#define LLVMBICEP_TRANSFORMS_SYNTAX_REWRITER_H

#include "llvmbicep/Frontend/Syntax.h"

namespace llvmbicep
{

/// @brief Rebuilds the path from every changed node to the root and shares untouched subtrees.
///
/// Subclasses override the hooks; a hook that returns its input unchanged
/// keeps the original node.
class SyntaxRewriter
{
public:
    virtual ~SyntaxRewriter() = default;

    /// @brief Rewrites every declaration of `program`; diagnostics are copied unchanged.
    [[nodiscard]] ProgramSyntax rewrite(const ProgramSyntax& program);

    /// @brief Rewrites one subtree.
    [[nodiscard]] SyntaxPtr rewriteNode(const SyntaxPtr& node);

protected:
    /// @brief Hook for an ObjectProperty whose value has already been rewritten.
    /// @param[in] property Original property node.
    /// @param[in] value Rewritten value; identical to the original value when unchanged.
    /// @return Replacement property, or null to drop the property.
    virtual SyntaxPtr rewriteObjectProperty(const SyntaxPtr& property, const SyntaxPtr& value);

    /// @brief Hook for a StringLiteral.
    virtual SyntaxPtr rewriteStringLiteral(const SyntaxPtr& literal);
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_TRANSFORMS_SYNTAX_REWRITER_H
