//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Rewrite that restores schema casing of property names and enum values.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_TRANSFORMS_TYPE_CASING_FIXER_H
#define LLVMBICEP_TRANSFORMS_TYPE_CASING_FIXER_H

#include "llvmbicep/Semantics/SemanticModel.h"
#include "llvmbicep/Transforms/SyntaxRewriter.h"

namespace llvmbicep
{

/// @brief Renames object keys to the casing declared by the bound schema
/// property and recases string literals that match an enum value
/// case-insensitively.
class TypeCasingFixer final : public SyntaxRewriter
{
public:
    explicit TypeCasingFixer(const SemanticModel& model)
        : model_(model)
    {
    }

    /// @brief Rewrites the model's program.
    [[nodiscard]] ProgramSyntax rewriteProgram()
    {
        return rewrite(model_.program());
    }

protected:
    SyntaxPtr rewriteObjectProperty(const SyntaxPtr& property, const SyntaxPtr& value) override;
    SyntaxPtr rewriteStringLiteral(const SyntaxPtr& literal) override;

private:
    const SemanticModel& model_;
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_TRANSFORMS_TYPE_CASING_FIXER_H
