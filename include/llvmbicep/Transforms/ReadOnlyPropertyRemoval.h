//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Rewrite that drops properties the schema marks read-only.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_TRANSFORMS_READ_ONLY_PROPERTY_REMOVAL_H
#define LLVMBICEP_TRANSFORMS_READ_ONLY_PROPERTY_REMOVAL_H

#include "llvmbicep/Semantics/SemanticModel.h"
#include "llvmbicep/Transforms/SyntaxRewriter.h"

namespace llvmbicep
{

/// @brief Removes every object property bound to a read-only schema property.
class ReadOnlyPropertyRemoval final : public SyntaxRewriter
{
public:
    explicit ReadOnlyPropertyRemoval(const SemanticModel& model)
        : model_(model)
    {
    }

    [[nodiscard]] ProgramSyntax rewriteProgram()
    {
        return rewrite(model_.program());
    }

protected:
    SyntaxPtr rewriteObjectProperty(const SyntaxPtr& property, const SyntaxPtr& value) override;

private:
    const SemanticModel& model_;
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_TRANSFORMS_READ_ONLY_PROPERTY_REMOVAL_H
