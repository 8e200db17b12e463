//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Schema binding of a Bicep program against the resource type catalog.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SEMANTICS_SEMANTIC_MODEL_H
#define LLVMBICEP_SEMANTICS_SEMANTIC_MODEL_H

#include "llvmbicep/Frontend/Syntax.h"
#include "llvmbicep/Semantics/Compilation.h"
#include "llvmbicep/Semantics/FileResolver.h"
#include "llvmbicep/Semantics/ResourceTypes.h"
#include "llvmbicep/Support/Diagnostics.h"

#include "llvm/Support/Error.h"

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace llvmbicep
{

/// @brief Resource declaration resolved against the catalog.
struct ResourceBinding final
{
    /// @brief Declaration node inside the model's program.
    const SyntaxNode* declaration{nullptr};

    /// @brief Parsed type string; unset when the string is malformed.
    std::optional<ResourceTypeReference> reference;

    /// @brief Body schema; null when the type is unknown.
    TypePtr bodyType;
};

/// @brief Derived view of one program: which schema type and property each node is bound to.
///
/// The model owns the program it describes, so node pointers stay valid for
/// the model's lifetime.
class SemanticModel final
{
public:
    /// @brief Builds a view of `program` in the context of a prior compilation.
    ///
    /// The prior compilation contributes its resource type catalog.
    ///
    /// @return Model, or an error when `program` has syntax errors or the prior
    ///         compilation carries no catalog.
    static llvm::Expected<SemanticModel> create(const Compilation&                   prior,
                                                ProgramSyntax                        program,
                                                std::shared_ptr<const FileResolver>  fileResolver,
                                                const Configuration&                 configuration);

    /// @brief Binds `program` without validating it; unknown constructs become diagnostics.
    static SemanticModel analyze(ProgramSyntax                              program,
                                 std::shared_ptr<const ResourceTypeCatalog> catalog,
                                 std::shared_ptr<const FileResolver>        fileResolver,
                                 const Configuration&                       configuration);

    [[nodiscard]] const ProgramSyntax& program() const
    {
        return program_;
    }

    [[nodiscard]] const std::vector<ResourceBinding>& resources() const
    {
        return resources_;
    }

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

    [[nodiscard]] const std::shared_ptr<const FileResolver>& fileResolver() const
    {
        return fileResolver_;
    }

    /// @brief Returns the schema type expected for `expression`, or null when unbound.
    [[nodiscard]] TypePtr declaredTypeOf(const SyntaxNode& expression) const;

    /// @brief Returns the schema property an ObjectProperty node is bound to, or null.
    [[nodiscard]] const TypeProperty* propertyOf(const SyntaxNode& objectProperty) const;

private:
    SemanticModel() = default;

    void bindExpression(const SyntaxNode& expression,
                        const TypePtr&    type,
                        bool              reportUnknown,
                        DiagnosticEngine& diagnostics);

    ProgramSyntax                                              program_;
    std::shared_ptr<const ResourceTypeCatalog>                 catalog_;
    std::shared_ptr<const FileResolver>                        fileResolver_;
    std::vector<ResourceBinding>                               resources_;
    std::unordered_map<const SyntaxNode*, TypePtr>             expressionTypes_;
    std::unordered_map<const SyntaxNode*, const TypeProperty*> propertySymbols_;
    std::vector<Diagnostic>                                    diagnostics_;
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_SEMANTICS_SEMANTIC_MODEL_H
