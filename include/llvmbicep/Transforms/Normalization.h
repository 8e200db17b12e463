//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Bounded recase/prune loop that normalizes a synthesized declaration against its schema.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_TRANSFORMS_NORMALIZATION_H
#define LLVMBICEP_TRANSFORMS_NORMALIZATION_H

#include "llvmbicep/Frontend/Syntax.h"
#include "llvmbicep/Semantics/Compilation.h"
#include "llvmbicep/Semantics/SemanticModel.h"
#include "llvmbicep/Support/Cancellation.h"

#include "llvm/Support/Error.h"

#include <memory>
#include <string>

namespace llvmbicep
{

/// @brief Number of (recase, prune) rounds; the loop always runs all of them.
inline constexpr unsigned kMaxNormalizationIterations = 5;

/// @brief Builds semantic views for the normalization loop.
class SemanticViewBuilder
{
public:
    virtual ~SemanticViewBuilder() = default;

    /// @brief Builds a view of `program` in the context of `prior`.
    virtual llvm::Expected<SemanticModel> build(const Compilation&                  prior,
                                                ProgramSyntax                       program,
                                                std::shared_ptr<const FileResolver> fileResolver,
                                                const Configuration&                configuration) const = 0;
};

/// @brief Builds views with @ref SemanticModel::create.
class DefaultSemanticViewBuilder final : public SemanticViewBuilder
{
public:
    llvm::Expected<SemanticModel> build(const Compilation&                  prior,
                                        ProgramSyntax                       program,
                                        std::shared_ptr<const FileResolver> fileResolver,
                                        const Configuration&                configuration) const override;
};

/// @brief Normalizes one declaration and renders it.
///
/// The declaration is printed and re-parsed as a single-declaration document.
/// Each of the @ref kMaxNormalizationIterations rounds then builds a view,
/// applies the casing fixer, re-prints and re-parses, builds a fresh view,
/// applies read-only removal, and re-prints and re-parses again. Cancellation
/// is checked at the top of every round.
///
/// @param[in] prior Compilation of the host document; supplies catalog, resolver and formatting.
/// @param[in] declaration Synthesized declaration.
/// @param[in] builder Semantic view constructor.
/// @param[in] cancellation Cancellation token.
/// @return Final text, @ref NormalizationError when a view or an intermediate
///         document fails, or @ref OperationCancelledError.
llvm::Expected<std::string> normalizeDeclaration(const Compilation&         prior,
                                                 const SyntaxPtr&           declaration,
                                                 const SemanticViewBuilder& builder,
                                                 const CancellationToken&   cancellation);

}  // namespace llvmbicep

#endif  // LLVMBICEP_TRANSFORMS_NORMALIZATION_H
