//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// End-to-end materialization of a remote resource into a host document.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_MATERIALIZE_INSERT_RESOURCE_HANDLER_H
#define LLVMBICEP_MATERIALIZE_INSERT_RESOURCE_HANDLER_H

#include "llvmbicep/Materialize/Edit.h"
#include "llvmbicep/Materialize/ResourceFetcher.h"
#include "llvmbicep/Semantics/Compilation.h"
#include "llvmbicep/Support/Cancellation.h"
#include "llvmbicep/Support/TextSpan.h"
#include "llvmbicep/Transforms/Normalization.h"

#include "llvm/Support/Error.h"

#include <string>

namespace llvmbicep
{

/// @brief Request parameters.
struct InsertResourceParams final
{
    /// @brief Host document URI.
    std::string uri;

    /// @brief Caret position; the declaration is inserted here.
    Position position;

    /// @brief Remote resource identifier.
    std::string resourceId;
};

/// @brief Result of a request that did not fail.
enum class InsertResourceOutcome
{
    /// @brief The edit was handed to the applier.
    Applied,

    DocumentNotFound,
    InvalidResourceId,
    NoMatchingType,
    NoPayload,
};

/// @brief Returns a stable lowercase outcome name for logs and telemetry.
const char* insertResourceOutcomeName(InsertResourceOutcome outcome);

/// @brief Applies an edit to the live host document.
class EditApplier
{
public:
    virtual ~EditApplier() = default;

    virtual llvm::Error apply(const EditDescriptor& edit) = 0;
};

/// @brief Fetches, synthesizes, normalizes and inserts one resource declaration.
///
/// Every outcome other than @ref InsertResourceOutcome::Applied leaves the
/// document untouched; so does every error. The edit applier is called at most
/// once, after normalization has completed.
class InsertResourceHandler final
{
public:
    /// @param[in] compilations Source of request-scoped document snapshots.
    /// @param[in,out] fetcher Remote resource collaborator.
    /// @param[in,out] applier Host edit collaborator.
    /// @param[in] builder Semantic view constructor; null selects @ref DefaultSemanticViewBuilder.
    InsertResourceHandler(const CompilationProvider& compilations,
                          ResourceFetcher&           fetcher,
                          EditApplier&               applier,
                          const SemanticViewBuilder* builder = nullptr);

    /// @brief Runs one request.
    /// @return Outcome, or the first structural, fetch, normalization,
    ///         cancellation or edit application error.
    llvm::Expected<InsertResourceOutcome> handle(const InsertResourceParams& params,
                                                 const CancellationToken&    cancellation);

private:
    const CompilationProvider& compilations_;
    ResourceFetcher&           fetcher_;
    EditApplier&               applier_;
    DefaultSemanticViewBuilder defaultBuilder_;
    const SemanticViewBuilder& builder_;
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_MATERIALIZE_INSERT_RESOURCE_HANDLER_H
