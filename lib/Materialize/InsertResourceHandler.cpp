//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the insert-resource pipeline.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Materialize/InsertResourceHandler.h"

#include "llvmbicep/Materialize/DeclarationSynthesis.h"
#include "llvmbicep/Materialize/ResourceId.h"
#include "llvmbicep/Semantics/TypeMatcher.h"
#include "llvmbicep/Support/JsonValue.h"

namespace llvmbicep
{

const char* insertResourceOutcomeName(const InsertResourceOutcome outcome)
{
    switch (outcome)
    {
    case InsertResourceOutcome::Applied:
        return "applied";
    case InsertResourceOutcome::DocumentNotFound:
        return "document_not_found";
    case InsertResourceOutcome::InvalidResourceId:
        return "invalid_resource_id";
    case InsertResourceOutcome::NoMatchingType:
        return "no_matching_type";
    case InsertResourceOutcome::NoPayload:
        return "no_payload";
    }
    return "unknown";
}

InsertResourceHandler::InsertResourceHandler(const CompilationProvider& compilations,
                                             ResourceFetcher&           fetcher,
                                             EditApplier&               applier,
                                             const SemanticViewBuilder* builder)
    : compilations_(compilations)
    , fetcher_(fetcher)
    , applier_(applier)
    , builder_(builder ? *builder : defaultBuilder_)
{
}

llvm::Expected<InsertResourceOutcome> InsertResourceHandler::handle(const InsertResourceParams& params,
                                                                    const CancellationToken&    cancellation)
{
    const auto context = compilations_.getCompilation(params.uri);
    if (!context || !context->compilation)
    {
        return InsertResourceOutcome::DocumentNotFound;
    }

    const auto resourceId = ResourceId::parse(params.resourceId);
    if (!resourceId)
    {
        return InsertResourceOutcome::InvalidResourceId;
    }

    const Compilation& compilation = *context->compilation;
    if (!compilation.catalog)
    {
        return InsertResourceOutcome::NoMatchingType;
    }
    const auto matchedType = matchResourceType(compilation.catalog->availableTypes(), resourceId->fullyQualifiedType());
    if (!matchedType)
    {
        return InsertResourceOutcome::NoMatchingType;
    }

    auto payload = fetcher_.fetch(*resourceId, cancellation);
    if (!payload)
    {
        return payload.takeError();
    }
    if (!*payload)
    {
        return InsertResourceOutcome::NoPayload;
    }

    auto body = parseOrderedJson(**payload);
    if (!body)
    {
        return body.takeError();
    }

    auto declaration = synthesizeResourceDeclaration(*resourceId, *matchedType, *body);
    if (!declaration)
    {
        return declaration.takeError();
    }

    const std::size_t offset = context->lineStarts.offsetOf(params.position);

    auto text = normalizeDeclaration(compilation, *declaration, builder_, cancellation);
    if (!text)
    {
        return text.takeError();
    }

    const EditDescriptor edit = makeInsertionEdit(context->uri, context->lineStarts, offset, std::move(*text));
    if (auto error = applier_.apply(edit))
    {
        return std::move(error);
    }
    return InsertResourceOutcome::Applied;
}

}  // namespace llvmbicep
