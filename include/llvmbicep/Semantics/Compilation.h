//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Immutable compiled-document snapshot and the provider interface that serves it.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SEMANTICS_COMPILATION_H
#define LLVMBICEP_SEMANTICS_COMPILATION_H

#include "llvmbicep/Frontend/PrettyPrinter.h"
#include "llvmbicep/Frontend/Syntax.h"
#include "llvmbicep/Semantics/FileResolver.h"
#include "llvmbicep/Semantics/ResourceTypes.h"
#include "llvmbicep/Support/Diagnostics.h"
#include "llvmbicep/Support/TextSpan.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llvmbicep
{

/// @brief Settings that influence compilation and generated text.
struct Configuration final
{
    /// @brief Formatting applied to generated declarations.
    PrettyPrintOptions formatting;

    /// @brief Warn about object properties the schema does not declare.
    bool reportUnknownProperties{true};
};

/// @brief One compiled document.
///
/// Every member is immutable after construction; request handlers share the
/// snapshot through `std::shared_ptr<const Compilation>`.
struct Compilation final
{
    std::string                                uri;
    ProgramSyntax                              program;
    std::shared_ptr<const ResourceTypeCatalog> catalog;
    std::shared_ptr<const FileResolver>        fileResolver;
    Configuration                              configuration;

    /// @brief Parse diagnostics followed by semantic diagnostics.
    std::vector<Diagnostic> diagnostics;
};

/// @brief Request-scoped capture of everything the materializer reads from a host document.
struct CompilationContext final
{
    std::string                        uri;
    LineStarts                         lineStarts;
    std::shared_ptr<const Compilation> compilation;
};

/// @brief Looks up the latest compilation of an open document.
class CompilationProvider
{
public:
    virtual ~CompilationProvider() = default;

    /// @return Snapshot of the document, or `std::nullopt` when it is not open.
    [[nodiscard]] virtual std::optional<CompilationContext> getCompilation(llvm::StringRef uri) const = 0;
};

/// @brief Parses and analyzes `text` into a compilation.
/// @param[in] uri Document URI.
/// @param[in] text Document text.
/// @param[in] catalog Resource type catalog.
/// @param[in] fileResolver Resolver shared with later semantic views.
/// @param[in] configuration Settings captured by the snapshot.
/// @return Compilation with parse and semantic diagnostics.
[[nodiscard]] std::shared_ptr<const Compilation> compileDocument(std::string                                uri,
                                                                 llvm::StringRef                            text,
                                                                 std::shared_ptr<const ResourceTypeCatalog> catalog,
                                                                 std::shared_ptr<const FileResolver> fileResolver,
                                                                 Configuration                       configuration);

}  // namespace llvmbicep

#endif  // LLVMBICEP_SEMANTICS_COMPILATION_H
