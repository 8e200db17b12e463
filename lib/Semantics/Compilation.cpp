//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements whole-document compilation.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Semantics/Compilation.h"

#include "llvmbicep/Frontend/Parser.h"
#include "llvmbicep/Semantics/SemanticModel.h"

namespace llvmbicep
{

std::shared_ptr<const Compilation> compileDocument(std::string                                uri,
                                                   llvm::StringRef                            text,
                                                   std::shared_ptr<const ResourceTypeCatalog> catalog,
                                                   std::shared_ptr<const FileResolver>        fileResolver,
                                                   Configuration                              configuration)
{
    auto compilation           = std::make_shared<Compilation>();
    compilation->uri           = std::move(uri);
    compilation->program       = parseProgram(text);
    compilation->catalog       = std::move(catalog);
    compilation->fileResolver  = std::move(fileResolver);
    compilation->configuration = std::move(configuration);

    compilation->diagnostics = compilation->program.diagnostics;
    const SemanticModel model =
        SemanticModel::analyze(compilation->program, compilation->catalog, compilation->fileResolver, compilation->configuration);
    compilation->diagnostics.insert(compilation->diagnostics.end(), model.diagnostics().begin(), model.diagnostics().end());
    return compilation;
}

}  // namespace llvmbicep
