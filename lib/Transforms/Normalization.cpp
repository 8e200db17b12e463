//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the declaration normalization loop.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Transforms/Normalization.h"

#include "llvmbicep/Frontend/Parser.h"
#include "llvmbicep/Frontend/PrettyPrinter.h"
#include "llvmbicep/Support/Errors.h"
#include "llvmbicep/Transforms/ReadOnlyPropertyRemoval.h"
#include "llvmbicep/Transforms/TypeCasingFixer.h"

namespace llvmbicep
{
namespace
{

/// Prints `program` and parses the text back; rewrites run on re-parsed trees only.
llvm::Expected<ProgramSyntax> reprint(const ProgramSyntax&      program,
                                      const PrettyPrintOptions& options,
                                      unsigned                  iteration,
                                      const char*               stage)
{
    const std::string text     = printProgram(program, options);
    ProgramSyntax     reparsed = parseProgram(text);
    if (reparsed.hasErrors())
    {
        return llvm::make_error<NormalizationError>(iteration,
                                                    stage,
                                                    "generated text does not parse: " +
                                                        describeFirstError(reparsed.diagnostics));
    }
    return reparsed;
}

}  // namespace

llvm::Expected<SemanticModel> DefaultSemanticViewBuilder::build(const Compilation&                  prior,
                                                                 ProgramSyntax                       program,
                                                                 std::shared_ptr<const FileResolver> fileResolver,
                                                                 const Configuration&                configuration) const
{
    return SemanticModel::create(prior, std::move(program), std::move(fileResolver), configuration);
}

llvm::Expected<std::string> normalizeDeclaration(const Compilation&         prior,
                                                 const SyntaxPtr&           declaration,
                                                 const SemanticViewBuilder& builder,
                                                 const CancellationToken&   cancellation)
{
    const Configuration&      configuration = prior.configuration;
    const PrettyPrintOptions& options       = configuration.formatting;

    ProgramSyntax initial;
    initial.declarations.push_back(declaration);
    auto program = reprint(initial, options, 0, "print");
    if (!program)
    {
        return program.takeError();
    }

    for (unsigned iteration = 0; iteration < kMaxNormalizationIterations; ++iteration)
    {
        if (cancellation.isCancellationRequested())
        {
            return llvm::make_error<OperationCancelledError>();
        }

        auto recaseView = builder.build(prior, *program, prior.fileResolver, configuration);
        if (!recaseView)
        {
            return llvm::make_error<NormalizationError>(iteration, "recase", llvm::toString(recaseView.takeError()));
        }
        program = reprint(TypeCasingFixer(*recaseView).rewriteProgram(), options, iteration, "recase");
        if (!program)
        {
            return program.takeError();
        }

        auto pruneView = builder.build(prior, *program, prior.fileResolver, configuration);
        if (!pruneView)
        {
            return llvm::make_error<NormalizationError>(iteration, "prune", llvm::toString(pruneView.takeError()));
        }
        program = reprint(ReadOnlyPropertyRemoval(*pruneView).rewriteProgram(), options, iteration, "prune");
        if (!program)
        {
            return program.takeError();
        }
    }

    return printProgram(*program, options);
}

}  // namespace llvmbicep
