//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `bicep-materialize` offline tool.
///
/// The tool runs the insert-resource pipeline over local files: a saved
/// resource payload, optional extra type catalogs, and an optional host
/// document. It prints the normalized declaration, or the host document with
/// the declaration inserted at the caret.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Materialize/Edit.h"
#include "llvmbicep/Materialize/InsertResourceHandler.h"
#include "llvmbicep/Materialize/ResourceFetcher.h"
#include "llvmbicep/Semantics/Compilation.h"
#include "llvmbicep/Semantics/FileResolver.h"
#include "llvmbicep/Semantics/ResourceTypes.h"
#include "llvmbicep/Support/Cancellation.h"
#include "llvmbicep/Version.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{

/// @brief Checks whether a token is a help switch.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: bicep-materialize --resource-id <id> --payload <file> [options]\n"
                 << "Try: bicep-materialize --help\n";
}

void printHelp()
{
    llvm::errs()
        << "bicep-materialize " << llvmbicep::kVersionString << "\n\n"
        << "Converts a saved Azure resource payload into a normalized Bicep resource declaration.\n\n"
        << "REQUIRED\n"
        << "  --resource-id <id>\n"
        << "      Fully qualified resource identifier, e.g.\n"
        << "      /subscriptions/<sub>/resourceGroups/<rg>/providers/Microsoft.Storage/storageAccounts/<name>\n"
        << "  --payload <file>\n"
        << "      JSON body of the resource as returned by the management API.\n\n"
        << "CATALOG\n"
        << "  --types <file>\n"
        << "      Extra resource type catalog merged over the built-in catalog. Repeatable.\n"
        << "  --no-builtin-types\n"
        << "      Start from an empty catalog.\n\n"
        << "HOST DOCUMENT\n"
        << "  --document <file>\n"
        << "      Bicep file to insert into; the whole edited document is printed.\n"
        << "  --line <n>, --character <n>\n"
        << "      Zero-based caret position (default 0, 0).\n\n"
        << "FORMATTING\n"
        << "  --newline <lf|crlf>\n"
        << "  --indent-kind <space|tab>\n"
        << "  --indent-size <n>\n"
        << "  --insert-final-newline\n\n"
        << "EXIT STATUS\n"
        << "  0 when a declaration was produced, 2 when the request aborted without an edit\n"
        << "  (no matching type, unparsable identifier), 1 on errors or invalid CLI usage.\n";
}

/// @brief Serves one document from memory.
class SingleDocumentProvider final : public llvmbicep::CompilationProvider
{
public:
    SingleDocumentProvider(std::string                                   uri,
                           llvm::StringRef                               text,
                           std::shared_ptr<const llvmbicep::Compilation> compilation)
        : uri_(std::move(uri))
        , lineStarts_(llvmbicep::LineStarts::compute(text))
        , compilation_(std::move(compilation))
    {
    }

    [[nodiscard]] std::optional<llvmbicep::CompilationContext> getCompilation(llvm::StringRef uri) const override
    {
        if (uri != uri_)
        {
            return std::nullopt;
        }
        return llvmbicep::CompilationContext{uri_, lineStarts_, compilation_};
    }

private:
    std::string                                   uri_;
    llvmbicep::LineStarts                         lineStarts_;
    std::shared_ptr<const llvmbicep::Compilation> compilation_;
};

/// @brief Serves the payload file for every identifier.
class PayloadFileFetcher final : public llvmbicep::ResourceFetcher
{
public:
    explicit PayloadFileFetcher(std::string payload)
        : payload_(std::move(payload))
    {
    }

    llvm::Expected<std::optional<std::string>> fetch(const llvmbicep::ResourceId&,
                                                     const llvmbicep::CancellationToken&) override
    {
        return std::optional<std::string>(payload_);
    }

private:
    std::string payload_;
};

/// @brief Captures the single edit produced by the pipeline.
class CapturingEditApplier final : public llvmbicep::EditApplier
{
public:
    llvm::Error apply(const llvmbicep::EditDescriptor& edit) override
    {
        edit_ = edit;
        return llvm::Error::success();
    }

    [[nodiscard]] const std::optional<llvmbicep::EditDescriptor>& edit() const
    {
        return edit_;
    }

private:
    std::optional<llvmbicep::EditDescriptor> edit_;
};

/// @brief Emits host-document diagnostics to stderr.
void printDiagnostics(llvm::StringRef path, llvm::StringRef text, const llvmbicep::Compilation& compilation)
{
    const llvmbicep::LineStarts lineStarts = llvmbicep::LineStarts::compute(text);
    for (const auto& d : compilation.diagnostics)
    {
        llvm::StringRef level = "note";
        if (d.level == llvmbicep::DiagnosticLevel::Warning)
        {
            level = "warning";
        }
        else if (d.level == llvmbicep::DiagnosticLevel::Error)
        {
            level = "error";
        }
        const llvmbicep::Position position = lineStarts.positionOf(d.span.offset);
        llvm::errs() << path << ":" << (position.line + 1) << ":" << (position.character + 1) << ": " << level << ": "
                     << d.code << ": " << d.message << "\n";
    }
}

int fail(llvm::Error error)
{
    llvm::errs() << "[bicep-materialize] error: " << llvm::toString(std::move(error)) << "\n";
    return 1;
}

}  // namespace

/// @brief Program entry point for `bicep-materialize`.
///
/// @return Zero when a declaration was printed; see `--help` for other codes.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    std::string              resourceId;
    std::string              payloadPath;
    std::vector<std::string> typeCatalogs;
    bool                     includeBuiltinTypes = true;
    std::string              documentPath;
    llvmbicep::Position      caret;
    llvmbicep::Configuration configuration;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };
        auto requireNumber = [&](const std::string& name) -> std::uint32_t {
            const std::string value = requireValue(name);
            std::uint32_t     number = 0;
            if (llvm::StringRef(value).getAsInteger(10, number))
            {
                llvm::errs() << "Invalid " << name << " value: " << value << "\n";
                printUsage();
                std::exit(1);
            }
            return number;
        };

        if (isHelpToken(arg))
        {
            printHelp();
            return 0;
        }
        if (arg == "--version" || arg == "-V")
        {
            llvm::outs() << "bicep-materialize " << llvmbicep::kVersionString << "\n";
            return 0;
        }
        if (arg == "--resource-id")
        {
            resourceId = requireValue(arg);
        }
        else if (arg == "--payload")
        {
            payloadPath = requireValue(arg);
        }
        else if (arg == "--types")
        {
            typeCatalogs.push_back(requireValue(arg));
        }
        else if (arg == "--no-builtin-types")
        {
            includeBuiltinTypes = false;
        }
        else if (arg == "--document")
        {
            documentPath = requireValue(arg);
        }
        else if (arg == "--line")
        {
            caret.line = requireNumber(arg);
        }
        else if (arg == "--character")
        {
            caret.character = requireNumber(arg);
        }
        else if (arg == "--newline")
        {
            const auto value = requireValue(arg);
            if (value == "lf")
            {
                configuration.formatting.newline = llvmbicep::NewlineOption::LF;
            }
            else if (value == "crlf")
            {
                configuration.formatting.newline = llvmbicep::NewlineOption::CRLF;
            }
            else
            {
                llvm::errs() << "Invalid --newline value: " << value << "\n";
                printUsage();
                return 1;
            }
        }
        else if (arg == "--indent-kind")
        {
            const auto value = requireValue(arg);
            if (value == "space")
            {
                configuration.formatting.indentKind = llvmbicep::IndentKindOption::Space;
            }
            else if (value == "tab")
            {
                configuration.formatting.indentKind = llvmbicep::IndentKindOption::Tab;
            }
            else
            {
                llvm::errs() << "Invalid --indent-kind value: " << value << "\n";
                printUsage();
                return 1;
            }
        }
        else if (arg == "--indent-size")
        {
            configuration.formatting.indentSize = requireNumber(arg);
        }
        else if (arg == "--insert-final-newline")
        {
            configuration.formatting.insertFinalNewline = true;
        }
        else
        {
            llvm::errs() << "Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (resourceId.empty() || payloadPath.empty())
    {
        printUsage();
        return 1;
    }

    const auto resolver = std::make_shared<llvmbicep::FileSystemResolver>();

    auto catalog = std::make_shared<llvmbicep::ResourceTypeCatalog>();
    if (includeBuiltinTypes)
    {
        auto builtin = llvmbicep::loadBuiltinResourceTypeCatalog();
        if (!builtin)
        {
            return fail(builtin.takeError());
        }
        catalog->merge(*builtin);
    }
    for (const std::string& path : typeCatalogs)
    {
        auto text = resolver->readFile(path);
        if (!text)
        {
            return fail(text.takeError());
        }
        auto extra = llvmbicep::loadResourceTypeCatalog(*text, path);
        if (!extra)
        {
            return fail(extra.takeError());
        }
        catalog->merge(*extra);
    }

    auto payload = resolver->readFile(payloadPath);
    if (!payload)
    {
        return fail(payload.takeError());
    }

    std::string documentText;
    if (!documentPath.empty())
    {
        auto text = resolver->readFile(documentPath);
        if (!text)
        {
            return fail(text.takeError());
        }
        documentText = std::move(*text);
    }

    const std::string uri         = documentPath.empty() ? std::string("untitled:main.bicep") : documentPath;
    const auto        compilation = llvmbicep::compileDocument(uri, documentText, catalog, resolver, configuration);
    if (!documentPath.empty())
    {
        printDiagnostics(documentPath, documentText, *compilation);
    }

    SingleDocumentProvider           provider(uri, documentText, compilation);
    PayloadFileFetcher               fetcher(std::move(*payload));
    CapturingEditApplier             applier;
    llvmbicep::InsertResourceHandler handler(provider, fetcher, applier);
    llvmbicep::CancellationSource    cancellation;

    auto outcome = handler.handle(llvmbicep::InsertResourceParams{uri, caret, resourceId}, cancellation.token());
    if (!outcome)
    {
        return fail(outcome.takeError());
    }
    if (*outcome != llvmbicep::InsertResourceOutcome::Applied || !applier.edit())
    {
        llvm::errs() << "[bicep-materialize] no declaration produced: "
                     << llvmbicep::insertResourceOutcomeName(*outcome) << "\n";
        return 2;
    }

    if (documentPath.empty())
    {
        llvm::outs() << applier.edit()->newText << "\n";
    }
    else
    {
        llvm::outs() << llvmbicep::applyEdit(documentText, *applier.edit());
    }
    return 0;
}
