//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmbicep/LSP/ServerConfig.h"
#include "llvm/Support/JSON.h"

namespace
{

bool testDefaults()
{
    const llvmbicep::lsp::ServerConfig config;
    if (!config.typeCatalogPath.empty() || !config.includeBuiltinTypes || !config.resourceSnapshotDir.empty() ||
        config.traceLevel != llvmbicep::lsp::TraceLevel::Basic || !config.compilation.reportUnknownProperties ||
        config.compilation.formatting.indentSize != 2 ||
        config.compilation.formatting.newline != llvmbicep::NewlineOption::LF)
    {
        std::cerr << "unexpected server configuration defaults\n";
        return false;
    }
    return true;
}

bool testApplySettings()
{
    llvmbicep::lsp::ServerConfig config;
    const llvm::json::Object     settings{
        {"typeCatalogPath", "/etc/bicep/types.json"},
        {"includeBuiltinTypes", false},
        {"resourceSnapshotDir", "/var/cache/bicep"},
        {"formatting",
         llvm::json::Object{{"newline", "CRLF"}, {"indentKind", "tab"}, {"indentSize", 4}, {"insertFinalNewline", true}}},
        {"diagnostics", llvm::json::Object{{"unknownProperties", false}}},
        {"trace", "verbose"},
    };
    llvmbicep::lsp::applySettings(settings, config);

    const auto& formatting = config.compilation.formatting;
    if (config.typeCatalogPath != "/etc/bicep/types.json" || config.includeBuiltinTypes ||
        config.resourceSnapshotDir != "/var/cache/bicep" || formatting.newline != llvmbicep::NewlineOption::CRLF ||
        formatting.indentKind != llvmbicep::IndentKindOption::Tab || formatting.indentSize != 4 ||
        !formatting.insertFinalNewline || config.compilation.reportUnknownProperties ||
        config.traceLevel != llvmbicep::lsp::TraceLevel::Verbose)
    {
        std::cerr << "settings were not applied\n";
        return false;
    }

    llvmbicep::lsp::applySettings(llvm::json::Object{{"formatting", llvm::json::Object{{"indentSize", 99}}},
                                                     {"trace", "off"}},
                                  config);
    if (formatting.indentSize != 4 || config.traceLevel != llvmbicep::lsp::TraceLevel::Off)
    {
        std::cerr << "out-of-range indent size must be ignored\n";
        return false;
    }
    if (std::string(llvmbicep::lsp::traceLevelName(config.traceLevel)) != "off")
    {
        std::cerr << "unexpected trace level name\n";
        return false;
    }
    return true;
}

bool testDidChangeConfiguration()
{
    llvmbicep::lsp::ServerConfig config;
    if (llvmbicep::lsp::applyDidChangeConfiguration(llvm::json::Object{{"other", 1}}, config) ||
        llvmbicep::lsp::applyDidChangeConfiguration(llvm::json::Value(nullptr), config))
    {
        std::cerr << "didChangeConfiguration without settings must be rejected\n";
        return false;
    }
    if (!llvmbicep::lsp::applyDidChangeConfiguration(
            llvm::json::Object{{"settings", llvm::json::Object{{"trace", "bogus"}, {"includeBuiltinTypes", "no"}}}},
            config) ||
        config.traceLevel != llvmbicep::lsp::TraceLevel::Basic || !config.includeBuiltinTypes)
    {
        std::cerr << "unknown values must fall back without changing typed settings\n";
        return false;
    }
    return true;
}

}  // namespace

bool runLspServerConfigTests()
{
    bool ok = true;
    ok      = testDefaults() && ok;
    ok      = testApplySettings() && ok;
    ok      = testDidChangeConfiguration() && ok;
    return ok;
}
