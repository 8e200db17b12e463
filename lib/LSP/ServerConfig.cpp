//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements server configuration updates from LSP notifications.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/LSP/ServerConfig.h"

#include <cstdint>
#include <optional>

namespace llvmbicep::lsp
{
namespace
{

void applyTraceLevel(const llvm::json::Object& settings, ServerConfig& config)
{
    if (const auto rawTrace = settings.getString("trace"))
    {
        if (rawTrace->equals_insensitive("off"))
        {
            config.traceLevel = TraceLevel::Off;
        }
        else if (rawTrace->equals_insensitive("verbose"))
        {
            config.traceLevel = TraceLevel::Verbose;
        }
        else
        {
            config.traceLevel = TraceLevel::Basic;
        }
    }
}

void applyNestedBoolean(const llvm::json::Object& settings, llvm::StringRef key, llvm::StringRef field, bool& outValue)
{
    const auto* nestedValue = settings.get(key);
    if (!nestedValue)
    {
        return;
    }

    const auto* nested = nestedValue->getAsObject();
    if (!nested)
    {
        return;
    }

    if (const auto parsed = nested->getBoolean(field))
    {
        outValue = *parsed;
    }
}

void applyFormattingConfig(const llvm::json::Object& settings, PrettyPrintOptions& formatting)
{
    const auto* formattingValue = settings.get("formatting");
    if (!formattingValue)
    {
        return;
    }
    const auto* object = formattingValue->getAsObject();
    if (!object)
    {
        return;
    }

    if (const auto newline = object->getString("newline"))
    {
        if (newline->equals_insensitive("crlf"))
        {
            formatting.newline = NewlineOption::CRLF;
        }
        else if (newline->equals_insensitive("lf"))
        {
            formatting.newline = NewlineOption::LF;
        }
    }

    if (const auto indentKind = object->getString("indentKind"))
    {
        if (indentKind->equals_insensitive("tab"))
        {
            formatting.indentKind = IndentKindOption::Tab;
        }
        else if (indentKind->equals_insensitive("space"))
        {
            formatting.indentKind = IndentKindOption::Space;
        }
    }

    if (const auto indentSize = object->getInteger("indentSize"))
    {
        if (*indentSize >= 0 && *indentSize <= 16)
        {
            formatting.indentSize = static_cast<unsigned>(*indentSize);
        }
    }

    if (const auto insertFinalNewline = object->getBoolean("insertFinalNewline"))
    {
        formatting.insertFinalNewline = *insertFinalNewline;
    }
}

}  // namespace

void applySettings(const llvm::json::Object& settings, ServerConfig& config)
{
    if (const auto typeCatalogPath = settings.getString("typeCatalogPath"))
    {
        config.typeCatalogPath = typeCatalogPath->str();
    }

    if (const auto includeBuiltinTypes = settings.getBoolean("includeBuiltinTypes"))
    {
        config.includeBuiltinTypes = *includeBuiltinTypes;
    }

    if (const auto resourceSnapshotDir = settings.getString("resourceSnapshotDir"))
    {
        config.resourceSnapshotDir = resourceSnapshotDir->str();
    }

    applyFormattingConfig(settings, config.compilation.formatting);
    applyNestedBoolean(settings, "diagnostics", "unknownProperties", config.compilation.reportUnknownProperties);
    applyTraceLevel(settings, config);
}

bool applyDidChangeConfiguration(const llvm::json::Value& params, ServerConfig& config)
{
    const auto* paramsObject = params.getAsObject();
    if (!paramsObject)
    {
        return false;
    }

    const auto* settingsValue = paramsObject->get("settings");
    if (!settingsValue)
    {
        return false;
    }

    const auto* settings = settingsValue->getAsObject();
    if (!settings)
    {
        return false;
    }

    applySettings(*settings, config);
    return true;
}

const char* traceLevelName(const TraceLevel level)
{
    switch (level)
    {
    case TraceLevel::Off:
        return "off";
    case TraceLevel::Basic:
        return "basic";
    case TraceLevel::Verbose:
        return "verbose";
    }
    return "basic";
}

}  // namespace llvmbicep::lsp
