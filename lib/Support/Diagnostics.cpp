//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection and formatting helpers.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Support/Diagnostics.h"

#include <utility>

namespace llvmbicep
{

const char* diagnosticLevelName(const DiagnosticLevel level)
{
    switch (level)
    {
    case DiagnosticLevel::Note:
        return "note";
    case DiagnosticLevel::Warning:
        return "warning";
    case DiagnosticLevel::Error:
        return "error";
    }
    return "error";
}

void DiagnosticEngine::report(DiagnosticLevel level, const TextSpan& span, std::string code, std::string message)
{
    diagnostics_.push_back(Diagnostic{level, span, std::move(code), std::move(message)});
}

void DiagnosticEngine::warning(const TextSpan& span, std::string code, std::string message)
{
    report(DiagnosticLevel::Warning, span, std::move(code), std::move(message));
}

void DiagnosticEngine::error(const TextSpan& span, std::string code, std::string message)
{
    report(DiagnosticLevel::Error, span, std::move(code), std::move(message));
}

bool DiagnosticEngine::hasErrors() const
{
    return containsErrors(diagnostics_);
}

std::vector<Diagnostic> DiagnosticEngine::take()
{
    std::vector<Diagnostic> out = std::move(diagnostics_);
    diagnostics_.clear();
    return out;
}

bool containsErrors(const std::vector<Diagnostic>& diagnostics)
{
    for (const Diagnostic& d : diagnostics)
    {
        if (d.level == DiagnosticLevel::Error)
        {
            return true;
        }
    }
    return false;
}

std::string describeFirstError(const std::vector<Diagnostic>& diagnostics)
{
    for (const Diagnostic& d : diagnostics)
    {
        if (d.level == DiagnosticLevel::Error)
        {
            return d.code + " " + d.span.str() + ": " + d.message;
        }
    }
    return {};
}

}  // namespace llvmbicep
