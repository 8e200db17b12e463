//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting used by the lexer, parser, and semantic model.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SUPPORT_DIAGNOSTICS_H
#define LLVMBICEP_SUPPORT_DIAGNOSTICS_H

#include "llvmbicep/Support/TextSpan.h"

#include <string>
#include <vector>

namespace llvmbicep
{

/// @file
/// @brief Diagnostic collection and reporting interfaces.

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Single diagnostic record.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Highlighted document span.
    TextSpan span;

    /// @brief Stable diagnostic code, e.g. `BCP007`.
    std::string code;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Returns the lowercase spelling of a diagnostic level.
const char* diagnosticLevelName(DiagnosticLevel level);

/// @brief Accumulates diagnostics in emission order.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] span Highlighted span.
    /// @param[in] code Stable diagnostic code.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const TextSpan& span, std::string code, std::string message);

    /// @brief Emits a warning-level diagnostic.
    void warning(const TextSpan& span, std::string code, std::string message);

    /// @brief Emits an error-level diagnostic.
    void error(const TextSpan& span, std::string code, std::string message);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Returns all recorded diagnostics in insertion order.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

    /// @brief Moves the recorded diagnostics out of the engine.
    [[nodiscard]] std::vector<Diagnostic> take();

private:
    std::vector<Diagnostic> diagnostics_;
};

/// @brief Returns true when any entry of `diagnostics` is an error.
[[nodiscard]] bool containsErrors(const std::vector<Diagnostic>& diagnostics);

/// @brief Formats the first error of `diagnostics` as `CODE [span]: message`.
/// @return Formatted text, or an empty string when there is no error.
[[nodiscard]] std::string describeFirstError(const std::vector<Diagnostic>& diagnostics);

}  // namespace llvmbicep

#endif  // LLVMBICEP_SUPPORT_DIAGNOSTICS_H
