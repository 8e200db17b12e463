//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Canonical text rendering of Bicep syntax trees.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_FRONTEND_PRETTY_PRINTER_H
#define LLVMBICEP_FRONTEND_PRETTY_PRINTER_H

#include "llvmbicep/Frontend/Syntax.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace llvmbicep
{

/// @brief Line terminator emitted by the printer.
enum class NewlineOption
{
    LF,
    CRLF,
};

/// @brief Indentation unit emitted by the printer.
enum class IndentKindOption
{
    Space,
    Tab,
};

/// @brief Printer settings.
struct PrettyPrintOptions final
{
    NewlineOption    newline{NewlineOption::LF};
    IndentKindOption indentKind{IndentKindOption::Space};

    /// @brief Spaces per nesting level; ignored for tab indentation.
    unsigned indentSize{2};

    /// @brief Appends one line terminator after the last declaration.
    bool insertFinalNewline{false};
};

/// @brief Renders one node.
/// @param[in] node Any syntax node.
/// @param[in] options Formatting options.
/// @return Canonical text; deterministic for equal trees and options.
[[nodiscard]] std::string printSyntax(const SyntaxNode& node, const PrettyPrintOptions& options);

/// @brief Renders declarations separated by one blank line.
[[nodiscard]] std::string printDeclarations(const std::vector<SyntaxPtr>& declarations,
                                            const PrettyPrintOptions&     options);

/// @brief Renders a program's declarations.
[[nodiscard]] std::string printProgram(const ProgramSyntax& program, const PrettyPrintOptions& options);

/// @brief Returns `value` as a single-quoted Bicep string literal.
[[nodiscard]] std::string quoteStringLiteral(llvm::StringRef value);

}  // namespace llvmbicep

#endif  // LLVMBICEP_FRONTEND_PRETTY_PRINTER_H
