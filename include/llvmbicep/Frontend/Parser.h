//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Parser declarations for constructing Bicep syntax trees from token streams.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_FRONTEND_PARSER_H
#define LLVMBICEP_FRONTEND_PARSER_H

#include "llvmbicep/Frontend/Lexer.h"
#include "llvmbicep/Frontend/Syntax.h"
#include "llvmbicep/Support/Diagnostics.h"

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace llvmbicep
{

/// @brief Parses a token stream into Bicep top-level declarations.
///
/// The parser is tolerant: syntax errors are reported through the diagnostic
/// engine and parsing resumes at the next line boundary.
class Parser final
{
public:
    /// @brief Constructs a parser over one document's tokens.
    /// @param[in] tokens Token stream terminated by @ref TokenKind::EndOfFile.
    /// @param[in,out] diagnostics Diagnostic sink for parse errors.
    Parser(std::vector<Token> tokens, DiagnosticEngine& diagnostics);

    /// @brief Parses all top-level statements.
    /// @return Resource declarations in document order.
    std::vector<SyntaxPtr> parseDeclarations();

private:
    const Token& current() const;
    const Token& previous() const;
    bool         isAtEnd() const;
    bool         check(TokenKind kind) const;
    bool         match(TokenKind kind);
    bool         matchAny(std::initializer_list<TokenKind> kinds);
    const Token& advance();

    /// @brief Enforces the next token kind and emits a diagnostic on mismatch.
    bool expect(TokenKind kind, const std::string& what);

    /// @brief Skips newline tokens.
    void skipNewLines();

    /// @brief Error recovery that advances past the rest of the line, honouring bracket nesting.
    void syncToNextLine();

    /// @brief Error recovery inside `{}`/`[]` that stops before the next item separator or `closing`.
    void syncToItemEnd(TokenKind closing);

    /// @brief Parses `resource <name> '<type>' [existing] = <expr>`.
    SyntaxPtr parseResourceDeclaration();

    /// @brief Parses one expression, or returns null after reporting an error.
    SyntaxPtr parseExpression();

    SyntaxPtr parseObject();
    SyntaxPtr parseArray();
    SyntaxPtr parseObjectProperty();
    SyntaxPtr parseInteger(bool negative, std::size_t start);

    /// @brief Requires a newline, `}` or end of file after a statement.
    void expectStatementEnd();

    std::vector<Token> tokens_;
    std::size_t        cursor_{0};
    DiagnosticEngine&  diagnostics_;
};

/// @brief Lexes and parses one document.
/// @param[in] text Full document text.
/// @return Declarations plus every lexer and parser diagnostic.
[[nodiscard]] ProgramSyntax parseProgram(llvm::StringRef text);

}  // namespace llvmbicep

#endif  // LLVMBICEP_FRONTEND_PARSER_H
