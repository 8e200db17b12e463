//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Token and lexer declarations for transforming Bicep text into token streams.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_FRONTEND_LEXER_H
#define LLVMBICEP_FRONTEND_LEXER_H

#include "llvmbicep/Frontend/Syntax.h"
#include "llvmbicep/Support/Diagnostics.h"
#include "llvmbicep/Support/TextSpan.h"

#include <cstddef>
#include <string>
#include <vector>

namespace llvmbicep
{

/// @brief Single lexical token emitted by @ref Lexer.
struct Token
{
    /// @brief Token category.
    TokenKind kind{TokenKind::EndOfFile};

    /// @brief Original token spelling.
    std::string text;

    /// @brief Unescaped value for string tokens; equal to `text` otherwise.
    std::string value;

    /// @brief Source span of the token.
    TextSpan span;
};

/// @brief Converts Bicep source text into a token stream.
///
/// Whitespace and comments are dropped; line breaks are kept as
/// @ref TokenKind::NewLine tokens because they separate statements and
/// object/array items.
class Lexer final
{
public:
    /// @brief Constructs a lexer for one document.
    /// @param[in] text Full source text to tokenize.
    /// @param[in,out] diagnostics Sink for lexical errors.
    Lexer(std::string text, DiagnosticEngine& diagnostics);

    /// @brief Tokenizes the input source.
    /// @return Token sequence terminated by @ref TokenKind::EndOfFile.
    [[nodiscard]] std::vector<Token> lex();

private:
    /// @brief Returns true when all input characters are consumed.
    [[nodiscard]] bool isAtEnd() const;

    /// @brief Peeks at the current or lookahead character without consuming it.
    [[nodiscard]] char peek(std::size_t lookahead = 0) const;

    /// @brief Consumes and returns the next character.
    char advance();

    /// @brief Emits one token covering `[start, index_)`.
    void emit(TokenKind kind, std::size_t start, std::string value);

    void lexIdentifierOrKeyword(std::size_t start);
    void lexInteger(std::size_t start);
    void lexString(std::size_t start);
    void skipBlockComment(std::size_t start);

    /// @brief Decodes one escape sequence after the backslash into `out`.
    void lexEscape(std::size_t escapeStart, std::string& out);

    std::string        text_;
    std::size_t        index_{0};
    DiagnosticEngine&  diagnostics_;
    std::vector<Token> tokens_;
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_FRONTEND_LEXER_H
