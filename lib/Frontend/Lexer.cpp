//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements lexical analysis for Bicep source text.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Frontend/Lexer.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ConvertUTF.h"

#include <cctype>

namespace llvmbicep
{

Lexer::Lexer(std::string text, DiagnosticEngine& diagnostics)
    : text_(std::move(text))
    , diagnostics_(diagnostics)
{
}

bool Lexer::isAtEnd() const
{
    return index_ >= text_.size();
}

char Lexer::peek(std::size_t lookahead) const
{
    const std::size_t i = index_ + lookahead;
    return i < text_.size() ? text_[i] : '\0';
}

char Lexer::advance()
{
    if (isAtEnd())
    {
        return '\0';
    }
    return text_[index_++];
}

void Lexer::emit(TokenKind kind, std::size_t start, std::string value)
{
    tokens_.push_back(Token{kind, text_.substr(start, index_ - start), std::move(value), TextSpan{start, index_ - start}});
}

void Lexer::lexIdentifierOrKeyword(std::size_t start)
{
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
    {
        (void) advance();
    }

    const std::string text = text_.substr(start, index_ - start);
    if (text == "true")
    {
        emit(TokenKind::TrueKeyword, start, text);
        return;
    }
    if (text == "false")
    {
        emit(TokenKind::FalseKeyword, start, text);
        return;
    }
    if (text == "null")
    {
        emit(TokenKind::NullKeyword, start, text);
        return;
    }
    emit(TokenKind::Identifier, start, text);
}

void Lexer::lexInteger(std::size_t start)
{
    while (std::isdigit(static_cast<unsigned char>(peek())))
    {
        (void) advance();
    }
    emit(TokenKind::Integer, start, text_.substr(start, index_ - start));
}

void Lexer::lexEscape(std::size_t escapeStart, std::string& out)
{
    const char esc = advance();
    switch (esc)
    {
    case 'n':
        out.push_back('\n');
        return;
    case 'r':
        out.push_back('\r');
        return;
    case 't':
        out.push_back('\t');
        return;
    case '\\':
    case '\'':
    case '$':
        out.push_back(esc);
        return;
    case 'u':
        if (peek() == '{')
        {
            (void) advance();
            unsigned    codePoint = 0;
            std::size_t digits    = 0;
            while (llvm::isHexDigit(peek()) && digits < 6)
            {
                codePoint = codePoint * 16 + llvm::hexDigitValue(advance());
                ++digits;
            }
            if (digits > 0 && peek() == '}' && codePoint <= 0x10FFFF)
            {
                (void) advance();
                char  buffer[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
                char* cursor = buffer;
                if (llvm::ConvertCodePointToUTF8(codePoint, cursor))
                {
                    out.append(buffer, cursor);
                    return;
                }
            }
        }
        break;
    default:
        break;
    }
    diagnostics_.error(TextSpan{escapeStart, index_ - escapeStart},
                       "BCP006",
                       "The specified escape sequence is not recognized. Only the following escape sequences are "
                       "allowed: \\\\, \\', \\n, \\r, \\t, \\$, \\u{...}.");
}

void Lexer::lexString(std::size_t start)
{
    std::string value;
    (void) advance();
    while (!isAtEnd() && peek() != '\'' && peek() != '\n' && peek() != '\r')
    {
        const std::size_t at = index_;
        const char        c  = advance();
        if (c == '\\' && !isAtEnd())
        {
            lexEscape(at, value);
            continue;
        }
        if (c == '$' && peek() == '{')
        {
            diagnostics_.error(TextSpan{at, 2}, "BCP011", "String interpolation is not supported in this context.");
        }
        value.push_back(c);
    }

    if (peek() == '\'')
    {
        (void) advance();
    }
    else
    {
        diagnostics_.error(TextSpan{start, index_ - start},
                           isAtEnd() ? "BCP005" : "BCP004",
                           isAtEnd() ? "The string at this location is not terminated."
                                     : "The string at this location is not terminated due to an unexpected new line "
                                       "character.");
    }
    emit(TokenKind::StringComplete, start, std::move(value));
}

void Lexer::skipBlockComment(std::size_t start)
{
    (void) advance();
    (void) advance();
    while (!isAtEnd())
    {
        if (peek() == '*' && peek(1) == '/')
        {
            (void) advance();
            (void) advance();
            return;
        }
        (void) advance();
    }
    diagnostics_.error(TextSpan{start, index_ - start}, "BCP002", "The multi-line comment at this location is not terminated.");
}

std::vector<Token> Lexer::lex()
{
    while (!isAtEnd())
    {
        const std::size_t start = index_;
        const char        c     = peek();

        if (c == '\r' || c == '\n')
        {
            (void) advance();
            if (c == '\r' && peek() == '\n')
            {
                (void) advance();
            }
            emit(TokenKind::NewLine, start, "\n");
            continue;
        }
        if (c == ' ' || c == '\t')
        {
            (void) advance();
            continue;
        }
        if (c == '/' && peek(1) == '/')
        {
            while (!isAtEnd() && peek() != '\n' && peek() != '\r')
            {
                (void) advance();
            }
            continue;
        }
        if (c == '/' && peek(1) == '*')
        {
            skipBlockComment(start);
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
        {
            lexIdentifierOrKeyword(start);
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)))
        {
            lexInteger(start);
            continue;
        }
        if (c == '\'')
        {
            lexString(start);
            continue;
        }

        const TokenKind kind = [&]() {
            switch (c)
            {
            case '{':
                return TokenKind::LeftBrace;
            case '}':
                return TokenKind::RightBrace;
            case '[':
                return TokenKind::LeftSquare;
            case ']':
                return TokenKind::RightSquare;
            case '(':
                return TokenKind::LeftParen;
            case ')':
                return TokenKind::RightParen;
            case ':':
                return TokenKind::Colon;
            case ',':
                return TokenKind::Comma;
            case '.':
                return TokenKind::Dot;
            case '=':
                return TokenKind::Assignment;
            case '@':
                return TokenKind::At;
            case '-':
                return TokenKind::Minus;
            case '?':
                return TokenKind::Question;
            default:
                return TokenKind::Unrecognized;
            }
        }();

        (void) advance();
        if (kind == TokenKind::Unrecognized)
        {
            diagnostics_.error(TextSpan{start, 1},
                               "BCP001",
                               std::string("The following token is not recognized: \"") + c + "\".");
        }
        emit(kind, start, std::string(1, c));
    }

    emit(TokenKind::EndOfFile, index_, "");
    return tokens_;
}

}  // namespace llvmbicep
