//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements recursive-descent parsing for the Bicep frontend.
///
/// Only resource declarations are materialized into syntax trees; other
/// top-level statements are skipped with a warning so that surrounding
/// documents still compile.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Frontend/Parser.h"

#include "llvmbicep/Frontend/SyntaxFactory.h"

#include "llvm/ADT/StringSwitch.h"

#include <cstdint>

namespace llvmbicep
{
namespace
{

bool isSkippedStatementKeyword(llvm::StringRef text)
{
    return llvm::StringSwitch<bool>(text)
        .Cases("metadata", "param", "var", "output", "module", true)
        .Cases("targetScope", "import", "type", "func", "using", true)
        .Cases("extension", "provider", true)
        .Default(false);
}

bool isOpening(TokenKind kind)
{
    return kind == TokenKind::LeftBrace || kind == TokenKind::LeftSquare || kind == TokenKind::LeftParen;
}

bool isClosing(TokenKind kind)
{
    return kind == TokenKind::RightBrace || kind == TokenKind::RightSquare || kind == TokenKind::RightParen;
}

}  // namespace

Parser::Parser(std::vector<Token> tokens, DiagnosticEngine& diagnostics)
    : tokens_(std::move(tokens))
    , diagnostics_(diagnostics)
{
    if (tokens_.empty() || tokens_.back().kind != TokenKind::EndOfFile)
    {
        const std::size_t end = tokens_.empty() ? 0 : tokens_.back().span.end();
        tokens_.push_back(Token{TokenKind::EndOfFile, "", "", TextSpan{end, 0}});
    }
}

const Token& Parser::current() const
{
    return tokens_[cursor_];
}

const Token& Parser::previous() const
{
    return tokens_[cursor_ == 0 ? 0 : cursor_ - 1];
}

bool Parser::isAtEnd() const
{
    return current().kind == TokenKind::EndOfFile;
}

bool Parser::check(TokenKind kind) const
{
    return current().kind == kind;
}

bool Parser::match(TokenKind kind)
{
    if (!check(kind))
    {
        return false;
    }
    (void) advance();
    return true;
}

bool Parser::matchAny(std::initializer_list<TokenKind> kinds)
{
    for (const TokenKind kind : kinds)
    {
        if (match(kind))
        {
            return true;
        }
    }
    return false;
}

const Token& Parser::advance()
{
    if (!isAtEnd())
    {
        ++cursor_;
    }
    return previous();
}

bool Parser::expect(TokenKind kind, const std::string& what)
{
    if (check(kind))
    {
        (void) advance();
        return true;
    }
    diagnostics_.error(current().span, "BCP018", "Expected the " + what + " character at this location.");
    return false;
}

void Parser::skipNewLines()
{
    while (match(TokenKind::NewLine))
    {
    }
}

void Parser::syncToNextLine()
{
    std::size_t depth = 0;
    while (!isAtEnd())
    {
        if (depth == 0 && check(TokenKind::NewLine))
        {
            break;
        }
        if (isOpening(current().kind))
        {
            ++depth;
        }
        else if (isClosing(current().kind) && depth > 0)
        {
            --depth;
        }
        (void) advance();
    }
    skipNewLines();
}

void Parser::syncToItemEnd(TokenKind closing)
{
    std::size_t depth = 0;
    while (!isAtEnd())
    {
        if (depth == 0 && (check(TokenKind::NewLine) || check(TokenKind::Comma) || check(closing)))
        {
            return;
        }
        if (isOpening(current().kind))
        {
            ++depth;
        }
        else if (isClosing(current().kind) && depth > 0)
        {
            --depth;
        }
        (void) advance();
    }
}

std::vector<SyntaxPtr> Parser::parseDeclarations()
{
    std::vector<SyntaxPtr> declarations;
    skipNewLines();
    while (!isAtEnd())
    {
        if (check(TokenKind::Identifier) && current().text == "resource")
        {
            if (SyntaxPtr decl = parseResourceDeclaration())
            {
                declarations.push_back(std::move(decl));
            }
        }
        else if (check(TokenKind::At) || (check(TokenKind::Identifier) && isSkippedStatementKeyword(current().text)))
        {
            diagnostics_.warning(current().span, "BCM001", "This statement is not materialized and was skipped.");
            syncToNextLine();
        }
        else
        {
            diagnostics_.error(current().span,
                               "BCP007",
                               "This declaration type is not recognized. Specify a metadata, parameter, variable, "
                               "resource, or output declaration.");
            syncToNextLine();
        }
        skipNewLines();
    }
    return declarations;
}

SyntaxPtr Parser::parseResourceDeclaration()
{
    const Token& keyword = advance();

    SyntaxNode::ResourceDeclaration decl;
    decl.keyword = makeNode(keyword.span, SyntaxNode::Token{TokenKind::Identifier, keyword.text});

    if (!check(TokenKind::Identifier))
    {
        diagnostics_.error(current().span, "BCP017", "Expected a resource identifier at this location.");
        syncToNextLine();
        return nullptr;
    }
    const Token& name = advance();
    decl.name         = makeNode(name.span, SyntaxNode::Identifier{name.text});

    if (!check(TokenKind::StringComplete))
    {
        diagnostics_.error(current().span,
                           "BCP068",
                           "Expected a resource type string. Specify a valid resource type of format "
                           "\"<types>@<apiVersion>\".");
        syncToNextLine();
        return nullptr;
    }
    const Token& type = advance();
    decl.type         = makeNode(type.span, SyntaxNode::StringLiteral{type.value});

    if (check(TokenKind::Identifier) && current().text == "existing")
    {
        const Token& existing = advance();
        decl.existingKeyword  = makeNode(existing.span, SyntaxNode::Token{TokenKind::Identifier, existing.text});
    }

    if (!expect(TokenKind::Assignment, "\"=\""))
    {
        syncToNextLine();
        return nullptr;
    }
    decl.assignment = makeNode(previous().span, SyntaxNode::Token{TokenKind::Assignment, "="});

    decl.body = parseExpression();
    if (!decl.body)
    {
        syncToNextLine();
        return nullptr;
    }

    const TextSpan span = TextSpan::between(keyword.span, previous().span);
    expectStatementEnd();
    return makeNode(span, std::move(decl));
}

void Parser::expectStatementEnd()
{
    if (check(TokenKind::NewLine) || isAtEnd())
    {
        return;
    }
    diagnostics_.error(current().span, "BCP019", "Expected a new line character at this location.");
    syncToNextLine();
}

SyntaxPtr Parser::parseExpression()
{
    const Token& token = current();
    switch (token.kind)
    {
    case TokenKind::LeftBrace:
        return parseObject();
    case TokenKind::LeftSquare:
        return parseArray();
    case TokenKind::StringComplete:
        (void) advance();
        return makeNode(token.span, SyntaxNode::StringLiteral{token.value});
    case TokenKind::Integer:
        (void) advance();
        return parseInteger(false, token.span.offset);
    case TokenKind::Minus:
        (void) advance();
        if (!match(TokenKind::Integer))
        {
            diagnostics_.error(current().span, "BCP010", "Expected a valid 64-bit signed integer.");
            return nullptr;
        }
        return parseInteger(true, token.span.offset);
    case TokenKind::TrueKeyword:
    case TokenKind::FalseKeyword:
        (void) advance();
        return makeNode(token.span, SyntaxNode::BooleanLiteral{token.kind == TokenKind::TrueKeyword});
    case TokenKind::NullKeyword:
        (void) advance();
        return makeNode(token.span, SyntaxNode::NullLiteral{});
    case TokenKind::Identifier:
        (void) advance();
        if (check(TokenKind::LeftParen) || check(TokenKind::Dot) || check(TokenKind::LeftSquare))
        {
            diagnostics_.error(current().span,
                               "BCM002",
                               "Function calls and member access expressions are not supported in this context.");
            return nullptr;
        }
        return makeNode(token.span, SyntaxNode::Identifier{token.text});
    default:
        break;
    }
    diagnostics_.error(token.span,
                       "BCP009",
                       "Expected a literal value, an array, an object, or a symbol reference at this location.");
    return nullptr;
}

SyntaxPtr Parser::parseInteger(bool negative, std::size_t start)
{
    const Token&      digits = previous();
    const std::string text   = (negative ? "-" : "") + digits.text;
    std::int64_t      value  = 0;
    if (llvm::StringRef(text).getAsInteger(10, value))
    {
        diagnostics_.error(digits.span, "BCP010", "Expected a valid 64-bit signed integer.");
        return nullptr;
    }
    return makeNode(TextSpan{start, digits.span.end() - start}, SyntaxNode::IntegerLiteral{value});
}

SyntaxPtr Parser::parseObjectProperty()
{
    const Token& keyToken = current();
    SyntaxPtr    key;
    switch (keyToken.kind)
    {
    case TokenKind::Identifier:
    case TokenKind::TrueKeyword:
    case TokenKind::FalseKeyword:
    case TokenKind::NullKeyword:
        (void) advance();
        key = makeNode(keyToken.span, SyntaxNode::Identifier{keyToken.text});
        break;
    case TokenKind::StringComplete:
        (void) advance();
        key = makeNode(keyToken.span, SyntaxNode::StringLiteral{keyToken.value});
        break;
    default:
        diagnostics_.error(keyToken.span, "BCP022", "Expected a property name at this location.");
        return nullptr;
    }

    if (!expect(TokenKind::Colon, "\":\""))
    {
        return nullptr;
    }
    SyntaxPtr value = parseExpression();
    if (!value)
    {
        return nullptr;
    }
    return makeNode(TextSpan::between(keyToken.span, previous().span),
                    SyntaxNode::ObjectProperty{std::move(key), std::move(value)});
}

SyntaxPtr Parser::parseObject()
{
    const Token&           open = advance();
    std::vector<SyntaxPtr> properties;
    skipNewLines();
    while (!check(TokenKind::RightBrace) && !isAtEnd())
    {
        if (SyntaxPtr property = parseObjectProperty())
        {
            properties.push_back(std::move(property));
        }
        else
        {
            syncToItemEnd(TokenKind::RightBrace);
        }

        if (matchAny({TokenKind::Comma, TokenKind::NewLine}))
        {
            skipNewLines();
            continue;
        }
        if (!check(TokenKind::RightBrace))
        {
            diagnostics_.error(current().span, "BCP018", "Expected the \"}\" character at this location.");
            syncToItemEnd(TokenKind::RightBrace);
        }
    }
    (void) expect(TokenKind::RightBrace, "\"}\"");
    return makeNode(TextSpan::between(open.span, previous().span), SyntaxNode::ObjectExpr{std::move(properties)});
}

SyntaxPtr Parser::parseArray()
{
    const Token&           open = advance();
    std::vector<SyntaxPtr> items;
    skipNewLines();
    while (!check(TokenKind::RightSquare) && !isAtEnd())
    {
        if (SyntaxPtr item = parseExpression())
        {
            items.push_back(std::move(item));
        }
        else
        {
            syncToItemEnd(TokenKind::RightSquare);
        }

        if (matchAny({TokenKind::Comma, TokenKind::NewLine}))
        {
            skipNewLines();
            continue;
        }
        if (!check(TokenKind::RightSquare))
        {
            diagnostics_.error(current().span, "BCP018", "Expected the \"]\" character at this location.");
            syncToItemEnd(TokenKind::RightSquare);
        }
    }
    (void) expect(TokenKind::RightSquare, "\"]\"");
    return makeNode(TextSpan::between(open.span, previous().span), SyntaxNode::ArrayExpr{std::move(items)});
}

ProgramSyntax parseProgram(llvm::StringRef text)
{
    DiagnosticEngine   diagnostics;
    Lexer              lexer(text.str(), diagnostics);
    std::vector<Token> tokens = lexer.lex();
    Parser             parser(std::move(tokens), diagnostics);

    ProgramSyntax program;
    program.declarations = parser.parseDeclarations();
    program.diagnostics  = diagnostics.take();
    return program;
}

}  // namespace llvmbicep
