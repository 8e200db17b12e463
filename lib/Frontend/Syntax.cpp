//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements syntax tree helpers and span-insensitive structural comparison.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Frontend/Syntax.h"

#include <type_traits>

namespace llvmbicep
{
namespace
{

bool listsEqual(const std::vector<SyntaxPtr>& lhs, const std::vector<SyntaxPtr>& rhs)
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        if (!structurallyEqual(lhs[i], rhs[i]))
        {
            return false;
        }
    }
    return true;
}

}  // namespace

const char* tokenKindName(const TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::EndOfFile:
        return "end of file";
    case TokenKind::NewLine:
        return "newline";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::Integer:
        return "integer";
    case TokenKind::StringComplete:
        return "string";
    case TokenKind::LeftBrace:
        return "'{'";
    case TokenKind::RightBrace:
        return "'}'";
    case TokenKind::LeftSquare:
        return "'['";
    case TokenKind::RightSquare:
        return "']'";
    case TokenKind::LeftParen:
        return "'('";
    case TokenKind::RightParen:
        return "')'";
    case TokenKind::Colon:
        return "':'";
    case TokenKind::Comma:
        return "','";
    case TokenKind::Dot:
        return "'.'";
    case TokenKind::Assignment:
        return "'='";
    case TokenKind::At:
        return "'@'";
    case TokenKind::Minus:
        return "'-'";
    case TokenKind::Question:
        return "'?'";
    case TokenKind::TrueKeyword:
        return "'true'";
    case TokenKind::FalseKeyword:
        return "'false'";
    case TokenKind::NullKeyword:
        return "'null'";
    case TokenKind::Unrecognized:
        return "unrecognized token";
    }
    return "unrecognized token";
}

std::string propertyKeyText(const SyntaxNode& property)
{
    const auto* p = property.as<SyntaxNode::ObjectProperty>();
    if (!p || !p->key)
    {
        return {};
    }
    if (const auto* id = p->key->as<SyntaxNode::Identifier>())
    {
        return id->name;
    }
    if (const auto* s = p->key->as<SyntaxNode::StringLiteral>())
    {
        return s->value;
    }
    return {};
}

bool structurallyEqual(const SyntaxPtr& lhs, const SyntaxPtr& rhs)
{
    if (!lhs || !rhs)
    {
        return !lhs && !rhs;
    }
    if (lhs == rhs)
    {
        return true;
    }
    if (lhs->value.index() != rhs->value.index())
    {
        return false;
    }

    return std::visit(
        [&rhs](const auto& left) -> bool {
            using T           = std::decay_t<decltype(left)>;
            const auto& right = std::get<T>(rhs->value);
            if constexpr (std::is_same_v<T, SyntaxNode::Token>)
            {
                return left.kind == right.kind && left.text == right.text;
            }
            else if constexpr (std::is_same_v<T, SyntaxNode::Identifier>)
            {
                return left.name == right.name;
            }
            else if constexpr (std::is_same_v<T, SyntaxNode::StringLiteral> ||
                               std::is_same_v<T, SyntaxNode::IntegerLiteral> ||
                               std::is_same_v<T, SyntaxNode::BooleanLiteral>)
            {
                return left.value == right.value;
            }
            else if constexpr (std::is_same_v<T, SyntaxNode::NullLiteral>)
            {
                return true;
            }
            else if constexpr (std::is_same_v<T, SyntaxNode::ObjectProperty>)
            {
                return structurallyEqual(left.key, right.key) && structurallyEqual(left.value, right.value);
            }
            else if constexpr (std::is_same_v<T, SyntaxNode::ObjectExpr>)
            {
                return listsEqual(left.properties, right.properties);
            }
            else if constexpr (std::is_same_v<T, SyntaxNode::ArrayExpr>)
            {
                return listsEqual(left.items, right.items);
            }
            else
            {
                static_assert(std::is_same_v<T, SyntaxNode::ResourceDeclaration>, "unhandled syntax alternative");
                return structurallyEqual(left.keyword, right.keyword) && structurallyEqual(left.name, right.name) &&
                       structurallyEqual(left.type, right.type) &&
                       structurallyEqual(left.existingKeyword, right.existingKeyword) &&
                       structurallyEqual(left.assignment, right.assignment) &&
                       structurallyEqual(left.body, right.body);
            }
        },
        lhs->value);
}

bool structurallyEqual(const ProgramSyntax& lhs, const ProgramSyntax& rhs)
{
    return listsEqual(lhs.declarations, rhs.declarations);
}

}  // namespace llvmbicep
