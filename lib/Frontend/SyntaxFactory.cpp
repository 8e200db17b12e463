//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements span-less syntax node construction.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Frontend/SyntaxFactory.h"

#include "llvm/ADT/StringExtras.h"

namespace llvmbicep
{

SyntaxPtr makeNode(TextSpan span, SyntaxNode::Value value)
{
    return std::make_shared<const SyntaxNode>(SyntaxNode{span, std::move(value)});
}

SyntaxPtr makeToken(TokenKind kind, std::string text)
{
    return makeNode({}, SyntaxNode::Token{kind, std::move(text)});
}

SyntaxPtr makeIdentifier(std::string name)
{
    return makeNode({}, SyntaxNode::Identifier{std::move(name)});
}

SyntaxPtr makeStringLiteral(std::string value)
{
    return makeNode({}, SyntaxNode::StringLiteral{std::move(value)});
}

SyntaxPtr makeIntegerLiteral(std::int64_t value)
{
    return makeNode({}, SyntaxNode::IntegerLiteral{value});
}

SyntaxPtr makeBooleanLiteral(bool value)
{
    return makeNode({}, SyntaxNode::BooleanLiteral{value});
}

SyntaxPtr makeNullLiteral()
{
    return makeNode({}, SyntaxNode::NullLiteral{});
}

SyntaxPtr makeObjectProperty(llvm::StringRef key, SyntaxPtr value)
{
    SyntaxPtr keyNode = isValidIdentifier(key) ? makeIdentifier(key.str()) : makeStringLiteral(key.str());
    return makeObjectProperty(std::move(keyNode), std::move(value));
}

SyntaxPtr makeObjectProperty(SyntaxPtr key, SyntaxPtr value)
{
    return makeNode({}, SyntaxNode::ObjectProperty{std::move(key), std::move(value)});
}

SyntaxPtr makeObject(std::vector<SyntaxPtr> properties)
{
    return makeNode({}, SyntaxNode::ObjectExpr{std::move(properties)});
}

SyntaxPtr makeArray(std::vector<SyntaxPtr> items)
{
    return makeNode({}, SyntaxNode::ArrayExpr{std::move(items)});
}

SyntaxPtr makeResourceDeclaration(std::string name, std::string typeReference, SyntaxPtr body)
{
    SyntaxNode::ResourceDeclaration decl;
    decl.keyword    = makeToken(TokenKind::Identifier, "resource");
    decl.name       = makeIdentifier(std::move(name));
    decl.type       = makeStringLiteral(std::move(typeReference));
    decl.assignment = makeToken(TokenKind::Assignment, "=");
    decl.body       = std::move(body);
    return makeNode({}, std::move(decl));
}

SyntaxPtr withDeclarationBody(const SyntaxNode& declaration, SyntaxPtr body)
{
    const auto* decl = declaration.as<SyntaxNode::ResourceDeclaration>();
    if (!decl)
    {
        return nullptr;
    }
    SyntaxNode::ResourceDeclaration copy = *decl;
    copy.body                            = std::move(body);
    return makeNode(declaration.span, std::move(copy));
}

bool isValidIdentifier(llvm::StringRef text)
{
    if (text.empty() || !(llvm::isAlpha(text.front()) || text.front() == '_'))
    {
        return false;
    }
    for (const char c : text)
    {
        if (!(llvm::isAlnum(c) || c == '_'))
        {
            return false;
        }
    }
    return true;
}

}  // namespace llvmbicep
