//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the structural-sharing syntax rewriter.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Transforms/SyntaxRewriter.h"

#include "llvmbicep/Frontend/SyntaxFactory.h"

namespace llvmbicep
{

ProgramSyntax SyntaxRewriter::rewrite(const ProgramSyntax& program)
{
    ProgramSyntax out;
    out.diagnostics = program.diagnostics;
    out.declarations.reserve(program.declarations.size());
    for (const auto& declaration : program.declarations)
    {
        out.declarations.push_back(rewriteNode(declaration));
    }
    return out;
}

SyntaxPtr SyntaxRewriter::rewriteNode(const SyntaxPtr& node)
{
    if (!node)
    {
        return node;
    }

    if (const auto* decl = node->as<SyntaxNode::ResourceDeclaration>())
    {
        SyntaxPtr body = rewriteNode(decl->body);
        if (body == decl->body)
        {
            return node;
        }
        return withDeclarationBody(*node, std::move(body));
    }

    if (const auto* object = node->as<SyntaxNode::ObjectExpr>())
    {
        bool                   changed = false;
        std::vector<SyntaxPtr> properties;
        properties.reserve(object->properties.size());
        for (const auto& property : object->properties)
        {
            const auto* entry = property ? property->as<SyntaxNode::ObjectProperty>() : nullptr;
            if (!entry)
            {
                properties.push_back(property);
                continue;
            }
            SyntaxPtr value       = rewriteNode(entry->value);
            SyntaxPtr replacement = rewriteObjectProperty(property, value);
            changed               = changed || replacement != property;
            if (replacement)
            {
                properties.push_back(std::move(replacement));
            }
        }
        if (!changed)
        {
            return node;
        }
        return makeNode(node->span, SyntaxNode::ObjectExpr{std::move(properties)});
    }

    if (const auto* array = node->as<SyntaxNode::ArrayExpr>())
    {
        bool                   changed = false;
        std::vector<SyntaxPtr> items;
        items.reserve(array->items.size());
        for (const auto& item : array->items)
        {
            items.push_back(rewriteNode(item));
            changed = changed || items.back() != item;
        }
        if (!changed)
        {
            return node;
        }
        return makeNode(node->span, SyntaxNode::ArrayExpr{std::move(items)});
    }

    if (node->is<SyntaxNode::StringLiteral>())
    {
        return rewriteStringLiteral(node);
    }
    return node;
}

SyntaxPtr SyntaxRewriter::rewriteObjectProperty(const SyntaxPtr& property, const SyntaxPtr& value)
{
    const auto* entry = property->as<SyntaxNode::ObjectProperty>();
    if (!entry || value == entry->value)
    {
        return property;
    }
    return makeNode(property->span, SyntaxNode::ObjectProperty{entry->key, value});
}

SyntaxPtr SyntaxRewriter::rewriteStringLiteral(const SyntaxPtr& literal)
{
    return literal;
}

}  // namespace llvmbicep
