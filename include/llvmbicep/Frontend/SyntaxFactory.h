//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Constructors for span-less syntax nodes used by rewrites and synthesis.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_FRONTEND_SYNTAX_FACTORY_H
#define LLVMBICEP_FRONTEND_SYNTAX_FACTORY_H

#include "llvmbicep/Frontend/Syntax.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <vector>

namespace llvmbicep
{

/// @brief Wraps a node value with a span.
[[nodiscard]] SyntaxPtr makeNode(TextSpan span, SyntaxNode::Value value);

[[nodiscard]] SyntaxPtr makeToken(TokenKind kind, std::string text);
[[nodiscard]] SyntaxPtr makeIdentifier(std::string name);
[[nodiscard]] SyntaxPtr makeStringLiteral(std::string value);
[[nodiscard]] SyntaxPtr makeIntegerLiteral(std::int64_t value);
[[nodiscard]] SyntaxPtr makeBooleanLiteral(bool value);
[[nodiscard]] SyntaxPtr makeNullLiteral();

/// @brief Builds `key: value`.
///
/// The key becomes an Identifier when `key` is a valid identifier and a
/// StringLiteral otherwise.
[[nodiscard]] SyntaxPtr makeObjectProperty(llvm::StringRef key, SyntaxPtr value);

/// @brief Builds `key: value` reusing an existing key node.
[[nodiscard]] SyntaxPtr makeObjectProperty(SyntaxPtr key, SyntaxPtr value);

[[nodiscard]] SyntaxPtr makeObject(std::vector<SyntaxPtr> properties);
[[nodiscard]] SyntaxPtr makeArray(std::vector<SyntaxPtr> items);

/// @brief Builds `resource <name> '<typeReference>' = <body>` with no `existing` modifier.
[[nodiscard]] SyntaxPtr makeResourceDeclaration(std::string name, std::string typeReference, SyntaxPtr body);

/// @brief Returns a copy of `declaration` with its body replaced.
/// @return Null when `declaration` is not a resource declaration.
[[nodiscard]] SyntaxPtr withDeclarationBody(const SyntaxNode& declaration, SyntaxPtr body);

/// @brief Returns true for `[A-Za-z_][A-Za-z0-9_]*`.
[[nodiscard]] bool isValidIdentifier(llvm::StringRef text);

}  // namespace llvmbicep

#endif  // LLVMBICEP_FRONTEND_SYNTAX_FACTORY_H
