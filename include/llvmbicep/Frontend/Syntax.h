//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Immutable Bicep syntax tree.
///
/// Nodes are shared through `std::shared_ptr<const SyntaxNode>`; a rewrite
/// builds new nodes along the changed path and shares every untouched subtree.
/// Spans are formatting metadata: factory-built nodes carry empty spans and
/// structural comparison ignores them.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_FRONTEND_SYNTAX_H
#define LLVMBICEP_FRONTEND_SYNTAX_H

#include "llvmbicep/Support/Diagnostics.h"
#include "llvmbicep/Support/TextSpan.h"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace llvmbicep
{

/// @brief Token categories of the Bicep lexer.
enum class TokenKind
{
    EndOfFile,
    NewLine,
    Identifier,
    Integer,
    StringComplete,
    LeftBrace,
    RightBrace,
    LeftSquare,
    RightSquare,
    LeftParen,
    RightParen,
    Colon,
    Comma,
    Dot,
    Assignment,
    At,
    Minus,
    Question,
    TrueKeyword,
    FalseKeyword,
    NullKeyword,
    Unrecognized,
};

/// @brief Returns a short human-readable token kind name.
const char* tokenKindName(TokenKind kind);

struct SyntaxNode;

/// @brief Shared handle to an immutable syntax node.
using SyntaxPtr = std::shared_ptr<const SyntaxNode>;

/// @brief One node of the Bicep syntax tree.
struct SyntaxNode final
{
    /// @brief Keyword or punctuation token.
    struct Token
    {
        TokenKind   kind{TokenKind::Unrecognized};
        std::string text;
    };

    /// @brief Identifier (declaration name, property key, or symbol reference).
    struct Identifier
    {
        std::string name;
    };

    /// @brief Single-quoted string literal holding the unescaped value.
    struct StringLiteral
    {
        std::string value;
    };

    struct IntegerLiteral
    {
        std::int64_t value{0};
    };

    struct BooleanLiteral
    {
        bool value{false};
    };

    struct NullLiteral
    {
    };

    /// @brief `key: value` entry of an object; `key` is an Identifier or StringLiteral.
    struct ObjectProperty
    {
        SyntaxPtr key;
        SyntaxPtr value;
    };

    /// @brief `{ ... }` with ObjectProperty children in source order.
    struct ObjectExpr
    {
        std::vector<SyntaxPtr> properties;
    };

    /// @brief `[ ... ]` with expression children in source order.
    struct ArrayExpr
    {
        std::vector<SyntaxPtr> items;
    };

    /// @brief `resource <name> '<type>@<version>' [existing] = <body>`.
    struct ResourceDeclaration
    {
        /// @brief `resource` keyword token.
        SyntaxPtr keyword;

        /// @brief Identifier node.
        SyntaxPtr name;

        /// @brief StringLiteral node holding the type reference.
        SyntaxPtr type;

        /// @brief `existing` token, or null for a newly authored resource.
        SyntaxPtr existingKeyword;

        /// @brief `=` token.
        SyntaxPtr assignment;

        /// @brief Body expression.
        SyntaxPtr body;
    };

    using Value = std::variant<Token,
                               Identifier,
                               StringLiteral,
                               IntegerLiteral,
                               BooleanLiteral,
                               NullLiteral,
                               ObjectProperty,
                               ObjectExpr,
                               ArrayExpr,
                               ResourceDeclaration>;

    /// @brief Source span; empty for factory-built nodes.
    TextSpan span;

    Value value;

    template <typename T>
    [[nodiscard]] const T* as() const
    {
        return std::get_if<T>(&value);
    }

    template <typename T>
    [[nodiscard]] bool is() const
    {
        return std::holds_alternative<T>(value);
    }
};

/// @brief Whole document: top-level declarations plus lexer/parser diagnostics.
struct ProgramSyntax final
{
    std::vector<SyntaxPtr>  declarations;
    std::vector<Diagnostic> diagnostics;

    [[nodiscard]] bool hasErrors() const
    {
        return containsErrors(diagnostics);
    }
};

/// @brief Returns the key text of an ObjectProperty (identifier name or string value).
/// @return Key text, or an empty string when `property` is not an ObjectProperty.
[[nodiscard]] std::string propertyKeyText(const SyntaxNode& property);

/// @brief Compares two trees ignoring spans.
[[nodiscard]] bool structurallyEqual(const SyntaxPtr& lhs, const SyntaxPtr& rhs);

/// @brief Compares two programs' declarations ignoring spans and diagnostics.
[[nodiscard]] bool structurallyEqual(const ProgramSyntax& lhs, const ProgramSyntax& rhs);

}  // namespace llvmbicep

#endif  // LLVMBICEP_FRONTEND_SYNTAX_H
