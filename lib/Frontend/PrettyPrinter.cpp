//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements canonical Bicep text rendering.
///
/// Objects and arrays always print one entry per line; empty containers print
/// as `{}` and `[]`.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Frontend/PrettyPrinter.h"

#include "llvm/ADT/StringExtras.h"

#include <type_traits>

namespace llvmbicep
{
namespace
{

class Printer final
{
public:
    explicit Printer(const PrettyPrintOptions& options)
        : options_(options)
        , newline_(options.newline == NewlineOption::CRLF ? "\r\n" : "\n")
    {
    }

    void print(const SyntaxNode& node, unsigned depth)
    {
        std::visit(
            [this, depth](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, SyntaxNode::Token>)
                {
                    out_ += value.text;
                }
                else if constexpr (std::is_same_v<T, SyntaxNode::Identifier>)
                {
                    out_ += value.name;
                }
                else if constexpr (std::is_same_v<T, SyntaxNode::StringLiteral>)
                {
                    out_ += quoteStringLiteral(value.value);
                }
                else if constexpr (std::is_same_v<T, SyntaxNode::IntegerLiteral>)
                {
                    out_ += std::to_string(value.value);
                }
                else if constexpr (std::is_same_v<T, SyntaxNode::BooleanLiteral>)
                {
                    out_ += value.value ? "true" : "false";
                }
                else if constexpr (std::is_same_v<T, SyntaxNode::NullLiteral>)
                {
                    out_ += "null";
                }
                else if constexpr (std::is_same_v<T, SyntaxNode::ObjectProperty>)
                {
                    printChild(value.key, depth);
                    out_ += ": ";
                    printChild(value.value, depth);
                }
                else if constexpr (std::is_same_v<T, SyntaxNode::ObjectExpr>)
                {
                    printBlock(value.properties, "{", "}", depth);
                }
                else if constexpr (std::is_same_v<T, SyntaxNode::ArrayExpr>)
                {
                    printBlock(value.items, "[", "]", depth);
                }
                else
                {
                    static_assert(std::is_same_v<T, SyntaxNode::ResourceDeclaration>, "unhandled syntax alternative");
                    printChild(value.keyword, depth);
                    out_ += ' ';
                    printChild(value.name, depth);
                    out_ += ' ';
                    printChild(value.type, depth);
                    if (value.existingKeyword)
                    {
                        out_ += ' ';
                        printChild(value.existingKeyword, depth);
                    }
                    out_ += ' ';
                    printChild(value.assignment, depth);
                    out_ += ' ';
                    printChild(value.body, depth);
                }
            },
            node.value);
    }

    void newline()
    {
        out_ += newline_;
    }

    [[nodiscard]] std::string take()
    {
        return std::move(out_);
    }

private:
    void printChild(const SyntaxPtr& child, unsigned depth)
    {
        if (child)
        {
            print(*child, depth);
        }
    }

    void printBlock(const std::vector<SyntaxPtr>& entries, const char* open, const char* close, unsigned depth)
    {
        out_ += open;
        if (!entries.empty())
        {
            newline();
            for (const auto& entry : entries)
            {
                indent(depth + 1);
                printChild(entry, depth + 1);
                newline();
            }
            indent(depth);
        }
        out_ += close;
    }

    void indent(unsigned depth)
    {
        for (unsigned level = 0; level < depth; ++level)
        {
            if (options_.indentKind == IndentKindOption::Tab)
            {
                out_ += '\t';
            }
            else
            {
                out_.append(options_.indentSize, ' ');
            }
        }
    }

    const PrettyPrintOptions& options_;
    const char*               newline_;
    std::string               out_;
};

}  // namespace

std::string quoteStringLiteral(llvm::StringRef value)
{
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        const char c = value[i];
        switch (c)
        {
        case '\\':
            out += "\\\\";
            break;
        case '\'':
            out += "\\'";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '$':
            out += (i + 1 < value.size() && value[i + 1] == '{') ? "\\$" : "$";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
                out += "\\u{" + llvm::utohexstr(static_cast<unsigned char>(c)) + "}";
            }
            else
            {
                out += c;
            }
            break;
        }
    }
    out += '\'';
    return out;
}

std::string printSyntax(const SyntaxNode& node, const PrettyPrintOptions& options)
{
    Printer printer(options);
    printer.print(node, 0);
    return printer.take();
}

std::string printDeclarations(const std::vector<SyntaxPtr>& declarations, const PrettyPrintOptions& options)
{
    Printer printer(options);
    bool    first = true;
    for (const auto& decl : declarations)
    {
        if (!decl)
        {
            continue;
        }
        if (!first)
        {
            printer.newline();
            printer.newline();
        }
        printer.print(*decl, 0);
        first = false;
    }
    if (options.insertFinalNewline)
    {
        printer.newline();
    }
    return printer.take();
}

std::string printProgram(const ProgramSyntax& program, const PrettyPrintOptions& options)
{
    return printDeclarations(program.declarations, options);
}

}  // namespace llvmbicep
