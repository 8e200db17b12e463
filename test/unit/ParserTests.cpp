//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmbicep/Frontend/Parser.h"
#include "llvmbicep/Frontend/Syntax.h"

namespace
{

bool hasDiagnostic(const llvmbicep::ProgramSyntax& program, const char* code)
{
    for (const auto& d : program.diagnostics)
    {
        if (d.code == code)
        {
            return true;
        }
    }
    return false;
}

bool testResourceDeclaration()
{
    const std::string text = "// header\n"
                             "resource vnet 'Microsoft.Network/virtualNetworks@2023-04-01' = {\n"
                             "  name: 'vnet'\n"
                             "  'odd-key': 1, count: -3\n"
                             "  flags: [\n"
                             "    true\n"
                             "    null\n"
                             "  ]\n"
                             "}\n";

    const auto program = llvmbicep::parseProgram(text);
    if (program.hasErrors() || program.declarations.size() != 1)
    {
        std::cerr << "parser failed unexpectedly\n";
        return false;
    }

    const auto& declaration = program.declarations.front();
    const auto* resource    = declaration->as<llvmbicep::SyntaxNode::ResourceDeclaration>();
    if (!resource)
    {
        std::cerr << "expected a resource declaration\n";
        return false;
    }
    const auto* name = resource->name->as<llvmbicep::SyntaxNode::Identifier>();
    const auto* type = resource->type->as<llvmbicep::SyntaxNode::StringLiteral>();
    if (!name || name->name != "vnet" || !type || type->value != "Microsoft.Network/virtualNetworks@2023-04-01")
    {
        std::cerr << "unexpected declaration name or type\n";
        return false;
    }
    if (text.substr(declaration->span.offset, 8) != "resource" || text[declaration->span.end() - 1] != '}')
    {
        std::cerr << "declaration span must cover keyword through body\n";
        return false;
    }

    const auto* body = resource->body->as<llvmbicep::SyntaxNode::ObjectExpr>();
    if (!body || body->properties.size() != 4)
    {
        std::cerr << "expected four body properties\n";
        return false;
    }
    if (llvmbicep::propertyKeyText(*body->properties[1]) != "odd-key")
    {
        std::cerr << "quoted property keys must be unescaped\n";
        return false;
    }
    const auto* count = body->properties[2]->as<llvmbicep::SyntaxNode::ObjectProperty>();
    const auto* value = count ? count->value->as<llvmbicep::SyntaxNode::IntegerLiteral>() : nullptr;
    if (!value || value->value != -3)
    {
        std::cerr << "negative integers must parse\n";
        return false;
    }
    const auto* flags = body->properties[3]->as<llvmbicep::SyntaxNode::ObjectProperty>();
    const auto* items = flags ? flags->value->as<llvmbicep::SyntaxNode::ArrayExpr>() : nullptr;
    if (!items || items->items.size() != 2 || !items->items[1]->is<llvmbicep::SyntaxNode::NullLiteral>())
    {
        std::cerr << "unexpected array items\n";
        return false;
    }
    return true;
}

bool testExistingAndSkippedStatements()
{
    const auto program = llvmbicep::parseProgram("param location string = 'x'\n"
                                                 "@description('d')\n"
                                                 "resource sa 'A.B/c@1' existing = {\n"
                                                 "  name: 'sa'\n"
                                                 "}\n");
    if (program.hasErrors() || program.declarations.size() != 1 || !hasDiagnostic(program, "BCM001"))
    {
        std::cerr << "non-resource statements must be skipped with a warning\n";
        return false;
    }
    const auto* resource = program.declarations[0]->as<llvmbicep::SyntaxNode::ResourceDeclaration>();
    if (!resource || !resource->existingKeyword)
    {
        std::cerr << "existing keyword must be kept\n";
        return false;
    }
    return true;
}

bool expectParseError(const std::string& text, const char* code)
{
    const auto program = llvmbicep::parseProgram(text);
    if (!program.hasErrors() || !hasDiagnostic(program, code))
    {
        std::cerr << "expected " << code << " while parsing:\n" << text << "\n";
        return false;
    }
    return true;
}

bool testRecoveryKeepsLaterDeclarations()
{
    const auto program = llvmbicep::parseProgram("resource a 'A.B/c@1' = {\n"
                                                 "  x: \n"
                                                 "}\n"
                                                 "resource b 'A.B/c@1' = {}\n");
    if (!program.hasErrors() || program.declarations.empty())
    {
        std::cerr << "parser must recover after a bad property\n";
        return false;
    }
    const auto* last = program.declarations.back()->as<llvmbicep::SyntaxNode::ResourceDeclaration>();
    const auto* name = last ? last->name->as<llvmbicep::SyntaxNode::Identifier>() : nullptr;
    if (!name || name->name != "b")
    {
        std::cerr << "declaration after an error was lost\n";
        return false;
    }
    return true;
}

}  // namespace

bool runParserTests()
{
    bool ok = true;
    ok      = testResourceDeclaration() && ok;
    ok      = testExistingAndSkippedStatements() && ok;
    ok      = testRecoveryKeepsLaterDeclarations() && ok;
    ok      = expectParseError("resource 'A.B/c@1' = {}", "BCP017") && ok;
    ok      = expectParseError("resource a b = {}", "BCP068") && ok;
    ok      = expectParseError("resource a 'A.B/c@1' {}", "BCP018") && ok;
    ok      = expectParseError("resource a 'A.B/c@1' = {} extra", "BCP019") && ok;
    ok      = expectParseError("resource a 'A.B/c@1' = { x: 99999999999999999999 }", "BCP010") && ok;
    ok      = expectParseError("resource a 'A.B/c@1' = { x: concat('a') }", "BCM002") && ok;
    ok      = expectParseError("42", "BCP007") && ok;
    return ok;
}
