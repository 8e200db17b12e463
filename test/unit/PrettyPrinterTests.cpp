//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmbicep/Frontend/Parser.h"
#include "llvmbicep/Frontend/PrettyPrinter.h"
#include "llvmbicep/Frontend/SyntaxFactory.h"

namespace
{

const char* const kCanonical = "resource web 'Microsoft.Web/sites@2022-09-01' = {\n"
                               "  name: 'web'\n"
                               "  'app-settings': {\n"
                               "    count: 2\n"
                               "    enabled: true\n"
                               "  }\n"
                               "  hosts: [\n"
                               "    'a.example'\n"
                               "    null\n"
                               "  ]\n"
                               "  empty: {}\n"
                               "  none: []\n"
                               "}";

bool testCanonicalRoundTrip()
{
    const auto program = llvmbicep::parseProgram(kCanonical);
    if (program.hasErrors())
    {
        std::cerr << "canonical text failed to parse\n";
        return false;
    }
    const std::string printed = llvmbicep::printProgram(program, llvmbicep::PrettyPrintOptions{});
    if (printed != kCanonical)
    {
        std::cerr << "canonical text did not survive a print:\n" << printed << "\n";
        return false;
    }

    const auto reparsed = llvmbicep::parseProgram(printed);
    if (reparsed.hasErrors() || !llvmbicep::structurallyEqual(program, reparsed))
    {
        std::cerr << "printed text must reparse to the same tree\n";
        return false;
    }
    return true;
}

bool testMessyInputIsCanonicalized()
{
    const auto program = llvmbicep::parseProgram("resource   web 'Microsoft.Web/sites@2022-09-01'={name:'web', 'app-settings':{count:2,enabled:true}\n"
                                                 "hosts:['a.example',null], empty:{}, none:[\n]}");
    if (program.hasErrors())
    {
        std::cerr << "messy input failed to parse\n";
        return false;
    }
    const std::string first  = llvmbicep::printProgram(program, llvmbicep::PrettyPrintOptions{});
    const std::string second = llvmbicep::printProgram(program, llvmbicep::PrettyPrintOptions{});
    if (first != kCanonical || first != second)
    {
        std::cerr << "messy input did not print canonically:\n" << first << "\n";
        return false;
    }
    return true;
}

bool testFormattingOptions()
{
    const auto body = llvmbicep::makeObject({llvmbicep::makeObjectProperty(
        "outer",
        llvmbicep::makeObject({llvmbicep::makeObjectProperty("inner", llvmbicep::makeIntegerLiteral(1))}))});
    const auto declaration = llvmbicep::makeResourceDeclaration("x", "A.B/c@1", body);

    llvmbicep::PrettyPrintOptions options;
    options.newline            = llvmbicep::NewlineOption::CRLF;
    options.indentKind         = llvmbicep::IndentKindOption::Tab;
    options.insertFinalNewline = true;

    const std::string printed = llvmbicep::printDeclarations({declaration, declaration}, options);
    const std::string single  = "resource x 'A.B/c@1' = {\r\n\touter: {\r\n\t\tinner: 1\r\n\t}\r\n}";
    if (printed != single + "\r\n\r\n" + single + "\r\n")
    {
        std::cerr << "CRLF or tab formatting mismatch\n";
        return false;
    }

    llvmbicep::PrettyPrintOptions wide;
    wide.indentSize = 4;
    if (llvmbicep::printSyntax(*body, wide) != "{\n    outer: {\n        inner: 1\n    }\n}")
    {
        std::cerr << "indent size was not honored\n";
        return false;
    }
    return true;
}

bool testQuoting()
{
    if (llvmbicep::quoteStringLiteral("it's $5 ${x}\\\t") != "'it\\'s $5 \\${x}\\\\\\t'")
    {
        std::cerr << "string literal quoting mismatch: " << llvmbicep::quoteStringLiteral("it's $5 ${x}\\\t") << "\n";
        return false;
    }
    if (llvmbicep::quoteStringLiteral(std::string("\x01", 1)) != "'\\u{1}'")
    {
        std::cerr << "control characters must use \\u{...}\n";
        return false;
    }
    return true;
}

}  // namespace

bool runPrettyPrinterTests()
{
    bool ok = true;
    ok      = testCanonicalRoundTrip() && ok;
    ok      = testMessyInputIsCanonicalized() && ok;
    ok      = testFormattingOptions() && ok;
    ok      = testQuoting() && ok;
    return ok;
}
