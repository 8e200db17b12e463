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
#include "llvmbicep/Semantics/SemanticModel.h"
#include "llvmbicep/Transforms/ReadOnlyPropertyRemoval.h"
#include "llvmbicep/Transforms/SyntaxRewriter.h"
#include "llvmbicep/Transforms/TypeCasingFixer.h"

#include "TestCatalog.h"

namespace
{

llvmbicep::SemanticModel analyzeText(const std::string& text)
{
    return llvmbicep::SemanticModel::analyze(llvmbicep::parseProgram(text),
                                             llvmbicep_test::loadTestCatalog(),
                                             nullptr,
                                             llvmbicep::Configuration{});
}

bool expectPrinted(const llvmbicep::ProgramSyntax& program, const std::string& expected, const char* what)
{
    const std::string printed = llvmbicep::printProgram(program, llvmbicep::PrettyPrintOptions{});
    if (printed != expected)
    {
        std::cerr << what << " produced:\n" << printed << "\nexpected:\n" << expected << "\n";
        return false;
    }
    return true;
}

bool testIdentityRewriteSharesNodes()
{
    const auto                model = analyzeText("resource w 'Test.Provider/widgets@2024-01-01' = {\n  name: 'w'\n}");
    llvmbicep::SyntaxRewriter identity;
    const auto                rewritten = identity.rewrite(model.program());
    if (rewritten.declarations.size() != 1 || rewritten.declarations[0] != model.program().declarations[0])
    {
        std::cerr << "identity rewrite must return the original nodes\n";
        return false;
    }
    return true;
}

bool testTypeCasingFixer()
{
    const auto model = analyzeText("resource w 'Test.Provider/widgets@2024-01-01' = {\n"
                                   "  NAME: 'w'\n"
                                   "  Location: 'westus'\n"
                                   "  SKU: {\n"
                                   "    TIER: 'standard'\n"
                                   "  }\n"
                                   "  tags: {\n"
                                   "    Env: 'PROD'\n"
                                   "  }\n"
                                   "  properties: {\n"
                                   "    Mode: 'DISABLED'\n"
                                   "    displayname: 'enabled'\n"
                                   "    Unknown: 'x'\n"
                                   "  }\n"
                                   "}");
    llvmbicep::TypeCasingFixer fixer(model);
    return expectPrinted(fixer.rewriteProgram(),
                         "resource w 'Test.Provider/widgets@2024-01-01' = {\n"
                         "  name: 'w'\n"
                         "  location: 'westus'\n"
                         "  sku: {\n"
                         "    tier: 'Standard'\n"
                         "  }\n"
                         "  tags: {\n"
                         "    Env: 'PROD'\n"
                         "  }\n"
                         "  properties: {\n"
                         "    mode: 'Disabled'\n"
                         "    displayName: 'enabled'\n"
                         "    Unknown: 'x'\n"
                         "  }\n"
                         "}",
                         "type casing fixer");
}

bool testReadOnlyPropertyRemoval()
{
    const auto model = analyzeText("resource w 'Test.Provider/widgets@2024-01-01' = {\n"
                                   "  id: '/subscriptions/0/x'\n"
                                   "  name: 'w'\n"
                                   "  type: 'Test.Provider/widgets'\n"
                                   "  apiVersion: '2024-01-01'\n"
                                   "  properties: {\n"
                                   "    provisioningState: 'Succeeded'\n"
                                   "    nested: {\n"
                                   "      etag: 'abc'\n"
                                   "      sizeGB: 4\n"
                                   "    }\n"
                                   "  }\n"
                                   "}");
    llvmbicep::ReadOnlyPropertyRemoval pruner(model);
    return expectPrinted(pruner.rewriteProgram(),
                         "resource w 'Test.Provider/widgets@2024-01-01' = {\n"
                         "  name: 'w'\n"
                         "  properties: {\n"
                         "    nested: {\n"
                         "      sizeGB: 4\n"
                         "    }\n"
                         "  }\n"
                         "}",
                         "read-only removal");
}

bool testUnknownTypeIsLeftAlone()
{
    const std::string text  = "resource w 'Test.Provider/unknown@2024-01-01' = {\n  ID: 'x'\n  Mode: 'enabled'\n}";
    const auto        model = analyzeText(text);
    llvmbicep::TypeCasingFixer         fixer(model);
    llvmbicep::ReadOnlyPropertyRemoval pruner(model);
    return expectPrinted(fixer.rewriteProgram(), text, "fixer on unknown type") &&
           expectPrinted(pruner.rewriteProgram(), text, "pruner on unknown type");
}

}  // namespace

bool runRewriterTests()
{
    bool ok = true;
    ok      = testIdentityRewriteSharesNodes() && ok;
    ok      = testTypeCasingFixer() && ok;
    ok      = testReadOnlyPropertyRemoval() && ok;
    ok      = testUnknownTypeIsLeftAlone() && ok;
    return ok;
}
