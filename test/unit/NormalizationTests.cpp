//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmbicep/Frontend/Parser.h"
#include "llvmbicep/Frontend/SyntaxFactory.h"
#include "llvmbicep/Support/Errors.h"
#include "llvmbicep/Transforms/Normalization.h"

#include "TestCatalog.h"

namespace
{

class FailingViewBuilder final : public llvmbicep::SemanticViewBuilder
{
public:
    explicit FailingViewBuilder(unsigned failOnCall)
        : failOnCall_(failOnCall)
    {
    }

    llvm::Expected<llvmbicep::SemanticModel> build(const llvmbicep::Compilation&                  prior,
                                                   llvmbicep::ProgramSyntax                       program,
                                                   std::shared_ptr<const llvmbicep::FileResolver> fileResolver,
                                                   const llvmbicep::Configuration& configuration) const override
    {
        if (++calls_ == failOnCall_)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "view unavailable");
        }
        return inner_.build(prior, std::move(program), std::move(fileResolver), configuration);
    }

private:
    unsigned                              failOnCall_;
    mutable unsigned                      calls_{0};
    llvmbicep::DefaultSemanticViewBuilder inner_;
};

const char* const kMessyWidget = "resource w 'Test.Provider/widgets@2024-01-01' = {\n"
                                 "  ID: '/subscriptions/0/x'\n"
                                 "  NAME: 'w'\n"
                                 "  properties: {\n"
                                 "    MODE: 'enabled'\n"
                                 "    ProvisioningState: 'Succeeded'\n"
                                 "  }\n"
                                 "}\n";

bool testNormalizesToFixedPoint()
{
    const auto compilation = llvmbicep_test::compileTestDocument("");
    const auto source      = llvmbicep::parseProgram(kMessyWidget);
    if (!compilation || source.hasErrors())
    {
        std::cerr << "fixture setup failed\n";
        return false;
    }

    llvmbicep::DefaultSemanticViewBuilder builder;
    auto normalized = llvmbicep::normalizeDeclaration(*compilation, source.declarations[0], builder, {});
    if (!normalized)
    {
        std::cerr << "normalization failed: " << llvm::toString(normalized.takeError()) << "\n";
        return false;
    }
    const std::string expected = "resource w 'Test.Provider/widgets@2024-01-01' = {\n"
                                 "  name: 'w'\n"
                                 "  properties: {\n"
                                 "    mode: 'Enabled'\n"
                                 "  }\n"
                                 "}";
    if (*normalized != expected)
    {
        std::cerr << "unexpected normalized text:\n" << *normalized << "\n";
        return false;
    }

    const auto again = llvmbicep::parseProgram(*normalized);
    auto       second = llvmbicep::normalizeDeclaration(*compilation, again.declarations[0], builder, {});
    if (!second || *second != *normalized)
    {
        if (!second)
        {
            llvm::consumeError(second.takeError());
        }
        std::cerr << "normalization must be idempotent\n";
        return false;
    }
    return true;
}

bool testFormattingFollowsConfiguration()
{
    llvmbicep::Configuration configuration;
    configuration.formatting.indentKind         = llvmbicep::IndentKindOption::Tab;
    configuration.formatting.newline            = llvmbicep::NewlineOption::CRLF;
    configuration.formatting.insertFinalNewline = true;
    const auto compilation                      = llvmbicep_test::compileTestDocument("", configuration);

    const auto declaration = llvmbicep::makeResourceDeclaration(
        "w",
        "Test.Provider/widgets@2024-01-01",
        llvmbicep::makeObject({llvmbicep::makeObjectProperty("Location", llvmbicep::makeStringLiteral("x"))}));
    llvmbicep::DefaultSemanticViewBuilder builder;
    auto normalized = llvmbicep::normalizeDeclaration(*compilation, declaration, builder, {});
    if (!normalized || *normalized != "resource w 'Test.Provider/widgets@2024-01-01' = {\r\n\tlocation: 'x'\r\n}\r\n")
    {
        if (!normalized)
        {
            llvm::consumeError(normalized.takeError());
        }
        std::cerr << "normalized text must use the configured formatting\n";
        return false;
    }
    return true;
}

bool testCancellation()
{
    const auto                    compilation = llvmbicep_test::compileTestDocument("");
    const auto                    source      = llvmbicep::parseProgram(kMessyWidget);
    llvmbicep::CancellationSource cancellation;
    cancellation.cancel();

    llvmbicep::DefaultSemanticViewBuilder builder;
    auto normalized = llvmbicep::normalizeDeclaration(*compilation, source.declarations[0], builder, cancellation.token());
    if (normalized)
    {
        std::cerr << "cancelled normalization must not produce text\n";
        return false;
    }
    bool cancelled = false;
    llvm::handleAllErrors(normalized.takeError(),
                          [&](const llvmbicep::OperationCancelledError&) { cancelled = true; },
                          [](const llvm::ErrorInfoBase& other) {
                              std::cerr << "unexpected error: " << other.message() << "\n";
                          });
    if (!cancelled)
    {
        std::cerr << "expected OperationCancelledError\n";
        return false;
    }
    return true;
}

bool expectNormalizationError(const llvmbicep::SyntaxPtr&           declaration,
                              const llvmbicep::SemanticViewBuilder& builder,
                              unsigned                              iteration,
                              const char*                           stage)
{
    const auto compilation = llvmbicep_test::compileTestDocument("");
    auto       normalized  = llvmbicep::normalizeDeclaration(*compilation, declaration, builder, {});
    if (normalized)
    {
        std::cerr << "expected normalization to fail in stage " << stage << "\n";
        return false;
    }
    bool matched = false;
    llvm::handleAllErrors(normalized.takeError(),
                          [&](const llvmbicep::NormalizationError& error) {
                              matched = error.iteration() == iteration && error.stage() == stage;
                              if (!matched)
                              {
                                  std::cerr << "normalization failed at iteration " << error.iteration() << " stage "
                                            << error.stage() << "\n";
                              }
                          },
                          [](const llvm::ErrorInfoBase& other) {
                              std::cerr << "unexpected error: " << other.message() << "\n";
                          });
    return matched;
}

bool testFailures()
{
    const auto source = llvmbicep::parseProgram(kMessyWidget);

    bool ok = true;
    ok      = expectNormalizationError(source.declarations[0], FailingViewBuilder(5), 2, "recase") && ok;
    ok      = expectNormalizationError(source.declarations[0], FailingViewBuilder(2), 0, "prune") && ok;

    const auto unnamed =
        llvmbicep::makeResourceDeclaration("", "Test.Provider/widgets@2024-01-01", llvmbicep::makeObject({}));
    llvmbicep::DefaultSemanticViewBuilder builder;
    ok = expectNormalizationError(unnamed, builder, 0, "print") && ok;
    return ok;
}

}  // namespace

bool runNormalizationTests()
{
    bool ok = true;
    ok      = testNormalizesToFixedPoint() && ok;
    ok      = testFormattingFollowsConfiguration() && ok;
    ok      = testCancellation() && ok;
    ok      = testFailures() && ok;
    return ok;
}
