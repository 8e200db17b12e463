//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "llvmbicep/Materialize/Edit.h"
#include "llvmbicep/Materialize/InsertResourceHandler.h"
#include "llvmbicep/Support/Errors.h"

#include "TestCatalog.h"

namespace
{

const char* const kWidgetId = "/subscriptions/0000/resourceGroups/rg/providers/Test.Provider/widgets/main-widget_1";

class FixedCompilations final : public llvmbicep::CompilationProvider
{
public:
    void add(const std::string& uri, const std::string& text)
    {
        llvmbicep::CompilationContext context;
        context.uri         = uri;
        context.lineStarts  = llvmbicep::LineStarts::compute(text);
        context.compilation = llvmbicep::compileDocument(uri, text, llvmbicep_test::loadTestCatalog(), nullptr, {});
        contexts_[uri]      = std::move(context);
    }

    std::optional<llvmbicep::CompilationContext> getCompilation(llvm::StringRef uri) const override
    {
        const auto it = contexts_.find(uri.str());
        if (it == contexts_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::string, llvmbicep::CompilationContext> contexts_;
};

class FakeFetcher final : public llvmbicep::ResourceFetcher
{
public:
    llvm::Expected<std::optional<std::string>> fetch(const llvmbicep::ResourceId& resourceId,
                                                     const llvmbicep::CancellationToken&) override
    {
        fetchedIds.push_back(resourceId.fullyQualifiedId());
        if (fail)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "management endpoint unavailable");
        }
        return payload;
    }

    std::optional<std::string> payload;
    bool                       fail{false};
    std::vector<std::string>   fetchedIds;
};

class RecordingApplier final : public llvmbicep::EditApplier
{
public:
    llvm::Error apply(const llvmbicep::EditDescriptor& edit) override
    {
        edits.push_back(edit);
        return llvm::Error::success();
    }

    std::vector<llvmbicep::EditDescriptor> edits;
};

/// Fails the `failOnCall`-th view build; two builds run per normalization iteration.
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

    [[nodiscard]] unsigned calls() const
    {
        return calls_;
    }

private:
    unsigned                              failOnCall_;
    mutable unsigned                      calls_{0};
    llvmbicep::DefaultSemanticViewBuilder inner_;
};

const std::string kDocument = "resource existing 'Test.Provider/widgets@2024-01-01' = {\n"
                              "  name: 'existing'\n"
                              "}\n"
                              "\n";

const char* const kPayload = R"({
  "id": "/subscriptions/0000/resourceGroups/rg/providers/Test.Provider/widgets/main-widget_1",
  "name": "main-widget_1",
  "type": "Test.Provider/widgets",
  "location": "westus",
  "Properties": {
    "provisioningState": "Succeeded",
    "mode": "DISABLED",
    "displayName": "Main"
  }
})";

bool expectOutcome(llvm::Expected<llvmbicep::InsertResourceOutcome> actual,
                   llvmbicep::InsertResourceOutcome                 expected,
                   const char*                                      what)
{
    if (!actual)
    {
        std::cerr << what << ": unexpected error: " << llvm::toString(actual.takeError()) << "\n";
        return false;
    }
    if (*actual != expected)
    {
        std::cerr << what << ": outcome " << llvmbicep::insertResourceOutcomeName(*actual) << ", expected "
                  << llvmbicep::insertResourceOutcomeName(expected) << "\n";
        return false;
    }
    return true;
}

bool testInsertsNormalizedDeclaration()
{
    FixedCompilations compilations;
    compilations.add("file:///main.bicep", kDocument);
    FakeFetcher fetcher;
    fetcher.payload = kPayload;
    RecordingApplier applier;

    llvmbicep::InsertResourceHandler handler(compilations, fetcher, applier);
    if (!expectOutcome(handler.handle({"file:///main.bicep", {3, 0}, kWidgetId}, {}),
                       llvmbicep::InsertResourceOutcome::Applied,
                       "insert"))
    {
        return false;
    }
    if (applier.edits.size() != 1)
    {
        std::cerr << "expected exactly one applied edit\n";
        return false;
    }

    const auto& edit = applier.edits.front();
    if (edit.uri != "file:///main.bicep" || edit.span.offset != kDocument.size() - 1 || edit.span.length != 0 ||
        !(edit.range.start == llvmbicep::Position{3, 0}) || !(edit.range.end == llvmbicep::Position{3, 0}))
    {
        std::cerr << "edit must be an empty insertion at the requested position\n";
        return false;
    }

    const std::string expected = "resource mainwidget 'Test.Provider/widgets@2024-01-01' = {\n"
                                 "  name: 'main-widget_1'\n"
                                 "  location: 'westus'\n"
                                 "  properties: {\n"
                                 "    mode: 'Disabled'\n"
                                 "    displayName: 'Main'\n"
                                 "  }\n"
                                 "}";
    if (edit.newText != expected)
    {
        std::cerr << "unexpected inserted text:\n" << edit.newText << "\n";
        return false;
    }
    if (llvmbicep::applyEdit(kDocument, edit) != kDocument.substr(0, kDocument.size() - 1) + expected + "\n")
    {
        std::cerr << "applying the edit must splice the text at the insertion point\n";
        return false;
    }
    return true;
}

bool testPositionIsClamped()
{
    FixedCompilations compilations;
    compilations.add("file:///main.bicep", kDocument);
    FakeFetcher fetcher;
    fetcher.payload = R"({"name": "w"})";
    RecordingApplier applier;

    llvmbicep::InsertResourceHandler handler(compilations, fetcher, applier);
    if (!expectOutcome(handler.handle({"file:///main.bicep", {0, 500}, kWidgetId}, {}),
                       llvmbicep::InsertResourceOutcome::Applied,
                       "clamped insert"))
    {
        return false;
    }
    if (applier.edits.size() != 1 || applier.edits[0].span.offset != kDocument.find('\n'))
    {
        std::cerr << "a character past the line end must clamp to the line end\n";
        return false;
    }
    return true;
}

bool testSilentAborts()
{
    FixedCompilations compilations;
    compilations.add("file:///main.bicep", kDocument);
    FakeFetcher fetcher;
    fetcher.payload = kPayload;
    RecordingApplier                 applier;
    llvmbicep::InsertResourceHandler handler(compilations, fetcher, applier);

    bool ok = true;
    ok      = expectOutcome(handler.handle({"file:///other.bicep", {0, 0}, kWidgetId}, {}),
                       llvmbicep::InsertResourceOutcome::DocumentNotFound,
                       "unknown document") &&
         ok;
    ok = expectOutcome(handler.handle({"file:///main.bicep", {0, 0}, "not/a/resource/id"}, {}),
                       llvmbicep::InsertResourceOutcome::InvalidResourceId,
                       "malformed id") &&
         ok;
    ok = expectOutcome(handler.handle({"file:///main.bicep",
                                       {0, 0},
                                       "/subscriptions/0000/resourceGroups/rg/providers/Other.Provider/things/t"},
                                      {}),
                       llvmbicep::InsertResourceOutcome::NoMatchingType,
                       "unknown type") &&
         ok;
    if (fetcher.fetchedIds.size() != 0)
    {
        std::cerr << "nothing may be fetched before a type matches\n";
        ok = false;
    }

    fetcher.payload.reset();
    ok = expectOutcome(handler.handle({"file:///main.bicep", {0, 0}, kWidgetId}, {}),
                       llvmbicep::InsertResourceOutcome::NoPayload,
                       "missing payload") &&
         ok;
    if (!applier.edits.empty())
    {
        std::cerr << "silent aborts must not apply edits\n";
        ok = false;
    }
    return ok;
}

bool expectFailureWithoutEdit(FakeFetcher& fetcher, const llvmbicep::SemanticViewBuilder* builder, const char* what)
{
    FixedCompilations compilations;
    compilations.add("file:///main.bicep", kDocument);
    RecordingApplier                 applier;
    llvmbicep::InsertResourceHandler handler(compilations, fetcher, applier, builder);

    auto outcome = handler.handle({"file:///main.bicep", {0, 0}, kWidgetId}, {});
    if (outcome)
    {
        std::cerr << what << ": expected an error, got " << llvmbicep::insertResourceOutcomeName(*outcome) << "\n";
        return false;
    }
    llvm::consumeError(outcome.takeError());
    if (!applier.edits.empty())
    {
        std::cerr << what << ": failed requests must not apply edits\n";
        return false;
    }
    return true;
}

bool testFailuresApplyNothing()
{
    bool ok = true;

    FakeFetcher unreachable;
    unreachable.fail = true;
    ok               = expectFailureWithoutEdit(unreachable, nullptr, "fetch failure") && ok;

    FakeFetcher garbage;
    garbage.payload = "{\"name\": ";
    ok              = expectFailureWithoutEdit(garbage, nullptr, "malformed payload") && ok;

    FakeFetcher        valid;
    FailingViewBuilder rejecting(1);
    valid.payload = kPayload;
    ok            = expectFailureWithoutEdit(valid, &rejecting, "normalization failure") && ok;
    return ok;
}

bool testLateNormalizationFailureAppliesNothing()
{
    FixedCompilations compilations;
    compilations.add("file:///main.bicep", kDocument);
    FakeFetcher fetcher;
    fetcher.payload = kPayload;
    RecordingApplier applier;
    // Call 5 is the recase build of the third iteration.
    FailingViewBuilder               builder(5);
    llvmbicep::InsertResourceHandler handler(compilations, fetcher, applier, &builder);

    auto outcome = handler.handle({"file:///main.bicep", {3, 0}, kWidgetId}, {});
    if (outcome)
    {
        std::cerr << "third-iteration failure: expected an error, got "
                  << llvmbicep::insertResourceOutcomeName(*outcome) << "\n";
        return false;
    }
    bool sawIteration = false;
    llvm::handleAllErrors(outcome.takeError(),
                          [&](const llvmbicep::NormalizationError& error) {
                              sawIteration = error.iteration() == 2 && error.stage() == "recase";
                          },
                          [](const llvm::ErrorInfoBase& other) {
                              std::cerr << "unexpected error: " << other.message() << "\n";
                          });
    if (!sawIteration || builder.calls() != 5)
    {
        std::cerr << "expected a normalization error from the third iteration\n";
        return false;
    }
    if (!applier.edits.empty())
    {
        std::cerr << "a failure mid-normalization must not apply an edit\n";
        return false;
    }
    return true;
}

bool testCancellationPropagates()
{
    FixedCompilations compilations;
    compilations.add("file:///main.bicep", kDocument);
    FakeFetcher fetcher;
    fetcher.payload = kPayload;
    RecordingApplier                 applier;
    llvmbicep::InsertResourceHandler handler(compilations, fetcher, applier);

    llvmbicep::CancellationSource source;
    source.cancel();
    auto outcome = handler.handle({"file:///main.bicep", {0, 0}, kWidgetId}, source.token());
    if (outcome)
    {
        std::cerr << "cancelled request must not succeed\n";
        return false;
    }
    bool cancelled = false;
    llvm::handleAllErrors(outcome.takeError(),
                          [&](const llvmbicep::OperationCancelledError&) { cancelled = true; },
                          [](const llvm::ErrorInfoBase& other) {
                              std::cerr << "unexpected error: " << other.message() << "\n";
                          });
    return cancelled && applier.edits.empty();
}

}  // namespace

bool runInsertResourceHandlerTests()
{
    bool ok = true;
    ok      = testInsertsNormalizedDeclaration() && ok;
    ok      = testPositionIsClamped() && ok;
    ok      = testSilentAborts() && ok;
    ok      = testFailuresApplyNothing() && ok;
    ok      = testLateNormalizationFailureAppliesNothing() && ok;
    ok      = testCancellationPropagates() && ok;
    return ok;
}
