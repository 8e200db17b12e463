//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements cached compilation snapshots for open documents.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/LSP/CompilationManager.h"

#include <utility>

namespace llvmbicep::lsp
{
namespace
{

llvm::Error mergeCatalogFile(const FileResolver& resolver, const std::string& path, ResourceTypeCatalog& catalog)
{
    auto text = resolver.readFile(path);
    if (!text)
    {
        return text.takeError();
    }
    auto extra = loadResourceTypeCatalog(*text, path);
    if (!extra)
    {
        return extra.takeError();
    }
    catalog.merge(*extra);
    return llvm::Error::success();
}

}  // namespace

CompilationManager::CompilationManager(const DocumentStore& documents, std::shared_ptr<const FileResolver> fileResolver)
    : documents_(documents)
    , fileResolver_(fileResolver ? std::move(fileResolver) : std::make_shared<FileSystemResolver>())
    , catalog_(std::make_shared<ResourceTypeCatalog>())
{
}

llvm::Error CompilationManager::reconfigure(const ServerConfig& config)
{
    auto        catalog = std::make_shared<ResourceTypeCatalog>();
    llvm::Error failure = llvm::Error::success();

    if (config.includeBuiltinTypes)
    {
        auto builtin = loadBuiltinResourceTypeCatalog();
        if (builtin)
        {
            catalog->merge(*builtin);
        }
        else
        {
            failure = llvm::joinErrors(std::move(failure), builtin.takeError());
        }
    }

    if (!config.typeCatalogPath.empty())
    {
        failure = llvm::joinErrors(std::move(failure), mergeCatalogFile(*fileResolver_, config.typeCatalogPath, *catalog));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    catalog_       = std::move(catalog);
    configuration_ = config.compilation;
    ++generation_;
    cache_.clear();
    return failure;
}

std::optional<CompilationContext> CompilationManager::getCompilation(const llvm::StringRef uri) const
{
    const auto snapshot = documents_.lookup(uri.str());
    if (!snapshot)
    {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  cached = cache_.find(uri);
    if (cached != cache_.end() && cached->second.generation == generation_ && cached->second.text == snapshot->text)
    {
        return cached->second.context;
    }

    CompilationContext context{snapshot->uri,
                               LineStarts::compute(snapshot->text),
                               compileDocument(snapshot->uri, snapshot->text, catalog_, fileResolver_, configuration_)};
    cache_.insert_or_assign(snapshot->uri, CacheEntry{snapshot->text, generation_, context});
    return context;
}

void CompilationManager::forget(const llvm::StringRef uri)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = cache_.find(uri);
    if (it != cache_.end())
    {
        cache_.erase(it);
    }
}

std::shared_ptr<const ResourceTypeCatalog> CompilationManager::catalog() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return catalog_;
}

}  // namespace llvmbicep::lsp
