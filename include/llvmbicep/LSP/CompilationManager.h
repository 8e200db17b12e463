//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Compilation snapshots of open documents.
///
/// The manager owns the active resource type catalog and configuration, and
/// caches one compilation per open document until its text or the
/// configuration changes.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_LSP_COMPILATION_MANAGER_H
#define LLVMBICEP_LSP_COMPILATION_MANAGER_H

#include "llvmbicep/LSP/DocumentStore.h"
#include "llvmbicep/LSP/ServerConfig.h"
#include "llvmbicep/Semantics/Compilation.h"
#include "llvmbicep/Semantics/FileResolver.h"
#include "llvmbicep/Semantics/ResourceTypes.h"

#include "llvm/Support/Error.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace llvmbicep::lsp
{

/// @brief Thread-safe @ref CompilationProvider over a @ref DocumentStore.
class CompilationManager final : public CompilationProvider
{
public:
    CompilationManager(const DocumentStore& documents, std::shared_ptr<const FileResolver> fileResolver);

    /// @brief Rebuilds the catalog and adopts the compilation settings of `config`.
    ///
    /// When the extra catalog cannot be read or parsed the built-in catalog is
    /// still installed and the failure is returned.
    llvm::Error reconfigure(const ServerConfig& config);

    [[nodiscard]] std::optional<CompilationContext> getCompilation(llvm::StringRef uri) const override;

    /// @brief Drops the cached compilation of a closed document.
    void forget(llvm::StringRef uri);

    /// @brief Returns the active catalog.
    [[nodiscard]] std::shared_ptr<const ResourceTypeCatalog> catalog() const;

private:
    struct CacheEntry final
    {
        std::string        text;
        std::uint64_t      generation{0};
        CompilationContext context;
    };

    const DocumentStore&                                   documents_;
    std::shared_ptr<const FileResolver>                    fileResolver_;
    mutable std::mutex                                     mutex_;
    std::shared_ptr<const ResourceTypeCatalog>             catalog_;
    Configuration                                          configuration_;
    std::uint64_t                                          generation_{0};
    mutable std::map<std::string, CacheEntry, std::less<>> cache_;
};

}  // namespace llvmbicep::lsp

#endif  // LLVMBICEP_LSP_COMPILATION_MANAGER_H
