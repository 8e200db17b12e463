//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// File access abstraction shared by compilations.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SEMANTICS_FILE_RESOLVER_H
#define LLVMBICEP_SEMANTICS_FILE_RESOLVER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <map>
#include <memory>
#include <string>

namespace llvmbicep
{

/// @brief Reads files by path.
class FileResolver
{
public:
    virtual ~FileResolver() = default;

    /// @brief Reads the whole file at `path`.
    /// @return File contents, or an error naming the path.
    virtual llvm::Expected<std::string> readFile(llvm::StringRef path) const = 0;
};

/// @brief Reads files from the local file system.
class FileSystemResolver final : public FileResolver
{
public:
    llvm::Expected<std::string> readFile(llvm::StringRef path) const override;
};

/// @brief Serves registered in-memory files and defers everything else.
class InMemoryFileResolver final : public FileResolver
{
public:
    /// @param[in] fallback Resolver consulted for unregistered paths; may be null.
    explicit InMemoryFileResolver(std::shared_ptr<const FileResolver> fallback = nullptr);

    void addFile(std::string path, std::string contents);

    llvm::Expected<std::string> readFile(llvm::StringRef path) const override;

private:
    std::map<std::string, std::string, std::less<>> files_;
    std::shared_ptr<const FileResolver>             fallback_;
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_SEMANTICS_FILE_RESOLVER_H
