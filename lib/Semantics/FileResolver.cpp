//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements file-system and in-memory file resolvers.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Semantics/FileResolver.h"

#include "llvm/Support/MemoryBuffer.h"

namespace llvmbicep
{

llvm::Expected<std::string> FileSystemResolver::readFile(llvm::StringRef path) const
{
    auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(),
                                       "failed to read %s: %s",
                                       path.str().c_str(),
                                       buffer.getError().message().c_str());
    }
    return (*buffer)->getBuffer().str();
}

InMemoryFileResolver::InMemoryFileResolver(std::shared_ptr<const FileResolver> fallback)
    : fallback_(std::move(fallback))
{
}

void InMemoryFileResolver::addFile(std::string path, std::string contents)
{
    files_[std::move(path)] = std::move(contents);
}

llvm::Expected<std::string> InMemoryFileResolver::readFile(llvm::StringRef path) const
{
    const auto it = files_.find(path);
    if (it != files_.end())
    {
        return it->second;
    }
    if (fallback_)
    {
        return fallback_->readFile(path);
    }
    return llvm::createStringError(std::make_error_code(std::errc::no_such_file_or_directory),
                                   "failed to read %s: no such file",
                                   path.str().c_str());
}

}  // namespace llvmbicep
