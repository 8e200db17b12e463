//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the snapshot directory fetcher.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Materialize/ResourceFetcher.h"

#include "llvmbicep/Support/Errors.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

namespace llvmbicep
{

SnapshotResourceFetcher::SnapshotResourceFetcher(std::string directory)
    : directory_(std::move(directory))
{
}

std::string SnapshotResourceFetcher::snapshotPath(const ResourceId& resourceId) const
{
    llvm::SmallString<256> path(directory_);
    llvm::StringRef        relative = resourceId.fullyQualifiedId();
    (void) relative.consume_front("/");
    llvm::sys::path::append(path, relative.str() + ".json");
    return path.str().str();
}

llvm::Expected<std::optional<std::string>> SnapshotResourceFetcher::fetch(const ResourceId&        resourceId,
                                                                          const CancellationToken& cancellation)
{
    if (cancellation.isCancellationRequested())
    {
        return llvm::make_error<OperationCancelledError>();
    }
    if (directory_.empty())
    {
        return std::nullopt;
    }

    const std::string path = snapshotPath(resourceId);
    if (!llvm::sys::fs::exists(path))
    {
        return std::nullopt;
    }
    auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(),
                                       "failed to read snapshot %s: %s",
                                       path.c_str(),
                                       buffer.getError().message().c_str());
    }
    return std::optional<std::string>((*buffer)->getBuffer().str());
}

}  // namespace llvmbicep
