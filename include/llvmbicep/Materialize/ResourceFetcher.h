//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Retrieval of remote resource payloads.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_MATERIALIZE_RESOURCE_FETCHER_H
#define LLVMBICEP_MATERIALIZE_RESOURCE_FETCHER_H

#include "llvmbicep/Materialize/ResourceId.h"
#include "llvmbicep/Support/Cancellation.h"

#include "llvm/Support/Error.h"

#include <optional>
#include <string>

namespace llvmbicep
{

/// @brief Fetches the current JSON representation of a resource.
class ResourceFetcher
{
public:
    virtual ~ResourceFetcher() = default;

    /// @param[in] resourceId Resource to fetch.
    /// @param[in] cancellation Cancellation token.
    /// @return Payload text, `std::nullopt` when the resource has no payload,
    ///         or an error for transport failures.
    virtual llvm::Expected<std::optional<std::string>> fetch(const ResourceId&        resourceId,
                                                             const CancellationToken& cancellation) = 0;
};

/// @brief Serves payloads saved as `<directory>/<resource id without leading '/'>.json`.
class SnapshotResourceFetcher final : public ResourceFetcher
{
public:
    /// @param[in] directory Snapshot root; an empty path serves no payloads.
    explicit SnapshotResourceFetcher(std::string directory);

    llvm::Expected<std::optional<std::string>> fetch(const ResourceId&        resourceId,
                                                     const CancellationToken& cancellation) override;

    /// @brief Returns the file path a resource maps to.
    [[nodiscard]] std::string snapshotPath(const ResourceId& resourceId) const;

private:
    std::string directory_;
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_MATERIALIZE_RESOURCE_FETCHER_H
