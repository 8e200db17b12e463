//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Overlay document state for open editor buffers.
///
/// The document store keeps in-memory text and version metadata keyed by URI.
/// It is shared between the message loop and the request worker, so every
/// accessor returns copies taken under a lock.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_LSP_DOCUMENT_STORE_H
#define LLVMBICEP_LSP_DOCUMENT_STORE_H

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llvmbicep::lsp
{

/// @brief Snapshot of one open document.
struct DocumentSnapshot final
{
    /// @brief LSP document URI.
    std::string uri;

    /// @brief Full document text.
    std::string text;

    /// @brief LSP document version.
    std::int64_t version{0};
};

/// @brief Tracks open-document overlays keyed by URI.
class DocumentStore final
{
public:
    /// @brief Registers a document as opened, replacing any previous overlay.
    void open(std::string uri, std::string text, std::int64_t version);

    /// @brief Applies a full-text replacement for an existing open document.
    /// @return `true` when the document exists and is updated.
    [[nodiscard]] bool applyFullTextChange(const std::string& uri, std::string text, std::int64_t version);

    /// @brief Closes a document and removes its overlay entry.
    /// @return `true` when an entry existed and was removed.
    [[nodiscard]] bool close(const std::string& uri);

    /// @brief Looks up a document snapshot by URI.
    /// @return Copy of the snapshot, or `std::nullopt` when the document is not open.
    [[nodiscard]] std::optional<DocumentSnapshot> lookup(const std::string& uri) const;

    /// @brief Returns a copy of all open document snapshots ordered by URI.
    [[nodiscard]] std::vector<DocumentSnapshot> snapshots() const;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex                                mutex_;
    std::unordered_map<std::string, DocumentSnapshot> documents_;
};

}  // namespace llvmbicep::lsp

#endif  // LLVMBICEP_LSP_DOCUMENT_STORE_H
