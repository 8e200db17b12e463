//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Text edits produced for host documents.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_MATERIALIZE_EDIT_H
#define LLVMBICEP_MATERIALIZE_EDIT_H

#include "llvmbicep/Support/TextSpan.h"

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <string>

namespace llvmbicep
{

/// @brief One replacement in one document.
struct EditDescriptor final
{
    std::string uri;

    /// @brief Replaced character span.
    TextSpan span;

    /// @brief `span` mapped to line/character positions.
    Range range;

    std::string newText;
};

/// @brief Builds a zero-length insertion at `offset`.
///
/// `offset` is clamped to the document length recorded in `lineStarts`.
[[nodiscard]] EditDescriptor makeInsertionEdit(std::string       uri,
                                               const LineStarts& lineStarts,
                                               std::size_t       offset,
                                               std::string       text);

/// @brief Applies `edit` to `documentText`.
[[nodiscard]] std::string applyEdit(llvm::StringRef documentText, const EditDescriptor& edit);

}  // namespace llvmbicep

#endif  // LLVMBICEP_MATERIALIZE_EDIT_H
