//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements edit construction and application.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Materialize/Edit.h"

#include <algorithm>

namespace llvmbicep
{

EditDescriptor makeInsertionEdit(std::string uri, const LineStarts& lineStarts, std::size_t offset, std::string text)
{
    const TextSpan span{std::min(offset, lineStarts.documentLength()), 0};
    return EditDescriptor{std::move(uri), span, lineStarts.rangeOf(span), std::move(text)};
}

std::string applyEdit(llvm::StringRef documentText, const EditDescriptor& edit)
{
    const std::size_t start = std::min(edit.span.offset, documentText.size());
    const std::size_t end   = std::min(edit.span.end(), documentText.size());

    std::string out;
    out.reserve(documentText.size() - (end - start) + edit.newText.size());
    out += documentText.take_front(start).str();
    out += edit.newText;
    out += documentText.drop_front(end).str();
    return out;
}

}  // namespace llvmbicep
