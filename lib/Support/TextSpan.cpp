//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements text span formatting and line-start position mapping.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Support/TextSpan.h"

#include <algorithm>
#include <sstream>

namespace llvmbicep
{

std::string TextSpan::str() const
{
    std::ostringstream out;
    out << '[' << offset << ':' << end() << ']';
    return out.str();
}

TextSpan TextSpan::between(const TextSpan& lhs, const TextSpan& rhs)
{
    const std::size_t start = std::min(lhs.offset, rhs.offset);
    const std::size_t stop  = std::max(lhs.end(), rhs.end());
    return TextSpan{start, stop - start};
}

LineStarts LineStarts::compute(llvm::StringRef text)
{
    LineStarts out;
    out.documentLength_ = text.size();
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\r')
        {
            out.ends_.push_back(i);
            if (i + 1 < text.size() && text[i + 1] == '\n')
            {
                ++i;
            }
            out.starts_.push_back(i + 1);
        }
        else if (text[i] == '\n')
        {
            out.ends_.push_back(i);
            out.starts_.push_back(i + 1);
        }
    }
    out.ends_.push_back(text.size());
    return out;
}

std::size_t LineStarts::offsetOf(const Position& position) const
{
    if (position.line >= starts_.size())
    {
        return documentLength_;
    }
    const std::size_t lineStart = starts_[position.line];
    const std::size_t lineEnd   = position.line < ends_.size() ? ends_[position.line] : documentLength_;
    return std::min(lineStart + position.character, lineEnd);
}

Position LineStarts::positionOf(const std::size_t offset) const
{
    const std::size_t clamped = std::min(offset, documentLength_);
    const auto        it      = std::upper_bound(starts_.begin(), starts_.end(), clamped);
    const std::size_t line    = static_cast<std::size_t>(std::distance(starts_.begin(), it)) - 1U;
    return Position{static_cast<std::uint32_t>(line), static_cast<std::uint32_t>(clamped - starts_[line])};
}

Range LineStarts::rangeOf(const TextSpan& span) const
{
    return Range{positionOf(span.offset), positionOf(span.end())};
}

}  // namespace llvmbicep
