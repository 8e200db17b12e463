//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Character-offset spans and line/column mapping for document text.
///
/// Offsets and character columns are counted in bytes of the stored UTF-8 text.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SUPPORT_TEXT_SPAN_H
#define LLVMBICEP_SUPPORT_TEXT_SPAN_H

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace llvmbicep
{

/// @brief Half-open character range `[offset, offset + length)`.
struct TextSpan final
{
    /// @brief Start offset.
    std::size_t offset{0};

    /// @brief Span length.
    std::size_t length{0};

    /// @brief Returns the exclusive end offset.
    [[nodiscard]] std::size_t end() const
    {
        return offset + length;
    }

    /// @brief Formats the span as `[offset:end]`.
    [[nodiscard]] std::string str() const;

    /// @brief Returns the smallest span covering both `lhs` and `rhs`.
    [[nodiscard]] static TextSpan between(const TextSpan& lhs, const TextSpan& rhs);
};

/// @brief Zero-based line/character document position.
struct Position final
{
    std::uint32_t line{0};
    std::uint32_t character{0};

    friend bool operator==(const Position& lhs, const Position& rhs)
    {
        return lhs.line == rhs.line && lhs.character == rhs.character;
    }
};

/// @brief Zero-based line/character document range.
struct Range final
{
    Position start;
    Position end;
};

/// @brief Offsets of the first character of every line in a document.
class LineStarts final
{
public:
    LineStarts() = default;

    /// @brief Scans `text` for line breaks.
    /// @param[in] text Document text.
    /// @return Line-start table; `\n`, `\r\n` and lone `\r` all end a line.
    [[nodiscard]] static LineStarts compute(llvm::StringRef text);

    /// @brief Converts a position to an offset.
    ///
    /// Lines past the end clamp to the document end; characters past the end of
    /// a line clamp to that line's terminator.
    [[nodiscard]] std::size_t offsetOf(const Position& position) const;

    /// @brief Converts an offset to a position.
    [[nodiscard]] Position positionOf(std::size_t offset) const;

    /// @brief Converts a span to a start/end range.
    [[nodiscard]] Range rangeOf(const TextSpan& span) const;

    /// @brief Returns the total document length the table was computed over.
    [[nodiscard]] std::size_t documentLength() const
    {
        return documentLength_;
    }

    /// @brief Returns the number of lines (at least one).
    [[nodiscard]] std::size_t lineCount() const
    {
        return starts_.size();
    }

private:
    std::vector<std::size_t> starts_{0};
    std::vector<std::size_t> ends_;
    std::size_t              documentLength_{0};
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_SUPPORT_TEXT_SPAN_H
