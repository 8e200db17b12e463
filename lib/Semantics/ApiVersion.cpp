//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements API version ordering.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Semantics/ApiVersion.h"

#include "llvm/ADT/StringExtras.h"

#include <optional>

namespace llvmbicep
{
namespace
{

struct DatedVersion
{
    llvm::StringRef date;
    llvm::StringRef suffix;
};

std::optional<DatedVersion> splitDatedVersion(llvm::StringRef text)
{
    constexpr std::size_t kDateLength = 10;
    if (text.size() < kDateLength)
    {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < kDateLength; ++i)
    {
        const bool separator = (i == 4 || i == 7);
        if (separator ? text[i] != '-' : !llvm::isDigit(text[i]))
        {
            return std::nullopt;
        }
    }
    if (text.size() == kDateLength)
    {
        return DatedVersion{text, {}};
    }
    if (text[kDateLength] != '-' || text.size() == kDateLength + 1)
    {
        return std::nullopt;
    }
    return DatedVersion{text.take_front(kDateLength), text.drop_front(kDateLength + 1)};
}

int sign(int value)
{
    return (value > 0) - (value < 0);
}

}  // namespace

int compareApiVersions(llvm::StringRef lhs, llvm::StringRef rhs)
{
    const auto lhsDated = splitDatedVersion(lhs);
    const auto rhsDated = splitDatedVersion(rhs);

    if (lhsDated && rhsDated)
    {
        if (const int byDate = lhsDated->date.compare(rhsDated->date))
        {
            return byDate;
        }
        if (lhsDated->suffix.empty() != rhsDated->suffix.empty())
        {
            return lhsDated->suffix.empty() ? 1 : -1;
        }
        if (const int bySuffix = lhsDated->suffix.compare_insensitive(rhsDated->suffix))
        {
            return bySuffix;
        }
    }
    else if (lhsDated || rhsDated)
    {
        return lhsDated ? 1 : -1;
    }
    else if (const int undated = lhs.compare_insensitive(rhs))
    {
        return undated;
    }
    return sign(lhs.compare(rhs));
}

}  // namespace llvmbicep
