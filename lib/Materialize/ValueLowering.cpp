//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON to expression lowering.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Materialize/ValueLowering.h"

#include "llvmbicep/Frontend/SyntaxFactory.h"
#include "llvmbicep/Support/Errors.h"

#include <type_traits>

namespace llvmbicep
{

llvm::Expected<SyntaxPtr> lowerJsonValue(const JsonValue& value)
{
    return std::visit(
        [](const auto& alternative) -> llvm::Expected<SyntaxPtr> {
            using T = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<T, JsonObject>)
            {
                std::vector<SyntaxPtr> properties;
                properties.reserve(alternative.size());
                for (const auto& member : alternative)
                {
                    auto lowered = lowerJsonValue(member.value);
                    if (!lowered)
                    {
                        return lowered.takeError();
                    }
                    properties.push_back(makeObjectProperty(member.key, std::move(*lowered)));
                }
                return makeObject(std::move(properties));
            }
            else if constexpr (std::is_same_v<T, JsonArray>)
            {
                std::vector<SyntaxPtr> items;
                items.reserve(alternative.size());
                for (const auto& element : alternative)
                {
                    auto lowered = lowerJsonValue(element);
                    if (!lowered)
                    {
                        return lowered.takeError();
                    }
                    items.push_back(std::move(*lowered));
                }
                return makeArray(std::move(items));
            }
            else if constexpr (std::is_same_v<T, std::string>)
            {
                return makeStringLiteral(alternative);
            }
            else if constexpr (std::is_same_v<T, JsonNumber>)
            {
                if (const auto integer = alternative.asInt32())
                {
                    return makeIntegerLiteral(*integer);
                }
                return makeStringLiteral(alternative.text);
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                return makeBooleanLiteral(alternative);
            }
            else if constexpr (std::is_same_v<T, std::nullptr_t>)
            {
                return makeNullLiteral();
            }
            else
            {
                static_assert(std::is_same_v<T, JsonUndefined>, "unhandled JSON alternative");
                return llvm::make_error<SynthesisError>("failed to lower JSON: value kind 'undefined' is not supported");
            }
        },
        value.storage());
}

}  // namespace llvmbicep
