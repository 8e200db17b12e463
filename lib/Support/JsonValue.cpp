//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the order-preserving JSON reader.
///
/// Documents are tokenized by the `nlohmann::ordered_json` SAX parser; the
/// builder below assembles @ref JsonValue trees from its events so that
/// numbers keep their spelling.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Support/JsonValue.h"

#include "llvm/Support/FormatVariadic.h"

#include <nlohmann/json.hpp>

#include <limits>
#include <type_traits>
#include <utility>

namespace llvmbicep
{
namespace
{

bool isIntegerSpelling(llvm::StringRef text)
{
    return !text.empty() && text.find_first_of(".eE") == llvm::StringRef::npos;
}

/// Builds a @ref JsonValue from SAX events.
class OrderedJsonBuilder final : public nlohmann::json_sax<nlohmann::ordered_json>
{
public:
    bool null() override
    {
        return put(JsonValue(nullptr));
    }

    bool boolean(bool val) override
    {
        return put(JsonValue(val));
    }

    bool number_integer(number_integer_t val) override
    {
        return put(JsonValue(JsonNumber{std::to_string(val)}));
    }

    bool number_unsigned(number_unsigned_t val) override
    {
        return put(JsonValue(JsonNumber{std::to_string(val)}));
    }

    /// `s` is the number as spelled in the document.
    bool number_float(number_float_t /*val*/, const string_t& s) override
    {
        return put(JsonValue(JsonNumber{s}));
    }

    bool string(string_t& val) override
    {
        return put(JsonValue(std::move(val)));
    }

    bool binary(binary_t& /*val*/) override
    {
        error_ = "binary values are not JSON";
        return false;
    }

    bool start_object(std::size_t /*elements*/) override
    {
        frames_.push_back(Frame{true, {}, {}, {}});
        return true;
    }

    bool key(string_t& val) override
    {
        frames_.back().pendingKey = std::move(val);
        return true;
    }

    bool end_object() override
    {
        JsonObject members = std::move(frames_.back().members);
        frames_.pop_back();
        return put(JsonValue(std::move(members)));
    }

    bool start_array(std::size_t /*elements*/) override
    {
        frames_.push_back(Frame{false, {}, {}, {}});
        return true;
    }

    bool end_array() override
    {
        JsonArray elements = std::move(frames_.back().elements);
        frames_.pop_back();
        return put(JsonValue(std::move(elements)));
    }

    bool parse_error(std::size_t position, const std::string& /*lastToken*/, const nlohmann::ordered_json::exception& ex)
        override
    {
        error_ = llvm::formatv("invalid JSON at offset {0}: {1}", position, ex.what()).str();
        return false;
    }

    [[nodiscard]] llvm::Expected<JsonValue> takeResult(const bool accepted)
    {
        if (!accepted || !error_.empty())
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           error_.empty() ? std::string("invalid JSON document") : error_);
        }
        return std::move(root_);
    }

private:
    struct Frame
    {
        bool        isObject;
        JsonObject  members;
        JsonArray   elements;
        std::string pendingKey;
    };

    bool put(JsonValue value)
    {
        if (frames_.empty())
        {
            root_ = std::move(value);
        }
        else if (frames_.back().isObject)
        {
            frames_.back().members.push_back(JsonMember{std::move(frames_.back().pendingKey), std::move(value)});
        }
        else
        {
            frames_.back().elements.push_back(std::move(value));
        }
        return true;
    }

    std::vector<Frame> frames_;
    JsonValue          root_;
    std::string        error_;
};

}  // namespace

std::optional<std::int32_t> JsonNumber::asInt32() const
{
    const auto wide = asInt64();
    if (!wide || *wide < std::numeric_limits<std::int32_t>::min() || *wide > std::numeric_limits<std::int32_t>::max())
    {
        return std::nullopt;
    }
    return static_cast<std::int32_t>(*wide);
}

std::optional<std::int64_t> JsonNumber::asInt64() const
{
    if (!isIntegerSpelling(text))
    {
        return std::nullopt;
    }
    std::int64_t value = 0;
    if (llvm::StringRef(text).getAsInteger(10, value))
    {
        return std::nullopt;
    }
    return value;
}

JsonValue::JsonValue(JsonObject object)
    : storage_(std::move(object))
{
}

JsonValue::JsonValue(JsonArray array)
    : storage_(std::move(array))
{
}

JsonValue::JsonValue(std::string text)
    : storage_(std::move(text))
{
}

JsonValue::JsonValue(const char* text)
    : storage_(std::string(text))
{
}

JsonValue::JsonValue(JsonNumber number)
    : storage_(std::move(number))
{
}

JsonValue::JsonValue(const bool value)
    : storage_(value)
{
}

JsonValue::JsonValue(std::nullptr_t)
    : storage_(nullptr)
{
}

JsonKind JsonValue::kind() const
{
    return std::visit(
        [](const auto& alternative) -> JsonKind {
            using T = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<T, JsonUndefined>)
            {
                return JsonKind::Undefined;
            }
            else if constexpr (std::is_same_v<T, JsonObject>)
            {
                return JsonKind::Object;
            }
            else if constexpr (std::is_same_v<T, JsonArray>)
            {
                return JsonKind::Array;
            }
            else if constexpr (std::is_same_v<T, std::string>)
            {
                return JsonKind::String;
            }
            else if constexpr (std::is_same_v<T, JsonNumber>)
            {
                return JsonKind::Number;
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                return JsonKind::Bool;
            }
            else
            {
                static_assert(std::is_same_v<T, std::nullptr_t>, "unhandled JSON alternative");
                return JsonKind::Null;
            }
        },
        storage_);
}

const JsonValue* JsonValue::member(llvm::StringRef key) const
{
    const JsonObject* object = getAsObject();
    if (!object)
    {
        return nullptr;
    }
    for (const JsonMember& m : *object)
    {
        if (m.key == key)
        {
            return &m.value;
        }
    }
    return nullptr;
}

llvm::Expected<JsonValue> parseOrderedJson(llvm::StringRef text)
{
    OrderedJsonBuilder builder;
    const bool         accepted = nlohmann::ordered_json::sax_parse(text.begin(), text.end(), &builder);
    return builder.takeResult(accepted);
}

}  // namespace llvmbicep
