//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Order-preserving JSON document model for remote resource payloads.
///
/// `llvm::json::Object` is hash-ordered, but object member order of a resource
/// payload becomes the property order of the generated declaration, so payloads
/// are read into this insertion-ordered tree instead. Numbers keep their
/// lexical spelling so that values outside the 64-bit range survive unchanged.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SUPPORT_JSON_VALUE_H
#define LLVMBICEP_SUPPORT_JSON_VALUE_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace llvmbicep
{

struct JsonMember;
class JsonValue;

/// @brief Discriminator for @ref JsonValue alternatives.
enum class JsonKind
{
    /// @brief No value; the state of a default-constructed @ref JsonValue.
    Undefined,
    Object,
    Array,
    String,
    Number,
    Bool,
    Null,
};

/// @brief Absent value marker.
struct JsonUndefined final
{
};

/// @brief JSON number kept in its lexical form.
struct JsonNumber final
{
    /// @brief Number spelling exactly as it appeared in the document.
    std::string text;

    /// @brief Returns the value when `text` is an integer literal that fits `int32_t`.
    [[nodiscard]] std::optional<std::int32_t> asInt32() const;

    /// @brief Returns the value when `text` is an integer literal that fits `int64_t`.
    [[nodiscard]] std::optional<std::int64_t> asInt64() const;
};

/// @brief Ordered object member list.
using JsonObject = std::vector<JsonMember>;

/// @brief Ordered array element list.
using JsonArray = std::vector<JsonValue>;

/// @brief Untyped JSON tree node.
class JsonValue final
{
public:
    using Storage = std::variant<JsonUndefined, JsonObject, JsonArray, std::string, JsonNumber, bool, std::nullptr_t>;

    JsonValue() = default;
    JsonValue(JsonObject object);
    JsonValue(JsonArray array);
    JsonValue(std::string text);
    JsonValue(const char* text);
    JsonValue(JsonNumber number);
    JsonValue(bool value);
    JsonValue(std::nullptr_t);

    /// @brief Returns the active alternative.
    [[nodiscard]] JsonKind kind() const;

    [[nodiscard]] const Storage& storage() const
    {
        return storage_;
    }

    [[nodiscard]] const JsonObject* getAsObject() const
    {
        return std::get_if<JsonObject>(&storage_);
    }

    [[nodiscard]] const JsonArray* getAsArray() const
    {
        return std::get_if<JsonArray>(&storage_);
    }

    [[nodiscard]] const std::string* getAsString() const
    {
        return std::get_if<std::string>(&storage_);
    }

    [[nodiscard]] const JsonNumber* getAsNumber() const
    {
        return std::get_if<JsonNumber>(&storage_);
    }

    /// @brief Looks up the first member named `key` when this is an object.
    [[nodiscard]] const JsonValue* member(llvm::StringRef key) const;

private:
    Storage storage_;
};

/// @brief One `"key": value` pair of a @ref JsonObject.
struct JsonMember final
{
    std::string key;
    JsonValue   value;
};

/// @brief Parses a JSON document, keeping object member order and number spelling.
/// @param[in] text UTF-8 JSON text.
/// @return Parsed value, or an error naming the byte offset of the first defect.
llvm::Expected<JsonValue> parseOrderedJson(llvm::StringRef text);

}  // namespace llvmbicep

#endif  // LLVMBICEP_SUPPORT_JSON_VALUE_H
