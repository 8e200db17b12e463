//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Resource type references, body type schemas, and the resource type catalog.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SEMANTICS_RESOURCE_TYPES_H
#define LLVMBICEP_SEMANTICS_RESOURCE_TYPES_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llvmbicep
{

/// @brief `<fullyQualifiedType>@<apiVersion>` pair identifying one catalog entry.
struct ResourceTypeReference final
{
    /// @brief Provider namespace plus type segments, e.g. `Microsoft.Network/virtualNetworks/subnets`.
    std::string fullyQualifiedType;

    std::string apiVersion;

    /// @brief Formats the reference as written in a declaration's type string.
    [[nodiscard]] std::string formatName() const;

    /// @brief Parses `<type>@<version>`; both halves must be non-empty.
    [[nodiscard]] static std::optional<ResourceTypeReference> parse(llvm::StringRef text);
};

/// @brief Schema type categories.
enum class TypeKind
{
    Any,
    String,
    Integer,
    Boolean,
    Object,
    Array,

    /// @brief String restricted to a set of literal values.
    StringEnum,
};

/// @brief Bit flags attached to object properties.
enum TypePropertyFlags : std::uint32_t
{
    TypePropertyNone               = 0,
    TypePropertyRequired           = 1U << 0U,
    TypePropertyReadOnly           = 1U << 1U,
    TypePropertyWriteOnly          = 1U << 2U,
    TypePropertyDeployTimeConstant = 1U << 3U,
};

struct TypeSymbol;

/// @brief Shared handle to an immutable schema type.
using TypePtr = std::shared_ptr<const TypeSymbol>;

/// @brief Named, flagged member of an object type.
struct TypeProperty final
{
    /// @brief Canonical property name casing.
    std::string   name;
    TypePtr       type;
    std::uint32_t flags{TypePropertyNone};

    [[nodiscard]] bool isReadOnly() const
    {
        return (flags & TypePropertyReadOnly) != 0U;
    }

    [[nodiscard]] bool isRequired() const
    {
        return (flags & TypePropertyRequired) != 0U;
    }
};

/// @brief One node of a resource body schema.
struct TypeSymbol final
{
    TypeKind kind{TypeKind::Any};

    /// @brief Object members in catalog order.
    std::vector<TypeProperty> properties;

    /// @brief Type of undeclared object members; null when they are not allowed.
    TypePtr additionalProperties;

    /// @brief Element type of an array.
    TypePtr itemType;

    /// @brief Allowed values of a string enum, in canonical casing.
    std::vector<std::string> allowedValues;

    /// @brief Finds a property by case-insensitive name.
    [[nodiscard]] const TypeProperty* findProperty(llvm::StringRef name) const;

    /// @brief Finds an allowed enum value by case-insensitive comparison.
    [[nodiscard]] const std::string* findAllowedValue(llvm::StringRef value) const;

    /// @brief Short display name (`string`, `object`, `'a' | 'b'`, ...).
    [[nodiscard]] std::string displayName() const;
};

/// @brief Set of known resource types and their body schemas.
///
/// Entries keep insertion order. Types compare case-insensitively; API
/// versions compare exactly.
class ResourceTypeCatalog final
{
public:
    /// @brief Adds an entry, replacing any entry with the same type and version.
    void add(ResourceTypeReference reference, TypePtr bodyType);

    /// @brief Adds every entry of `other`, replacing duplicates.
    void merge(const ResourceTypeCatalog& other);

    /// @brief Returns every known reference in insertion order.
    [[nodiscard]] std::vector<ResourceTypeReference> availableTypes() const;

    /// @brief Returns the body schema of `reference`, or null when unknown.
    [[nodiscard]] TypePtr lookupBodyType(const ResourceTypeReference& reference) const;

    [[nodiscard]] std::size_t size() const
    {
        return entries_.size();
    }

private:
    struct Entry
    {
        ResourceTypeReference reference;
        TypePtr               bodyType;
    };

    std::vector<Entry> entries_;
};

/// @brief Parses a JSON type catalog.
///
/// The document is `{"resourceTypes": [{"type", "apiVersion", "body"}]}`. Object
/// bodies receive the standard resource envelope (`id`, `name`, `type`,
/// `apiVersion`) when they do not declare those properties.
///
/// @param[in] jsonText Catalog document text.
/// @param[in] sourceName Name used in error messages.
/// @return Parsed catalog or a descriptive error.
llvm::Expected<ResourceTypeCatalog> loadResourceTypeCatalog(llvm::StringRef jsonText, llvm::StringRef sourceName);

/// @brief Returns the catalog compiled into the binary.
llvm::Expected<ResourceTypeCatalog> loadBuiltinResourceTypeCatalog();

}  // namespace llvmbicep

#endif  // LLVMBICEP_SEMANTICS_RESOURCE_TYPES_H
