//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements resource type references and JSON type catalog loading.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Semantics/ResourceTypes.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/JSON.h"

#include <algorithm>
#include <utility>

#include "BuiltinResourceTypes.inc"

namespace llvmbicep
{
namespace
{

llvm::Error catalogError(llvm::StringRef sourceName, const std::string& path, const std::string& message)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "%s: %s: %s",
                                   sourceName.str().c_str(),
                                   path.c_str(),
                                   message.c_str());
}

TypePtr primitiveType(TypeKind kind)
{
    auto type  = std::make_shared<TypeSymbol>();
    type->kind = kind;
    return type;
}

std::optional<TypeKind> primitiveKind(llvm::StringRef name)
{
    return llvm::StringSwitch<std::optional<TypeKind>>(name)
        .Case("string", TypeKind::String)
        .Case("int", TypeKind::Integer)
        .Case("bool", TypeKind::Boolean)
        .Case("any", TypeKind::Any)
        .Default(std::nullopt);
}

std::optional<std::uint32_t> propertyFlag(llvm::StringRef name)
{
    return llvm::StringSwitch<std::optional<std::uint32_t>>(name)
        .Case("required", TypePropertyRequired)
        .Case("readOnly", TypePropertyReadOnly)
        .Case("writeOnly", TypePropertyWriteOnly)
        .Case("deployTimeConstant", TypePropertyDeployTimeConstant)
        .Default(std::nullopt);
}

class CatalogReader final
{
public:
    explicit CatalogReader(llvm::StringRef sourceName)
        : sourceName_(sourceName)
    {
    }

    llvm::Expected<TypePtr> readType(const llvm::json::Value& typeValue, const std::string& path)
    {
        if (const auto name = typeValue.getAsString())
        {
            if (const auto kind = primitiveKind(*name))
            {
                return primitiveType(*kind);
            }
            return catalogError(sourceName_, path, "unknown type name '" + name->str() + "'");
        }

        const auto* object = typeValue.getAsObject();
        if (!object)
        {
            return catalogError(sourceName_, path, "type must be a name or an object");
        }
        const auto kindName = object->getString("type");
        if (!kindName)
        {
            return catalogError(sourceName_, path, "type object is missing \"type\"");
        }
        if (const auto kind = primitiveKind(*kindName))
        {
            return primitiveType(*kind);
        }
        if (*kindName == "object")
        {
            return readObject(*object, path);
        }
        if (*kindName == "array")
        {
            auto type  = std::make_shared<TypeSymbol>();
            type->kind = TypeKind::Array;
            if (const auto* items = object->get("items"))
            {
                auto itemType = readType(*items, path + ".items");
                if (!itemType)
                {
                    return itemType.takeError();
                }
                type->itemType = std::move(*itemType);
            }
            else
            {
                type->itemType = primitiveType(TypeKind::Any);
            }
            return type;
        }
        if (*kindName == "enum")
        {
            return readEnum(*object, path);
        }
        return catalogError(sourceName_, path, "unknown type kind '" + kindName->str() + "'");
    }

private:
    llvm::Expected<TypePtr> readObject(const llvm::json::Object& object, const std::string& path)
    {
        auto type  = std::make_shared<TypeSymbol>();
        type->kind = TypeKind::Object;

        if (const auto* properties = object.getObject("properties"))
        {
            std::vector<std::string> names;
            for (const auto& member : *properties)
            {
                names.push_back(member.first.str());
            }
            std::sort(names.begin(), names.end());

            for (const auto& name : names)
            {
                const std::string propertyPath  = path + ".properties." + name;
                const auto*       propertyValue = properties->getObject(name);
                if (!propertyValue)
                {
                    return catalogError(sourceName_, propertyPath, "property must be an object");
                }
                const auto* propertyTypeValue = propertyValue->get("type");
                if (!propertyTypeValue)
                {
                    return catalogError(sourceName_, propertyPath, "property is missing \"type\"");
                }
                auto propertyType = readType(*propertyTypeValue, propertyPath + ".type");
                if (!propertyType)
                {
                    return propertyType.takeError();
                }

                std::uint32_t flags = TypePropertyNone;
                if (const auto* flagList = propertyValue->getArray("flags"))
                {
                    for (const auto& flagValue : *flagList)
                    {
                        const auto                   flagName = flagValue.getAsString();
                        std::optional<std::uint32_t> flag;
                        if (flagName)
                        {
                            flag = propertyFlag(*flagName);
                        }
                        if (!flag)
                        {
                            return catalogError(sourceName_, propertyPath + ".flags", "unknown property flag");
                        }
                        flags |= *flag;
                    }
                }
                type->properties.push_back(TypeProperty{name, std::move(*propertyType), flags});
            }
        }
        else if (object.get("properties"))
        {
            return catalogError(sourceName_, path + ".properties", "expected an object");
        }

        if (const auto* additional = object.get("additionalProperties"))
        {
            auto additionalType = readType(*additional, path + ".additionalProperties");
            if (!additionalType)
            {
                return additionalType.takeError();
            }
            type->additionalProperties = std::move(*additionalType);
        }
        return type;
    }

    llvm::Expected<TypePtr> readEnum(const llvm::json::Object& object, const std::string& path)
    {
        const auto* values = object.getArray("values");
        if (!values || values->empty())
        {
            return catalogError(sourceName_, path, "enum type needs a non-empty \"values\" array");
        }
        auto type  = std::make_shared<TypeSymbol>();
        type->kind = TypeKind::StringEnum;
        for (const auto& value : *values)
        {
            const auto text = value.getAsString();
            if (!text)
            {
                return catalogError(sourceName_, path + ".values", "enum values must be strings");
            }
            type->allowedValues.push_back(text->str());
        }
        return type;
    }

    llvm::StringRef sourceName_;
};

/// Prepends the standard envelope properties a body does not declare.
TypePtr withResourceEnvelope(const TypePtr& body)
{
    if (!body || body->kind != TypeKind::Object)
    {
        return body;
    }

    const std::pair<const char*, std::uint32_t> envelope[] = {
        {"id", TypePropertyReadOnly | TypePropertyDeployTimeConstant},
        {"name", TypePropertyRequired | TypePropertyDeployTimeConstant},
        {"type", TypePropertyReadOnly | TypePropertyDeployTimeConstant},
        {"apiVersion", TypePropertyReadOnly | TypePropertyDeployTimeConstant},
    };

    std::vector<TypeProperty> properties;
    for (const auto& [name, flags] : envelope)
    {
        if (!body->findProperty(name))
        {
            properties.push_back(TypeProperty{name, primitiveType(TypeKind::String), flags});
        }
    }
    if (properties.empty())
    {
        return body;
    }

    auto extended = std::make_shared<TypeSymbol>(*body);
    properties.insert(properties.end(), body->properties.begin(), body->properties.end());
    extended->properties = std::move(properties);
    return extended;
}

}  // namespace

std::string ResourceTypeReference::formatName() const
{
    return fullyQualifiedType + "@" + apiVersion;
}

std::optional<ResourceTypeReference> ResourceTypeReference::parse(llvm::StringRef text)
{
    const auto [type, version] = text.split('@');
    if (type.empty() || version.empty() || type.size() == text.size() || version.contains('@'))
    {
        return std::nullopt;
    }
    return ResourceTypeReference{type.str(), version.str()};
}

const TypeProperty* TypeSymbol::findProperty(llvm::StringRef name) const
{
    for (const auto& property : properties)
    {
        if (llvm::StringRef(property.name).equals_insensitive(name))
        {
            return &property;
        }
    }
    return nullptr;
}

const std::string* TypeSymbol::findAllowedValue(llvm::StringRef value) const
{
    for (const auto& allowed : allowedValues)
    {
        if (llvm::StringRef(allowed).equals_insensitive(value))
        {
            return &allowed;
        }
    }
    return nullptr;
}

std::string TypeSymbol::displayName() const
{
    switch (kind)
    {
    case TypeKind::Any:
        return "any";
    case TypeKind::String:
        return "string";
    case TypeKind::Integer:
        return "int";
    case TypeKind::Boolean:
        return "bool";
    case TypeKind::Object:
        return "object";
    case TypeKind::Array:
        return itemType ? itemType->displayName() + "[]" : "array";
    case TypeKind::StringEnum:
        break;
    }
    std::string out;
    for (const auto& value : allowedValues)
    {
        if (!out.empty())
        {
            out += " | ";
        }
        out += "'" + value + "'";
    }
    return out;
}

void ResourceTypeCatalog::add(ResourceTypeReference reference, TypePtr bodyType)
{
    for (auto& entry : entries_)
    {
        if (llvm::StringRef(entry.reference.fullyQualifiedType).equals_insensitive(reference.fullyQualifiedType) &&
            entry.reference.apiVersion == reference.apiVersion)
        {
            entry.reference = std::move(reference);
            entry.bodyType  = std::move(bodyType);
            return;
        }
    }
    entries_.push_back(Entry{std::move(reference), std::move(bodyType)});
}

void ResourceTypeCatalog::merge(const ResourceTypeCatalog& other)
{
    for (const auto& entry : other.entries_)
    {
        add(entry.reference, entry.bodyType);
    }
}

std::vector<ResourceTypeReference> ResourceTypeCatalog::availableTypes() const
{
    std::vector<ResourceTypeReference> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_)
    {
        out.push_back(entry.reference);
    }
    return out;
}

TypePtr ResourceTypeCatalog::lookupBodyType(const ResourceTypeReference& reference) const
{
    for (const auto& entry : entries_)
    {
        if (llvm::StringRef(entry.reference.fullyQualifiedType).equals_insensitive(reference.fullyQualifiedType) &&
            entry.reference.apiVersion == reference.apiVersion)
        {
            return entry.bodyType;
        }
    }
    return nullptr;
}

llvm::Expected<ResourceTypeCatalog> loadResourceTypeCatalog(llvm::StringRef jsonText, llvm::StringRef sourceName)
{
    auto document = llvm::json::parse(jsonText);
    if (!document)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: %s",
                                       sourceName.str().c_str(),
                                       llvm::toString(document.takeError()).c_str());
    }

    const auto* root    = document->getAsObject();
    const auto* entries = root ? root->getArray("resourceTypes") : nullptr;
    if (!entries)
    {
        return catalogError(sourceName, "$", "expected an object with a \"resourceTypes\" array");
    }

    CatalogReader       reader(sourceName);
    ResourceTypeCatalog catalog;
    for (std::size_t i = 0; i < entries->size(); ++i)
    {
        const std::string path  = "$.resourceTypes[" + std::to_string(i) + "]";
        const auto*       entry = (*entries)[i].getAsObject();
        if (!entry)
        {
            return catalogError(sourceName, path, "entry must be an object");
        }
        const auto type    = entry->getString("type");
        const auto version = entry->getString("apiVersion");
        if (!type || !version || type->empty() || version->empty())
        {
            return catalogError(sourceName, path, "entry needs non-empty \"type\" and \"apiVersion\" strings");
        }

        TypePtr body;
        if (const auto* bodySpec = entry->get("body"))
        {
            auto bodyType = reader.readType(*bodySpec, path + ".body");
            if (!bodyType)
            {
                return bodyType.takeError();
            }
            body = std::move(*bodyType);
        }
        else
        {
            auto empty  = std::make_shared<TypeSymbol>();
            empty->kind = TypeKind::Object;
            body        = std::move(empty);
        }
        catalog.add(ResourceTypeReference{type->str(), version->str()}, withResourceEnvelope(body));
    }
    return catalog;
}

llvm::Expected<ResourceTypeCatalog> loadBuiltinResourceTypeCatalog()
{
    return loadResourceTypeCatalog(builtin_resource_types::kBuiltinResourceTypesJson, "<builtin-resource-types>");
}

}  // namespace llvmbicep
