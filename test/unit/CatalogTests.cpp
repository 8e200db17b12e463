//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <iterator>
#include <string>

#include "llvmbicep/Semantics/ResourceTypes.h"

#include "llvm/ADT/StringRef.h"

#include "TestCatalog.h"

namespace
{

bool expectLoadError(const char* json, llvm::StringRef expectedFragment)
{
    auto catalog = llvmbicep::loadResourceTypeCatalog(json, "broken.json");
    if (catalog)
    {
        std::cerr << "catalog unexpectedly loaded: " << json << "\n";
        return false;
    }
    const std::string message = llvm::toString(catalog.takeError());
    if (message.rfind("broken.json: ", 0) != 0)
    {
        std::cerr << "catalog error does not name its source: " << message << "\n";
        return false;
    }
    if (message.find(expectedFragment.str()) == std::string::npos)
    {
        std::cerr << "catalog error '" << message << "' does not mention '" << expectedFragment.str() << "'\n";
        return false;
    }
    return true;
}

bool testCustomCatalogShape()
{
    const auto catalog = llvmbicep_test::loadTestCatalog();
    if (!catalog || catalog->size() != 3)
    {
        std::cerr << "expected three test catalog entries\n";
        return false;
    }

    const auto body = catalog->lookupBodyType({"test.provider/WIDGETS", "2024-01-01"});
    if (!body || body->kind != llvmbicep::TypeKind::Object)
    {
        std::cerr << "catalog lookup must ignore type casing\n";
        return false;
    }
    if (catalog->lookupBodyType({llvmbicep_test::kWidgetsType, "2024-01-01-preview"}))
    {
        std::cerr << "catalog lookup must match API versions exactly\n";
        return false;
    }

    const char* expectedOrder[] = {"id", "name", "type", "apiVersion", "location", "properties", "sku", "tags"};
    if (body->properties.size() != std::size(expectedOrder))
    {
        std::cerr << "unexpected widget property count: " << body->properties.size() << "\n";
        return false;
    }
    for (std::size_t i = 0; i < std::size(expectedOrder); ++i)
    {
        if (body->properties[i].name != expectedOrder[i])
        {
            std::cerr << "property " << i << " is '" << body->properties[i].name << "', expected '" << expectedOrder[i]
                      << "'\n";
            return false;
        }
    }

    const auto* id       = body->findProperty("ID");
    const auto* name     = body->findProperty("name");
    const auto* location = body->findProperty("Location");
    if (!id || !id->isReadOnly() || !name || name->isReadOnly() || !name->isRequired() || !location ||
        !location->isRequired())
    {
        std::cerr << "unexpected envelope or property flags\n";
        return false;
    }

    const auto* tags = body->findProperty("tags");
    if (!tags || !tags->type->additionalProperties ||
        tags->type->additionalProperties->kind != llvmbicep::TypeKind::String)
    {
        std::cerr << "tags must accept additional string properties\n";
        return false;
    }

    const auto* properties = body->findProperty("properties");
    const auto* mode       = properties ? properties->type->findProperty("mode") : nullptr;
    if (!mode || mode->type->kind != llvmbicep::TypeKind::StringEnum ||
        mode->type->displayName() != "'Enabled' | 'Disabled'")
    {
        std::cerr << "mode must be a string enum\n";
        return false;
    }
    const auto* ports = properties->type->findProperty("ports");
    if (!ports || ports->type->displayName() != "int[]")
    {
        std::cerr << "ports must be an int array\n";
        return false;
    }
    if (properties->type->findProperty("id"))
    {
        std::cerr << "nested objects must not receive the resource envelope\n";
        return false;
    }
    return true;
}

bool testMissingBodyAndItems()
{
    auto catalog = llvmbicep::loadResourceTypeCatalog(R"({"resourceTypes": [
        {"type": "A.B/c", "apiVersion": "1"},
        {"type": "A.B/d", "apiVersion": "1", "body": {"type": "object", "properties": {
            "list": {"type": {"type": "array"}}}}}]})",
                                                      "inline.json");
    if (!catalog)
    {
        std::cerr << "catalog failed: " << llvm::toString(catalog.takeError()) << "\n";
        return false;
    }
    const auto empty = catalog->lookupBodyType({"A.B/c", "1"});
    if (!empty || empty->kind != llvmbicep::TypeKind::Object || empty->properties.size() != 4)
    {
        std::cerr << "entry without body must become an enveloped empty object\n";
        return false;
    }
    const auto  withList = catalog->lookupBodyType({"A.B/d", "1"});
    const auto* list     = withList ? withList->findProperty("list") : nullptr;
    if (!list || !list->type->itemType || list->type->itemType->kind != llvmbicep::TypeKind::Any)
    {
        std::cerr << "array items must default to any\n";
        return false;
    }
    return true;
}

bool testMergeReplacesDuplicates()
{
    auto base = llvmbicep_test::loadTestCatalog();
    if (!base)
    {
        return false;
    }
    auto overlay = llvmbicep::loadResourceTypeCatalog(R"({"resourceTypes": [
        {"type": "TEST.PROVIDER/widgets", "apiVersion": "2023-01-01",
         "body": {"type": "object", "properties": {"color": {"type": "string"}}}},
        {"type": "Test.Provider/sprockets", "apiVersion": "2020-01-01"}]})",
                                                      "overlay.json");
    if (!overlay)
    {
        std::cerr << "overlay failed: " << llvm::toString(overlay.takeError()) << "\n";
        return false;
    }

    llvmbicep::ResourceTypeCatalog merged = *base;
    merged.merge(*overlay);
    const auto types = merged.availableTypes();
    if (types.size() != 4 || types[0].fullyQualifiedType != "TEST.PROVIDER/widgets" ||
        types[3].fullyQualifiedType != "Test.Provider/sprockets")
    {
        std::cerr << "merge must replace in place and append new entries\n";
        return false;
    }
    const auto replaced = merged.lookupBodyType({llvmbicep_test::kWidgetsType, "2023-01-01"});
    if (!replaced || !replaced->findProperty("color") || replaced->findProperty("location"))
    {
        std::cerr << "merge must replace the duplicate body\n";
        return false;
    }
    return true;
}

bool testBuiltinCatalog()
{
    auto catalog = llvmbicep::loadBuiltinResourceTypeCatalog();
    if (!catalog)
    {
        std::cerr << "builtin catalog failed: " << llvm::toString(catalog.takeError()) << "\n";
        return false;
    }
    const auto body = catalog->lookupBodyType({"Microsoft.Storage/storageAccounts", "2023-01-01"});
    if (!body || !body->findProperty("sku") || !body->findProperty("id"))
    {
        std::cerr << "builtin catalog must describe storage accounts\n";
        return false;
    }
    return true;
}

}  // namespace

bool runCatalogTests()
{
    bool ok = true;
    ok      = testCustomCatalogShape() && ok;
    ok      = testMissingBodyAndItems() && ok;
    ok      = testMergeReplacesDuplicates() && ok;
    ok      = testBuiltinCatalog() && ok;

    ok = expectLoadError("{", "broken.json") && ok;
    ok = expectLoadError(R"({"types": []})", "\"resourceTypes\" array") && ok;
    ok = expectLoadError(R"({"resourceTypes": [{"type": "A.B/c", "apiVersion": "1",
        "body": {"type": "object", "properties": {"x": {"type": "float"}}}}]})",
                         "$.resourceTypes[0].body.properties.x.type: unknown type name 'float'") &&
         ok;
    ok = expectLoadError(R"({"resourceTypes": [{"type": "A.B/c", "apiVersion": "1"},
        {"type": "A.B/d", "apiVersion": "1", "body": {"type": "object", "properties": {
            "x": {"type": "string", "flags": ["hidden"]}}}}]})",
                         "$.resourceTypes[1].body.properties.x.flags: unknown property flag") &&
         ok;
    ok = expectLoadError(R"({"resourceTypes": [{"type": "A.B/c", "apiVersion": "1",
        "body": {"type": "enum", "values": []}}]})",
                         "non-empty \"values\" array") &&
         ok;
    ok = expectLoadError(R"({"resourceTypes": [{"type": "A.B/c", "apiVersion": "1",
        "body": {"type": "tuple"}}]})",
                         "unknown type kind 'tuple'") &&
         ok;
    return ok;
}
