//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Small resource type catalog shared by the unit tests.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_TEST_UNIT_TEST_CATALOG_H
#define LLVMBICEP_TEST_UNIT_TEST_CATALOG_H

#include "llvmbicep/Semantics/Compilation.h"
#include "llvmbicep/Semantics/ResourceTypes.h"

#include "llvm/Support/Error.h"

#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace llvmbicep_test
{

inline constexpr const char* kWidgetsType = "Test.Provider/widgets";

inline constexpr const char* kTestCatalogJson = R"json({
  "resourceTypes": [
    {
      "type": "Test.Provider/widgets",
      "apiVersion": "2023-01-01",
      "body": { "type": "object", "properties": { "location": { "type": "string" } } }
    },
    {
      "type": "Test.Provider/widgets",
      "apiVersion": "2024-01-01",
      "body": {
        "type": "object",
        "properties": {
          "location": { "type": "string", "flags": ["required"] },
          "tags": { "type": { "type": "object", "additionalProperties": "string" } },
          "sku": {
            "type": {
              "type": "object",
              "properties": {
                "tier": { "type": { "type": "enum", "values": ["Basic", "Standard"] } }
              }
            }
          },
          "properties": {
            "type": {
              "type": "object",
              "properties": {
                "mode": { "type": { "type": "enum", "values": ["Enabled", "Disabled"] } },
                "displayName": { "type": "string" },
                "provisioningState": { "type": "string", "flags": ["readOnly"] },
                "ports": { "type": { "type": "array", "items": "int" } },
                "nested": {
                  "type": {
                    "type": "object",
                    "properties": {
                      "etag": { "type": "string", "flags": ["readOnly"] },
                      "sizeGB": { "type": "int" }
                    }
                  }
                }
              }
            }
          }
        }
      }
    },
    {
      "type": "Test.Provider/widgets/gadgets",
      "apiVersion": "2024-01-01",
      "body": { "type": "object", "properties": { "properties": { "type": "any" } } }
    }
  ]
})json";

/// Loads the shared catalog; reports and returns null on failure.
inline std::shared_ptr<const llvmbicep::ResourceTypeCatalog> loadTestCatalog()
{
    auto catalog = llvmbicep::loadResourceTypeCatalog(kTestCatalogJson, "test-catalog.json");
    if (!catalog)
    {
        std::cerr << "test catalog failed to load: " << llvm::toString(catalog.takeError()) << "\n";
        return nullptr;
    }
    return std::make_shared<const llvmbicep::ResourceTypeCatalog>(std::move(*catalog));
}

/// Compiles `text` against the shared catalog with default settings.
inline std::shared_ptr<const llvmbicep::Compilation> compileTestDocument(const std::string&              text,
                                                                       llvmbicep::Configuration configuration = {})
{
    return llvmbicep::compileDocument("file:///test/main.bicep",
                                      text,
                                      loadTestCatalog(),
                                      nullptr,
                                      std::move(configuration));
}

}  // namespace llvmbicep_test

#endif  // LLVMBICEP_TEST_UNIT_TEST_CATALOG_H
