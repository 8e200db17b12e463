//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmbicep/LSP/DocumentStore.h"

bool runLspDocumentStoreTests()
{
    llvmbicep::lsp::DocumentStore store;
    store.open("file:///tmp/main.bicep", "resource a 'A.B/c@1' = {}\n", 1);

    if (store.size() != 1)
    {
        std::cerr << "expected one open document after didOpen\n";
        return false;
    }

    const auto firstSnapshot = store.lookup("file:///tmp/main.bicep");
    if (!firstSnapshot || firstSnapshot->text != "resource a 'A.B/c@1' = {}\n" || firstSnapshot->version != 1)
    {
        std::cerr << "unexpected snapshot after didOpen\n";
        return false;
    }

    if (!store.applyFullTextChange("file:///tmp/main.bicep", "resource b 'A.B/c@1' = {}\n", 2))
    {
        std::cerr << "expected didChange to update existing document\n";
        return false;
    }

    const auto updatedSnapshot = store.lookup("file:///tmp/main.bicep");
    if (!updatedSnapshot || updatedSnapshot->text != "resource b 'A.B/c@1' = {}\n" || updatedSnapshot->version != 2)
    {
        std::cerr << "unexpected snapshot after didChange\n";
        return false;
    }
    if (firstSnapshot->version != 1)
    {
        std::cerr << "earlier snapshots must not observe later changes\n";
        return false;
    }

    if (store.applyFullTextChange("file:///tmp/missing.bicep", "bad\n", 1))
    {
        std::cerr << "didChange on missing document should fail\n";
        return false;
    }

    store.open("file:///tmp/a.bicep", "", 7);
    const auto all = store.snapshots();
    if (all.size() != 2 || all[0].uri != "file:///tmp/a.bicep" || all[1].uri != "file:///tmp/main.bicep")
    {
        std::cerr << "snapshots must be ordered by URI\n";
        return false;
    }

    if (!store.close("file:///tmp/main.bicep") || store.close("file:///tmp/main.bicep"))
    {
        std::cerr << "didClose must remove the document exactly once\n";
        return false;
    }

    if (store.lookup("file:///tmp/main.bicep") || store.size() != 1)
    {
        std::cerr << "document should be removed after didClose\n";
        return false;
    }

    return true;
}
