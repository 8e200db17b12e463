//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "llvmbicep/Semantics/ApiVersion.h"

namespace
{

bool expectOrdered(const char* lower, const char* higher)
{
    if (llvmbicep::compareApiVersions(lower, higher) >= 0 || llvmbicep::compareApiVersions(higher, lower) <= 0)
    {
        std::cerr << "expected '" << lower << "' < '" << higher << "'\n";
        return false;
    }
    return true;
}

}  // namespace

bool runApiVersionTests()
{
    bool ok = true;
    ok      = expectOrdered("2021-09-01", "2023-01-01") && ok;
    ok      = expectOrdered("2023-01-01-preview", "2023-01-01") && ok;
    ok      = expectOrdered("2023-01-01-alpha", "2023-01-01-Beta") && ok;
    ok      = expectOrdered("2022-12-31", "2023-01-01-preview") && ok;
    ok      = expectOrdered("latest", "2015-01-01") && ok;
    ok      = expectOrdered("alpha", "Beta") && ok;
    ok      = expectOrdered("2023-01-01-PREVIEW", "2023-01-01-preview") && ok;

    if (llvmbicep::compareApiVersions("2023-01-01", "2023-01-01") != 0)
    {
        std::cerr << "identical versions must compare equal\n";
        ok = false;
    }

    std::vector<std::string> versions{"2023-01-01", "v2", "2021-09-01-preview", "2021-09-01", "2023-01-01-preview"};
    std::sort(versions.begin(), versions.end(), llvmbicep::ApiVersionLess{});
    const std::vector<std::string> expected{"v2", "2021-09-01-preview", "2021-09-01", "2023-01-01-preview", "2023-01-01"};
    if (versions != expected)
    {
        std::cerr << "unexpected API version sort order\n";
        ok = false;
    }
    return ok;
}
