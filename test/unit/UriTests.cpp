//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "fabls/LSP/Uri.h"

#include "fabls/Support/FileSystem.h"

#include <iostream>
#include <string>

bool runUriTests()
{
    if (fabls::lsp::percentDecode("a%20b%2Fc") != "a b/c" || fabls::lsp::percentDecode("100%") != "100%" ||
        fabls::lsp::percentDecode("%zz%4") != "%zz%4" || fabls::lsp::percentDecode("%e2%9c%93") != "\xE2\x9C\x93")
    {
        std::cerr << "percent decoding mismatch\n";
        return false;
    }

    if (fabls::lsp::uriToNormalizedPath("file:///tmp/fabls%20uri/./main.fab") != fabls::normalizePath("/tmp/fabls uri/main.fab"))
    {
        std::cerr << "file URI should decode and normalize\n";
        return false;
    }
    if (fabls::lsp::uriToNormalizedPath("FILE://localhost/tmp/a.fab") != fabls::normalizePath("/tmp/a.fab"))
    {
        std::cerr << "localhost authority and scheme case should be accepted\n";
        return false;
    }
    if (!fabls::lsp::uriToNormalizedPath("file://build-server/share/a.fab").empty())
    {
        std::cerr << "remote authorities should not map to local paths\n";
        return false;
    }
    if (fabls::lsp::uriToNormalizedPath("/tmp/../tmp/b.fab") != fabls::normalizePath("/tmp/b.fab"))
    {
        std::cerr << "plain paths should be normalized as-is\n";
        return false;
    }

    const std::string uri = fabls::lsp::pathToFileUri("/tmp/my game/#1.fab");
    if (uri != "file:///tmp/my%20game/%231.fab")
    {
        std::cerr << "unexpected file URI: " << uri << "\n";
        return false;
    }
    if (fabls::lsp::uriToNormalizedPath(uri) != fabls::normalizePath("/tmp/my game/#1.fab"))
    {
        std::cerr << "encoded URI should map back to its path\n";
        return false;
    }
    return true;
}
