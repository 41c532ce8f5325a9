//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements document URI and path conversions.
///
//===----------------------------------------------------------------------===//

#include "fabls/LSP/Uri.h"

#include "fabls/Support/FileSystem.h"

#include <cctype>

namespace fabls::lsp
{
namespace
{

int hexDigitValue(const char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F')
    {
        return 10 + (c - 'A');
    }
    return -1;
}

bool isUnreservedPathByte(const unsigned char c)
{
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/' || c == ':';
}

}  // namespace

std::string percentDecode(llvm::StringRef encoded)
{
    std::string out;
    out.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i)
    {
        if (encoded[i] == '%' && i + 2 < encoded.size())
        {
            const int hi = hexDigitValue(encoded[i + 1]);
            const int lo = hexDigitValue(encoded[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(encoded[i]);
    }
    return out;
}

std::string uriToNormalizedPath(llvm::StringRef uri)
{
    if (!uri.take_front(7).equals_insensitive("file://"))
    {
        return normalizePath(uri);
    }

    llvm::StringRef path = uri.drop_front(7);
    if (!path.empty() && path.front() != '/')
    {
        const std::size_t slash = path.find('/');
        if (slash == llvm::StringRef::npos || !path.take_front(slash).equals_insensitive("localhost"))
        {
            return {};
        }
        path = path.drop_front(slash);
    }
    return normalizePath(percentDecode(path));
}

std::string pathToFileUri(llvm::StringRef path)
{
    static constexpr char Hex[] = "0123456789ABCDEF";

    std::string uri = "file://";
    if (path.empty() || path.front() != '/')
    {
        uri.push_back('/');
    }
    for (const char raw : path)
    {
        const auto c = static_cast<unsigned char>(raw);
        if (isUnreservedPathByte(c))
        {
            uri.push_back(raw);
            continue;
        }
        uri.push_back('%');
        uri.push_back(Hex[c >> 4]);
        uri.push_back(Hex[c & 0x0F]);
    }
    return uri;
}

}  // namespace fabls::lsp
