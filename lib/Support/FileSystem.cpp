//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements path normalization and file reading helpers.
///
//===----------------------------------------------------------------------===//

#include "fabls/Support/FileSystem.h"

#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <filesystem>
#include <system_error>

namespace fabls
{

std::string normalizePath(llvm::StringRef path)
{
    std::filesystem::path p(path.str());
    std::error_code       ec;
    if (p.is_relative())
    {
        auto absolute = std::filesystem::absolute(p, ec);
        if (!ec)
        {
            p = std::move(absolute);
        }
    }
    auto canonical = std::filesystem::weakly_canonical(p, ec);
    if (ec)
    {
        return p.lexically_normal().string();
    }
    return canonical.string();
}

bool isPathUnder(llvm::StringRef path, llvm::StringRef directory)
{
    while (directory.size() > 1 && llvm::sys::path::is_separator(directory.back()))
    {
        directory = directory.drop_back();
    }
    if (directory.empty() || path.take_front(directory.size()) != directory)
    {
        return false;
    }
    if (path.size() == directory.size())
    {
        return true;
    }
    return llvm::sys::path::is_separator(directory.back()) ||
           llvm::sys::path::is_separator(path[directory.size()]);
}

llvm::Expected<std::string> readTextFile(llvm::StringRef path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/false, /*RequiresNullTerminator=*/false);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(),
                                       "failed to read '" + path.str() + "': " + buffer.getError().message());
    }
    return (*buffer)->getBuffer().str();
}

}  // namespace fabls
