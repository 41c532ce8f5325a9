//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Path normalization and file reading helpers shared by the index layers.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_SUPPORT_FILE_SYSTEM_H
#define FABLS_SUPPORT_FILE_SYSTEM_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace fabls
{

/// @brief Makes `path` absolute and weakly canonical.
///
/// Falls back to a lexically normalized absolute path when the filesystem
/// cannot be queried.
/// @param[in] path Input path.
/// @return Normalized path used as a store key.
[[nodiscard]] std::string normalizePath(llvm::StringRef path);

/// @brief Returns whether `path` equals `directory` or lies beneath it.
///
/// Both arguments are expected to be normalized. The check is component-wise,
/// so `/a/bc` is not under `/a/b`.
[[nodiscard]] bool isPathUnder(llvm::StringRef path, llvm::StringRef directory);

/// @brief Reads a whole file into memory.
/// @param[in] path File to read.
/// @return File contents or an error naming the path.
[[nodiscard]] llvm::Expected<std::string> readTextFile(llvm::StringRef path);

}  // namespace fabls

#endif  // FABLS_SUPPORT_FILE_SYSTEM_H
