//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Conversions between LSP document URIs and normalized file paths.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_URI_H
#define FABLS_LSP_URI_H

#include "llvm/ADT/StringRef.h"

#include <string>

namespace fabls::lsp
{

/// @brief Decodes `%XX` escapes; malformed escapes are kept verbatim.
[[nodiscard]] std::string percentDecode(llvm::StringRef encoded);

/// @brief Converts a `file://` URI to a normalized path.
///
/// Anything that is not a `file://` URI is treated as a plain path. URIs with
/// a non-local authority are rejected.
/// @return Normalized path, or an empty string when the URI names no local file.
[[nodiscard]] std::string uriToNormalizedPath(llvm::StringRef uri);

/// @brief Converts a path to a `file://` URI, percent-encoding reserved bytes.
[[nodiscard]] std::string pathToFileUri(llvm::StringRef path);

}  // namespace fabls::lsp

#endif  // FABLS_LSP_URI_H
