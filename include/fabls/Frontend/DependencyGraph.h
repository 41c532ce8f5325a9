//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Build-configuration discovery for NESFab projects.
///
/// A NESFab project is described by `.cfg` files whose `input = <path>` lines
/// list the source files compiled together. The dependency graph maps each
/// directory that holds a config file to the canonical source files it names.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_FRONTEND_DEPENDENCY_GRAPH_H
#define FABLS_FRONTEND_DEPENDENCY_GRAPH_H

#include "llvm/ADT/StringRef.h"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace fabls
{

/// @file
/// @brief Dependency graph construction from `.cfg` files.

/// @brief Extension of NESFab source files.
inline constexpr llvm::StringLiteral SourceFileExtension = ".fab";

/// @brief Extension of NESFab build-configuration files.
inline constexpr llvm::StringLiteral ConfigFileExtension = ".cfg";

/// @brief Config directory to the set of source files it declares.
using DependencyGraph = std::map<std::string, std::set<std::string>>;

/// @brief Extracts raw `input` references from config file text.
///
/// A line contributes when it splits on `=` into exactly two parts and the
/// trimmed key is `input`. Values are returned trimmed and unresolved.
/// @param[in] text Config file contents.
/// @return References in file order.
[[nodiscard]] std::vector<std::string> parseConfigInputs(llvm::StringRef text);

/// @brief Recursively collects config files below the given roots.
/// @param[in] roots Root directories; missing or unreadable ones are skipped.
/// @return Sorted, de-duplicated canonical config file paths.
[[nodiscard]] std::vector<std::string> findConfigFiles(const std::vector<std::string>& roots);

/// @brief Resolves one `input` reference.
///
/// Candidates are tried relative to `configDirectory` and then relative to
/// `fallbackDirectory`. The first candidate that exists wins; the reference
/// is dropped when it names no existing file or the file is not a `.fab`
/// source.
/// @return Canonical source path, or an empty string when dropped.
[[nodiscard]] std::string resolveConfigInput(llvm::StringRef reference,
                                             llvm::StringRef configDirectory,
                                             llvm::StringRef fallbackDirectory);

/// @brief Builds the dependency graph for all config files under `roots`.
///
/// Config files are read and resolved in parallel. Several config files in one
/// directory contribute the union of their inputs.
/// @param[in] roots Root directories to scan.
/// @param[in] fallbackDirectory NESFab installation directory used as the
///            second resolution base; may be empty.
/// @return Graph keyed by canonical config directory.
[[nodiscard]] DependencyGraph buildDependencyGraph(const std::vector<std::string>& roots,
                                                   llvm::StringRef                 fallbackDirectory);

}  // namespace fabls

#endif  // FABLS_FRONTEND_DEPENDENCY_GRAPH_H
