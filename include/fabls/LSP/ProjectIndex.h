//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shared, thread-safe index of NESFab source files.
///
/// The index keeps four keyed stores (source text, syntax tree, symbol table
/// and config dependency sets) plus the set of workspace roots. Open files are
/// updated one at a time through @ref ProjectIndex::updateFile; workspace root
/// changes rebuild the dependency graph and bulk-index newly referenced files
/// in parallel through @ref ProjectIndex::refreshWorkspace.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_PROJECT_INDEX_H
#define FABLS_LSP_PROJECT_INDEX_H

#include "fabls/Frontend/DependencyGraph.h"
#include "fabls/Frontend/SyntaxTree.h"
#include "fabls/LSP/ConcurrentStore.h"
#include "fabls/LSP/Symbol.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace fabls::lsp
{

/// @brief A file that could not be bulk-indexed.
struct IndexFailure final
{
    std::string filePath;
    std::string message;
};

/// @brief Summary of one workspace refresh.
struct RefreshReport final
{
    /// @brief Normalized roots that were scanned for config files.
    std::vector<std::string> scannedRoots;

    /// @brief Normalized roots that were unregistered.
    std::vector<std::string> removedRoots;

    /// @brief Config directories found by the scan, sorted.
    std::vector<std::string> configDirectories;

    /// @brief Number of dependency entries dropped with their root.
    std::size_t evictedConfigDirectories{0};

    /// @brief Files whose symbol table was published by this refresh, sorted.
    std::vector<std::string> indexedFiles;

    /// @brief Files that failed to read, parse, or extract, sorted by path.
    std::vector<IndexFailure> failures;
};

/// @brief Concurrent multi-file symbol index.
class ProjectIndex final
{
public:
    /// @brief Creates an empty index.
    /// @param[in] parser Parser used for every file; must outlive the index.
    /// @param[in] fallbackDirectory NESFab directory for config resolution.
    explicit ProjectIndex(const SourceParser& parser, std::string fallbackDirectory = {});

    ProjectIndex(const ProjectIndex&)            = delete;
    ProjectIndex& operator=(const ProjectIndex&) = delete;

    /// @brief Replaces the text of `path` and reindexes it.
    ///
    /// The text is always stored. The tree and symbol table are replaced only
    /// when both parsing and extraction succeed; otherwise the previous ones
    /// are kept and the failure is returned.
    /// @param[in] path File path; normalized before use.
    /// @param[in] text Full file text.
    /// @return Success, or the parse/extraction failure.
    [[nodiscard]] llvm::Error updateFile(llvm::StringRef path, std::string text);

    /// @brief Applies a workspace root change and bulk-indexes new dependencies.
    /// @param[in] added Roots to register and scan.
    /// @param[in] removed Roots to unregister; their config entries are dropped
    ///            unless another registered root still contains them.
    /// @return Summary of what was scanned and indexed.
    RefreshReport refreshWorkspace(const std::vector<std::string>& added, const std::vector<std::string>& removed);

    /// @brief Registers roots without scanning them.
    void addWorkspaceRoots(const std::vector<std::string>& roots);

    /// @brief Returns the registered roots, sorted.
    [[nodiscard]] std::vector<std::string> workspaceRoots() const;

    [[nodiscard]] std::shared_ptr<const std::string> lookupText(llvm::StringRef path) const;

    [[nodiscard]] SyntaxTreeRef lookupTree(llvm::StringRef path) const;

    [[nodiscard]] std::shared_ptr<const SymbolTable> lookupSymbols(llvm::StringRef path) const;

    /// @brief Returns a copy of the dependency graph.
    [[nodiscard]] DependencyGraph dependencyGraph() const;

    /// @brief Returns every cached symbol table, sorted by path.
    [[nodiscard]] std::vector<std::pair<std::string, std::shared_ptr<const SymbolTable>>> symbolTables() const;

    /// @brief Returns the number of files with a symbol table.
    [[nodiscard]] std::size_t cachedFileCount() const
    {
        return symbols_.size();
    }

    void setFallbackDirectory(std::string directory);

    [[nodiscard]] std::string fallbackDirectory() const;

private:
    [[nodiscard]] std::mutex& updateLockFor(const std::string& key);

    const SourceParser&                    parser_;
    ConcurrentStore<std::string>           texts_;
    ConcurrentStore<SyntaxTree>            trees_;
    ConcurrentStore<SymbolTable>           symbols_;
    ConcurrentStore<std::set<std::string>> dependencies_;
    mutable std::shared_mutex              rootsMutex_;
    std::set<std::string>                  roots_;
    mutable std::mutex                     fallbackMutex_;
    std::string                            fallbackDirectory_;
    std::mutex                             refreshMutex_;
    std::array<std::mutex, 16>             updateLocks_;
};

}  // namespace fabls::lsp

#endif  // FABLS_LSP_PROJECT_INDEX_H
