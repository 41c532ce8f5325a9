//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Read-only queries over the project index: hover, go-to-definition and
/// completion.
///
/// An identifier under the cursor is classified by its syntactic context and
/// then looked up in the file's own symbol table first, then in the tables of
/// files that share a config with it, then in every other cached file.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_SYMBOL_RESOLVER_H
#define FABLS_LSP_SYMBOL_RESOLVER_H

#include "fabls/Frontend/SourceLocation.h"
#include "fabls/Frontend/SyntaxTree.h"
#include "fabls/LSP/ProjectIndex.h"
#include "fabls/LSP/Symbol.h"

#include "llvm/ADT/StringRef.h"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fabls::lsp
{

/// @brief Syntactic context of an identifier reference.
enum class ReferenceContext
{
    /// @brief Callee of a call expression; functions only.
    CallSite,

    /// @brief Anywhere in the signature or modifier lines of a function or
    ///        asm function, parameters included; functions only.
    FunctionHeader,

    /// @brief Anywhere else; functions first, then global variables.
    Other,
};

/// @brief Symbol found for a reference together with its defining file.
struct SymbolMatch final
{
    std::string filePath;
    Symbol      symbol;
};

/// @brief Hover payload.
struct HoverResult final
{
    /// @brief Rendered symbol description.
    std::string description;

    /// @brief Defining file, relative to the nearest workspace root when one contains it.
    std::string displayPath;
};

/// @brief Go-to-definition payload.
struct DefinitionResult final
{
    std::string filePath;
    SourceRange range;
};

/// @brief One completion proposal.
struct CompletionCandidate final
{
    std::string name;
    SymbolKind  kind{SymbolKind::Function};
    std::string documentation;
    std::string filePath;
};

/// @brief Classifies the reference made by an identifier node.
[[nodiscard]] ReferenceContext classifyReference(const SyntaxNode& identifier);

/// @brief Looks `name` up in one table according to `context`.
[[nodiscard]] const Symbol* lookupSymbol(const SymbolTable& table, llvm::StringRef name, ReferenceContext context);

/// @brief Query facade over a @ref ProjectIndex.
class SymbolResolver final
{
public:
    /// @brief Creates a resolver reading from `index`.
    /// @param[in] index Index to query; must outlive the resolver.
    explicit SymbolResolver(const ProjectIndex& index);

    /// @brief Returns every file that shares a config with `path`.
    ///
    /// This is the union of all dependency sets that contain `path`, so it
    /// includes `path` itself whenever any config lists it.
    [[nodiscard]] std::set<std::string> getDependencies(llvm::StringRef path) const;

    /// @brief Resolves the identifier at `position` in `path`.
    /// @return Matching symbol, or no result when the file has no tree, the
    ///         cursor is not on an identifier, or nothing matches.
    [[nodiscard]] std::optional<SymbolMatch> findSymbol(llvm::StringRef path, const SourcePoint& position) const;

    [[nodiscard]] std::optional<HoverResult> hover(llvm::StringRef path, const SourcePoint& position) const;

    [[nodiscard]] std::optional<DefinitionResult> gotoDefinition(llvm::StringRef    path,
                                                                 const SourcePoint& position) const;

    /// @brief Returns every function and global variable visible from `path`.
    ///
    /// Candidates come from the file's own table and from every file that
    /// shares a config with it, sorted by name, kind and path.
    [[nodiscard]] std::vector<CompletionCandidate> completion(llvm::StringRef path) const;

    /// @brief Shortens `path` relative to the deepest workspace root containing it.
    [[nodiscard]] std::string displayPath(llvm::StringRef path) const;

private:
    const ProjectIndex& index_;
};

}  // namespace fabls::lsp

#endif  // FABLS_LSP_SYMBOL_RESOLVER_H
