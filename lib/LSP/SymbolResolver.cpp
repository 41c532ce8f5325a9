//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements cursor resolution, hover, go-to-definition and completion.
///
//===----------------------------------------------------------------------===//

#include "fabls/LSP/SymbolResolver.h"

#include "fabls/Support/FileSystem.h"

#include "llvm/Support/Path.h"

#include <algorithm>
#include <tuple>

namespace fabls::lsp
{
namespace
{

void appendCandidates(const std::string&                             filePath,
                      const std::unordered_map<std::string, Symbol>& symbols,
                      std::vector<CompletionCandidate>&              out)
{
    for (const auto& [name, symbol] : symbols)
    {
        out.push_back(CompletionCandidate{name, symbol.kind(), symbol.description, filePath});
    }
}

bool isFunctionDefinition(const SyntaxNode& node)
{
    return node.is(node_kind::FunctionDefinition) || node.is(node_kind::AsmFunctionDefinition);
}

}  // namespace

ReferenceContext classifyReference(const SyntaxNode& identifier)
{
    const SyntaxNode* parent = identifier.parent();
    if (!parent)
    {
        return ReferenceContext::Other;
    }
    if (parent->is(node_kind::Call))
    {
        return ReferenceContext::CallSite;
    }
    for (const SyntaxNode* node = parent; node; node = node->parent())
    {
        if (node->is(node_kind::Block) || isFunctionDefinition(*node))
        {
            break;
        }
        if ((node->is(node_kind::FunctionSignature) || node->is(node_kind::Modifiers)) && node->parent() &&
            isFunctionDefinition(*node->parent()))
        {
            return ReferenceContext::FunctionHeader;
        }
    }
    return ReferenceContext::Other;
}

const Symbol* lookupSymbol(const SymbolTable& table, llvm::StringRef name, const ReferenceContext context)
{
    if (const Symbol* function = table.findFunction(name))
    {
        return function;
    }
    if (context != ReferenceContext::Other)
    {
        return nullptr;
    }
    return table.findVariable(name);
}

SymbolResolver::SymbolResolver(const ProjectIndex& index)
    : index_(index)
{
}

std::set<std::string> SymbolResolver::getDependencies(llvm::StringRef path) const
{
    const std::string     key = normalizePath(path);
    std::set<std::string> out;
    for (const auto& [directory, files] : index_.dependencyGraph())
    {
        if (files.contains(key))
        {
            out.insert(files.begin(), files.end());
        }
    }
    return out;
}

std::optional<SymbolMatch> SymbolResolver::findSymbol(llvm::StringRef path, const SourcePoint& position) const
{
    const std::string   key  = normalizePath(path);
    const SyntaxTreeRef tree = index_.lookupTree(key);
    if (!tree)
    {
        return std::nullopt;
    }
    const SyntaxNode* node = descendantForPoint(tree->root(), position);
    if (!node || !node->is(node_kind::Identifier))
    {
        return std::nullopt;
    }

    const llvm::StringRef  name    = tree->textOf(*node);
    const ReferenceContext context = classifyReference(*node);

    if (const auto own = index_.lookupSymbols(key))
    {
        if (const Symbol* symbol = lookupSymbol(*own, name, context))
        {
            return SymbolMatch{key, *symbol};
        }
    }

    std::set<std::string> related = getDependencies(key);
    related.erase(key);
    for (const std::string& file : related)
    {
        if (const auto table = index_.lookupSymbols(file))
        {
            if (const Symbol* symbol = lookupSymbol(*table, name, context))
            {
                return SymbolMatch{file, *symbol};
            }
        }
    }

    for (const auto& [file, table] : index_.symbolTables())
    {
        if (file == key || related.contains(file))
        {
            continue;
        }
        if (const Symbol* symbol = lookupSymbol(*table, name, context))
        {
            return SymbolMatch{file, *symbol};
        }
    }
    return std::nullopt;
}

std::optional<HoverResult> SymbolResolver::hover(llvm::StringRef path, const SourcePoint& position) const
{
    std::optional<SymbolMatch> match = findSymbol(path, position);
    if (!match)
    {
        return std::nullopt;
    }
    return HoverResult{std::move(match->symbol.description), displayPath(match->filePath)};
}

std::optional<DefinitionResult> SymbolResolver::gotoDefinition(llvm::StringRef path, const SourcePoint& position) const
{
    std::optional<SymbolMatch> match = findSymbol(path, position);
    if (!match)
    {
        return std::nullopt;
    }
    return DefinitionResult{std::move(match->filePath), match->symbol.range};
}

std::vector<CompletionCandidate> SymbolResolver::completion(llvm::StringRef path) const
{
    const std::string     key   = normalizePath(path);
    std::set<std::string> files = getDependencies(key);
    files.insert(key);

    std::vector<CompletionCandidate> candidates;
    for (const std::string& file : files)
    {
        const auto table = index_.lookupSymbols(file);
        if (!table)
        {
            continue;
        }
        appendCandidates(file, table->functions, candidates);
        appendCandidates(file, table->variables, candidates);
    }

    std::sort(candidates.begin(), candidates.end(), [](const CompletionCandidate& lhs, const CompletionCandidate& rhs) {
        return std::tie(lhs.name, lhs.kind, lhs.filePath) < std::tie(rhs.name, rhs.kind, rhs.filePath);
    });
    return candidates;
}

std::string SymbolResolver::displayPath(llvm::StringRef path) const
{
    std::string bestRoot;
    for (const std::string& root : index_.workspaceRoots())
    {
        if (root.size() > bestRoot.size() && isPathUnder(path, root))
        {
            bestRoot = root;
        }
    }
    if (bestRoot.empty() || path.size() == bestRoot.size())
    {
        return path.str();
    }

    llvm::StringRef relative = path.drop_front(bestRoot.size());
    while (!relative.empty() && llvm::sys::path::is_separator(relative.front()))
    {
        relative = relative.drop_front();
    }
    return relative.str();
}

}  // namespace fabls::lsp
