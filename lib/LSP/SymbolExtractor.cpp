//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements symbol extraction over the opaque syntax tree interface.
///
//===----------------------------------------------------------------------===//

#include "fabls/LSP/SymbolExtractor.h"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace fabls::lsp
{
namespace
{

llvm::Error makeExtractionError(llvm::StringRef filePath, const SyntaxNode& node, llvm::StringRef message)
{
    const SourcePoint    start = node.range().start;
    const SourceLocation location{filePath.empty() ? "<input>" : filePath.str(), start.row + 1U, start.column + 1U};
    return llvm::createStringError(llvm::inconvertibleErrorCode(), location.str() + ": " + message.str());
}

bool isGlobalScope(const SyntaxNode& node)
{
    const SyntaxNode* parent = node.parent();
    return parent && (parent->is(node_kind::SourceFile) || parent->is(node_kind::VarsBlock));
}

llvm::Error addFunction(const SyntaxTree& tree, const SyntaxNode& node, llvm::StringRef filePath, SymbolTable& table)
{
    const SyntaxNode* signature = node.childByFieldName("signature");
    if (!signature)
    {
        return makeExtractionError(filePath, node, "function definition has no signature");
    }
    const SyntaxNode* name = signature->childByFieldName("name");
    if (!name)
    {
        return makeExtractionError(filePath, *signature, "function signature has no name");
    }

    FunctionSymbol details;
    details.signature  = tree.textOf(*signature).str();
    details.comments   = collectLeadingComments(tree, node);
    details.isAssembly = node.is(node_kind::AsmFunctionDefinition);

    Symbol symbol;
    symbol.name        = tree.textOf(*name).str();
    symbol.range       = node.range();
    symbol.description = renderDescription(details.comments, details.signature);
    symbol.details     = std::move(details);
    table.functions.insert_or_assign(symbol.name, std::move(symbol));
    return llvm::Error::success();
}

void addVariable(const SyntaxTree& tree, const SyntaxNode& node, SymbolTable& table)
{
    const SyntaxNode* name = node.childByFieldName("name");
    if (!name)
    {
        return;
    }

    VariableSymbol details;
    details.declaration = tree.textOf(node).str();
    details.comments    = collectLeadingComments(tree, node);

    Symbol symbol;
    symbol.name        = tree.textOf(*name).str();
    symbol.range       = node.range();
    symbol.description = renderDescription(details.comments, details.declaration);
    symbol.details     = std::move(details);
    table.variables.insert_or_assign(symbol.name, std::move(symbol));
}

}  // namespace

std::vector<std::string> collectLeadingComments(const SyntaxTree& tree, const SyntaxNode& definition)
{
    std::vector<std::string> comments;
    const SyntaxNode*        nearest = definition.previousSibling();
    if (!nearest)
    {
        return comments;
    }
    // The nearest comment attaches across blank lines; only gaps between
    // comments end the block.
    std::int64_t pivotRow = nearest->range().start.row;
    for (const SyntaxNode* sibling = nearest; sibling; sibling = sibling->previousSibling())
    {
        const SourceRange span = sibling->range();
        if (!sibling->is(node_kind::Comment) || pivotRow - static_cast<std::int64_t>(span.end.row) > 1)
        {
            break;
        }
        comments.push_back(tree.textOf(*sibling).str());
        pivotRow = span.start.row;
    }
    std::reverse(comments.begin(), comments.end());
    return comments;
}

llvm::Expected<SymbolTable> extractSymbols(const SyntaxTree& tree, llvm::StringRef filePath)
{
    SymbolTable table;
    llvm::Error error = walkInDocumentOrder(tree.root(), [&](const SyntaxNode& node) -> llvm::Error {
        if (node.is(node_kind::FunctionDefinition) || node.is(node_kind::AsmFunctionDefinition))
        {
            return addFunction(tree, node, filePath, table);
        }
        if (node.is(node_kind::VariableDefinition) && isGlobalScope(node))
        {
            addVariable(tree, node, table);
        }
        return llvm::Error::success();
    });
    if (error)
    {
        return std::move(error);
    }
    return table;
}

}  // namespace fabls::lsp
