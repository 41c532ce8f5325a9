//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Symbol extraction from parsed NESFab syntax trees.
///
/// Extraction walks the tree in document order and records every function
/// definition and every global variable definition together with the comment
/// block that documents it.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_SYMBOL_EXTRACTOR_H
#define FABLS_LSP_SYMBOL_EXTRACTOR_H

#include "fabls/Frontend/SyntaxTree.h"
#include "fabls/LSP/Symbol.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace fabls::lsp
{

/// @brief Collects the documentation comments attached to a definition.
///
/// The immediately preceding sibling attaches whenever it is a comment, even
/// across blank lines. Walking further back, each earlier comment must end at
/// most one row above the comment after it.
/// @param[in] tree Tree owning `definition`.
/// @param[in] definition Definition node.
/// @return Comment texts in top-to-bottom order.
[[nodiscard]] std::vector<std::string> collectLeadingComments(const SyntaxTree& tree, const SyntaxNode& definition);

/// @brief Extracts the symbol table of one parsed file.
///
/// Function definitions must carry a `signature` child with a `name` field;
/// a missing one aborts the whole extraction. Variable definitions are only
/// recorded directly under the root or a `vars` block; one without a name is
/// skipped.
/// @param[in] tree Parsed file.
/// @param[in] filePath File path used in error messages.
/// @return Symbol table or the first extraction error.
[[nodiscard]] llvm::Expected<SymbolTable> extractSymbols(const SyntaxTree& tree, llvm::StringRef filePath = {});

}  // namespace fabls::lsp

#endif  // FABLS_LSP_SYMBOL_EXTRACTOR_H
