//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Parser declarations for building NESFab concrete syntax trees.
///
/// NESFab is indentation structured: a line opens a block when the following
/// lines are indented deeper. The parser groups tokens into logical lines
/// (newlines inside brackets are joined), nests them by indentation, and
/// parses each line into a statement, definition, or expression node. Comments
/// are kept as sibling nodes so documentation can be associated with the
/// definitions that follow them.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_FRONTEND_PARSER_H
#define FABLS_FRONTEND_PARSER_H

#include "fabls/Frontend/SyntaxTree.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace fabls
{

/// @file
/// @brief NESFab parser entry points.

/// @brief Parses NESFab source text into an immutable concrete syntax tree.
///
/// Unknown constructs inside a line degrade to `ERROR` nodes. The parse fails
/// only on lexical errors, unbalanced brackets, and inconsistent dedents.
class FabParser final : public SourceParser
{
public:
    /// @brief Parses one complete NESFab source file.
    /// @param[in] filePath File path used in error messages.
    /// @param[in] text Full file text.
    /// @return Parsed tree or an error describing the first fatal problem.
    [[nodiscard]] llvm::Expected<SyntaxTreeRef> parse(llvm::StringRef filePath, std::string text) const override;
};

/// @brief Convenience wrapper around @ref FabParser::parse.
[[nodiscard]] llvm::Expected<SyntaxTreeRef> parseFabSource(llvm::StringRef filePath, std::string text);

}  // namespace fabls

#endif  // FABLS_FRONTEND_PARSER_H
