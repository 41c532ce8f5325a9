//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Opaque concrete-syntax-tree interface consumed by the symbol index.
///
/// Symbol extraction and cursor resolution only see node kinds, named-field
/// children, source ranges, and sibling/parent links. Any parser that can
/// present its tree through @ref SyntaxNode can back the index.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_FRONTEND_SYNTAX_TREE_H
#define FABLS_FRONTEND_SYNTAX_TREE_H

#include "fabls/Frontend/SourceLocation.h"

#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <memory>
#include <string>

namespace fabls
{

/// @brief Node kind spellings produced by the NESFab parser.
namespace node_kind
{
inline constexpr llvm::StringLiteral SourceFile            = "source_file";
inline constexpr llvm::StringLiteral Comment               = "comment";
inline constexpr llvm::StringLiteral FunctionDefinition    = "function_definition";
inline constexpr llvm::StringLiteral AsmFunctionDefinition = "asm_function_definition";
inline constexpr llvm::StringLiteral FunctionSignature     = "function_signature";
inline constexpr llvm::StringLiteral ParameterList         = "parameter_list";
inline constexpr llvm::StringLiteral Parameter             = "parameter";
inline constexpr llvm::StringLiteral Modifiers             = "modifiers";
inline constexpr llvm::StringLiteral VarsBlock             = "vars_block";
inline constexpr llvm::StringLiteral VariableDefinition    = "variable_definition";
inline constexpr llvm::StringLiteral StructDefinition      = "struct_definition";
inline constexpr llvm::StringLiteral DataBlock             = "data_block";
inline constexpr llvm::StringLiteral Block                 = "block";
inline constexpr llvm::StringLiteral Type                  = "type";
inline constexpr llvm::StringLiteral Statement             = "statement";
inline constexpr llvm::StringLiteral ExpressionStatement   = "expression_statement";
inline constexpr llvm::StringLiteral Call                  = "call";
inline constexpr llvm::StringLiteral ArgumentList          = "argument_list";
inline constexpr llvm::StringLiteral MemberExpression      = "member_expression";
inline constexpr llvm::StringLiteral IndexExpression       = "index_expression";
inline constexpr llvm::StringLiteral UnaryExpression       = "unary_expression";
inline constexpr llvm::StringLiteral BinaryExpression      = "binary_expression";
inline constexpr llvm::StringLiteral AssignmentExpression  = "assignment_expression";
inline constexpr llvm::StringLiteral ParenthesizedExpr     = "parenthesized_expression";
inline constexpr llvm::StringLiteral BraceExpression       = "brace_expression";
inline constexpr llvm::StringLiteral ArrayExpression       = "array_expression";
inline constexpr llvm::StringLiteral Identifier            = "identifier";
inline constexpr llvm::StringLiteral Number                = "number";
inline constexpr llvm::StringLiteral String                = "string";
inline constexpr llvm::StringLiteral Error                 = "ERROR";
}  // namespace node_kind

/// @brief Read-only view of one named node in a concrete syntax tree.
class SyntaxNode
{
public:
    virtual ~SyntaxNode() = default;

    /// @brief Returns the grammar kind of this node.
    [[nodiscard]] virtual llvm::StringRef kind() const = 0;

    /// @brief Returns the source span of this node.
    [[nodiscard]] virtual SourceRange range() const = 0;

    /// @brief Returns the parent node, or `nullptr` for the root.
    [[nodiscard]] virtual const SyntaxNode* parent() const = 0;

    /// @brief Returns the immediately preceding sibling, or `nullptr`.
    [[nodiscard]] virtual const SyntaxNode* previousSibling() const = 0;

    /// @brief Returns the number of named children.
    [[nodiscard]] virtual std::size_t childCount() const = 0;

    /// @brief Returns the named child at `index` in source order.
    [[nodiscard]] virtual const SyntaxNode* child(std::size_t index) const = 0;

    /// @brief Returns the child bound to a grammar field, or `nullptr`.
    /// @param[in] field Field name such as `signature` or `name`.
    [[nodiscard]] virtual const SyntaxNode* childByFieldName(llvm::StringRef field) const = 0;

    /// @brief Convenience kind comparison.
    [[nodiscard]] bool is(llvm::StringRef expectedKind) const
    {
        return kind() == expectedKind;
    }
};

/// @brief Immutable parse result owning its nodes and the text they index.
class SyntaxTree
{
public:
    virtual ~SyntaxTree() = default;

    /// @brief Returns the root node.
    [[nodiscard]] virtual const SyntaxNode& root() const = 0;

    /// @brief Returns the exact text the tree was parsed from.
    [[nodiscard]] virtual llvm::StringRef text() const = 0;

    /// @brief Returns the source slice covered by `node`.
    [[nodiscard]] llvm::StringRef textOf(const SyntaxNode& node) const
    {
        const SourceRange span = node.range();
        return text().slice(span.startByte, span.endByte);
    }
};

/// @brief Shared handle to an immutable syntax tree.
using SyntaxTreeRef = std::shared_ptr<const SyntaxTree>;

/// @brief Parser seam used by the index to turn text into a tree.
class SourceParser
{
public:
    virtual ~SourceParser() = default;

    /// @brief Parses one complete source file.
    /// @param[in] filePath File path used in error messages.
    /// @param[in] text Full file text.
    /// @return Parsed tree, or an error when the text cannot be parsed.
    [[nodiscard]] virtual llvm::Expected<SyntaxTreeRef> parse(llvm::StringRef filePath, std::string text) const = 0;
};

/// @brief Visits `root` and all of its descendants depth-first in document order.
///
/// The visitor sees a node before its children. The first error returned by
/// the visitor stops the walk and is propagated.
llvm::Error walkInDocumentOrder(const SyntaxNode& root, llvm::function_ref<llvm::Error(const SyntaxNode&)> visit);

/// @brief Returns the smallest node covering `point`, or `nullptr` outside the root.
[[nodiscard]] const SyntaxNode* descendantForPoint(const SyntaxNode& root, const SourcePoint& point);

}  // namespace fabls

#endif  // FABLS_FRONTEND_SYNTAX_TREE_H
