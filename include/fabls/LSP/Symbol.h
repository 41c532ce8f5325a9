//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Symbol model for NESFab functions and global variables.
///
/// Symbols are a closed tagged union: shared fields live on @ref Symbol and
/// the kind-specific payload is a `std::variant`.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_SYMBOL_H
#define FABLS_LSP_SYMBOL_H

#include "fabls/Frontend/SourceLocation.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace fabls::lsp
{

/// @brief Function-specific symbol payload.
struct FunctionSymbol final
{
    /// @brief Source text of the signature, such as `fn add(U a, U b) U`.
    std::string signature;

    /// @brief Documentation comments in top-to-bottom order.
    std::vector<std::string> comments;

    /// @brief Whether this is an `asm fn`.
    bool isAssembly{false};

    bool operator==(const FunctionSymbol&) const = default;
};

/// @brief Global-variable symbol payload.
struct VariableSymbol final
{
    /// @brief Source text of the whole definition, such as `SS px = 128`.
    std::string declaration;

    /// @brief Documentation comments in top-to-bottom order.
    std::vector<std::string> comments;

    bool operator==(const VariableSymbol&) const = default;
};

/// @brief Symbol category used by completion and lookup.
enum class SymbolKind
{
    /// @brief Function, mode, interrupt handler, or assembly function.
    Function,

    /// @brief Global variable.
    Variable,
};

/// @brief A named definition with rendered documentation.
struct Symbol final
{
    /// @brief Declared name.
    std::string name;

    /// @brief Span of the whole definition node.
    SourceRange range;

    /// @brief Comments followed by the signature or declaration text.
    std::string description;

    /// @brief Kind-specific payload.
    std::variant<FunctionSymbol, VariableSymbol> details;

    [[nodiscard]] SymbolKind kind() const
    {
        return std::holds_alternative<FunctionSymbol>(details) ? SymbolKind::Function : SymbolKind::Variable;
    }

    bool operator==(const Symbol&) const = default;
};

/// @brief Per-file symbol index.
///
/// Names are unique per map; a later definition with the same name replaces
/// the earlier one.
struct SymbolTable final
{
    std::unordered_map<std::string, Symbol> functions;
    std::unordered_map<std::string, Symbol> variables;

    [[nodiscard]] const Symbol* findFunction(llvm::StringRef name) const;

    [[nodiscard]] const Symbol* findVariable(llvm::StringRef name) const;

    [[nodiscard]] std::size_t size() const
    {
        return functions.size() + variables.size();
    }

    bool operator==(const SymbolTable&) const = default;
};

/// @brief Renders hover text: each comment followed by a newline, then `text`.
[[nodiscard]] std::string renderDescription(const std::vector<std::string>& comments, llvm::StringRef text);

/// @brief Returns the lowercase kind name used in logs and tests.
[[nodiscard]] llvm::StringRef symbolKindName(SymbolKind kind);

/// @brief Serializes a symbol as `{name, kind, description, range}`.
llvm::json::Value toJSON(const Symbol& symbol);

/// @brief Serializes a table as `{functions: [...], variables: [...]}`, each sorted by name.
llvm::json::Value toJSON(const SymbolTable& table);

}  // namespace fabls::lsp

#endif  // FABLS_LSP_SYMBOL_H
