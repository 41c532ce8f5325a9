//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements symbol table lookups and description rendering.
///
//===----------------------------------------------------------------------===//

#include "fabls/LSP/Symbol.h"

#include <algorithm>
#include <cstdint>

namespace fabls::lsp
{
namespace
{

llvm::json::Value pointToJSON(const SourcePoint& point)
{
    return llvm::json::Object{
        {"row", static_cast<std::int64_t>(point.row)},
        {"column", static_cast<std::int64_t>(point.column)},
    };
}

llvm::json::Array sortedSymbolsToJSON(const std::unordered_map<std::string, Symbol>& symbols)
{
    std::vector<const Symbol*> ordered;
    ordered.reserve(symbols.size());
    for (const auto& [name, symbol] : symbols)
    {
        ordered.push_back(&symbol);
    }
    std::sort(ordered.begin(), ordered.end(), [](const Symbol* lhs, const Symbol* rhs) {
        return lhs->name < rhs->name;
    });

    llvm::json::Array out;
    for (const Symbol* symbol : ordered)
    {
        out.push_back(toJSON(*symbol));
    }
    return out;
}

}  // namespace

const Symbol* SymbolTable::findFunction(llvm::StringRef name) const
{
    const auto it = functions.find(name.str());
    return it == functions.end() ? nullptr : &it->second;
}

const Symbol* SymbolTable::findVariable(llvm::StringRef name) const
{
    const auto it = variables.find(name.str());
    return it == variables.end() ? nullptr : &it->second;
}

std::string renderDescription(const std::vector<std::string>& comments, llvm::StringRef text)
{
    std::string out;
    for (const std::string& comment : comments)
    {
        out.append(comment);
        out.push_back('\n');
    }
    out.append(text.data(), text.size());
    return out;
}

llvm::StringRef symbolKindName(const SymbolKind kind)
{
    switch (kind)
    {
    case SymbolKind::Function:
        return "function";
    case SymbolKind::Variable:
        return "variable";
    }
    return "unknown";
}

llvm::json::Value toJSON(const Symbol& symbol)
{
    llvm::json::Object out{
        {"name", symbol.name},
        {"kind", symbolKindName(symbol.kind())},
        {"description", symbol.description},
        {"range",
         llvm::json::Object{
             {"start", pointToJSON(symbol.range.start)},
             {"end", pointToJSON(symbol.range.end)},
         }},
    };
    if (const auto* function = std::get_if<FunctionSymbol>(&symbol.details))
    {
        out["assembly"] = function->isAssembly;
    }
    return llvm::json::Value(std::move(out));
}

llvm::json::Value toJSON(const SymbolTable& table)
{
    return llvm::json::Object{
        {"functions", sortedSymbolsToJSON(table.functions)},
        {"variables", sortedSymbolsToJSON(table.variables)},
    };
}

}  // namespace fabls::lsp
