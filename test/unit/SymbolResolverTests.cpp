//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "TestFixtures.h"

#include "fabls/Frontend/Parser.h"
#include "fabls/LSP/ProjectIndex.h"
#include "fabls/LSP/SymbolResolver.h"
#include "fabls/Support/FileSystem.h"

#include "llvm/Support/Error.h"

#include <algorithm>
#include <iostream>
#include <string>

namespace
{

using fabls::SourcePoint;
using fabls::test::ScopedTempDir;
using fabls::test::writeTextFile;
using fabls::lsp::ReferenceContext;

constexpr const char* MathText = "// Adds two numbers.\n"
                                 "fn add(U a, U b) U\n"
                                 "    return a + b\n"
                                 "\n"
                                 "U total = 0\n";

constexpr const char* MainText = "fn main()\n"
                                 "    U x = add(1, 2)\n"
                                 "    x = total\n"
                                 "    helper()\n";

constexpr const char* OtherText = "fn add(U a)\n"
                                  "    return\n"
                                  "fn helper()\n"
                                  "    return\n";

bool testClassification()
{
    const auto tree = fabls::test::parseOrReport(MainText);
    if (!tree)
    {
        return false;
    }
    const fabls::SyntaxNode& root = tree->root();

    const fabls::SyntaxNode* name = fabls::descendantForPoint(root, SourcePoint{0, 3});
    const fabls::SyntaxNode* call = fabls::descendantForPoint(root, SourcePoint{1, 11});
    const fabls::SyntaxNode* read = fabls::descendantForPoint(root, SourcePoint{2, 9});
    if (!name || !call || !read)
    {
        std::cerr << "expected identifiers under every query point\n";
        return false;
    }
    if (fabls::lsp::classifyReference(*name) != ReferenceContext::FunctionHeader ||
        fabls::lsp::classifyReference(*call) != ReferenceContext::CallSite ||
        fabls::lsp::classifyReference(*read) != ReferenceContext::Other)
    {
        std::cerr << "unexpected reference classification\n";
        return false;
    }

    fabls::lsp::SymbolTable table;
    fabls::lsp::Symbol      function;
    function.name    = "add";
    function.details = fabls::lsp::FunctionSymbol{};
    fabls::lsp::Symbol variable;
    variable.name    = "total";
    variable.details = fabls::lsp::VariableSymbol{};
    table.functions.emplace("add", function);
    table.variables.emplace("total", variable);

    if (!fabls::lsp::lookupSymbol(table, "add", ReferenceContext::CallSite) ||
        fabls::lsp::lookupSymbol(table, "total", ReferenceContext::CallSite) ||
        fabls::lsp::lookupSymbol(table, "total", ReferenceContext::FunctionHeader) ||
        !fabls::lsp::lookupSymbol(table, "total", ReferenceContext::Other))
    {
        std::cerr << "variables should resolve only outside call sites and headers\n";
        return false;
    }
    return true;
}

bool testQueries()
{
    ScopedTempDir workspace("resolver");
    if (!writeTextFile(workspace.path() / "game/math.fab", MathText) ||
        !writeTextFile(workspace.path() / "game/main.fab", MainText) ||
        !writeTextFile(workspace.path() / "game/game.cfg", "input = math.fab\ninput = main.fab\n"))
    {
        std::cerr << "failed to create resolver fixtures\n";
        return false;
    }

    fabls::FabParser           parser;
    fabls::lsp::ProjectIndex   index(parser);
    fabls::lsp::SymbolResolver resolver(index);
    const std::string          mainPath  = fabls::normalizePath(workspace.file("game/main.fab"));
    const std::string          mathPath  = fabls::normalizePath(workspace.file("game/math.fab"));
    const std::string          otherPath = fabls::normalizePath(workspace.file("lib/other.fab"));

    const fabls::lsp::RefreshReport report = index.refreshWorkspace({workspace.path().string()}, {});
    if (!report.failures.empty())
    {
        std::cerr << "refresh failed: " << report.failures.front().message << "\n";
        return false;
    }
    if (llvm::Error error = index.updateFile(mainPath, MainText))
    {
        std::cerr << "main update failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    if (llvm::Error error = index.updateFile(otherPath, OtherText))
    {
        std::cerr << "other update failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }

    const auto dependencies = resolver.getDependencies(mainPath);
    if (dependencies.size() != 2 || !dependencies.contains(mathPath) || resolver.getDependencies(otherPath).size() != 0)
    {
        std::cerr << "dependency sets should follow the config\n";
        return false;
    }

    const auto hover = resolver.hover(mainPath, SourcePoint{1, 11});
    if (!hover || hover->description != "// Adds two numbers.\nfn add(U a, U b) U" ||
        hover->displayPath != "game/math.fab")
    {
        std::cerr << "hover should prefer the config-sharing definition of add\n";
        return false;
    }

    const auto definition = resolver.gotoDefinition(mainPath, SourcePoint{1, 10});
    if (!definition || definition->filePath != mathPath || definition->range.start.row != 1 ||
        definition->range.start.column != 0 || definition->range.end.row != 2 || definition->range.end.column != 16)
    {
        std::cerr << "definition should point at the whole add definition\n";
        return false;
    }

    const auto variable = resolver.findSymbol(mainPath, SourcePoint{2, 8});
    if (!variable || variable->symbol.name != "total" || variable->symbol.kind() != fabls::lsp::SymbolKind::Variable)
    {
        std::cerr << "plain reads should resolve global variables\n";
        return false;
    }

    const auto helper = resolver.findSymbol(mainPath, SourcePoint{3, 6});
    if (!helper || helper->filePath != otherPath)
    {
        std::cerr << "unrelated files should be searched last\n";
        return false;
    }

    const auto header = resolver.findSymbol(mainPath, SourcePoint{0, 4});
    if (!header || header->filePath != mainPath || header->symbol.name != "main")
    {
        std::cerr << "function names should resolve to their own definition\n";
        return false;
    }

    if (resolver.hover(mainPath, SourcePoint{1, 15}) || resolver.hover(mainPath, SourcePoint{40, 0}))
    {
        std::cerr << "numbers and out-of-range points should not resolve\n";
        return false;
    }
    if (resolver.gotoDefinition(mathPath, SourcePoint{1, 4}))
    {
        std::cerr << "bulk-indexed files have no tree and should not resolve\n";
        return false;
    }
    if (resolver.gotoDefinition(workspace.file("missing.fab"), SourcePoint{0, 0}))
    {
        std::cerr << "unknown files should not resolve\n";
        return false;
    }

    const auto candidates = resolver.completion(mainPath);
    const auto hasCandidate = [&candidates](const std::string& name, const std::string& file) {
        return std::any_of(candidates.begin(), candidates.end(), [&](const fabls::lsp::CompletionCandidate& c) {
            return c.name == name && c.filePath == file;
        });
    };
    if (candidates.size() != 3 || !hasCandidate("add", mathPath) || !hasCandidate("total", mathPath) ||
        !hasCandidate("main", mainPath) || hasCandidate("helper", otherPath))
    {
        std::cerr << "completion should cover the file and its config peers only\n";
        return false;
    }
    if (!std::is_sorted(candidates.begin(), candidates.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.name < rhs.name;
        }))
    {
        std::cerr << "completion candidates should be sorted by name\n";
        return false;
    }

    const auto isolated = resolver.completion(otherPath);
    if (isolated.size() != 2)
    {
        std::cerr << "a file outside every config should only see itself\n";
        return false;
    }

    if (resolver.displayPath("/elsewhere/file.fab") != "/elsewhere/file.fab")
    {
        std::cerr << "paths outside every root should be shown in full\n";
        return false;
    }
    return true;
}

bool testHeaderParameterShadowsGlobal()
{
    const std::string text = "U px = 1\n"
                             "fn move(U px) U\n"
                             "    return px\n"
                             "mode main()\n"
                             ": nmi px\n"
                             "    move(2)\n";

    const auto tree = fabls::test::parseOrReport(text);
    if (!tree)
    {
        return false;
    }
    const fabls::SyntaxNode* parameter = fabls::descendantForPoint(tree->root(), SourcePoint{1, 10});
    const fabls::SyntaxNode* modifier  = fabls::descendantForPoint(tree->root(), SourcePoint{4, 7});
    const fabls::SyntaxNode* bodyRead  = fabls::descendantForPoint(tree->root(), SourcePoint{2, 11});
    if (!parameter || !modifier || !bodyRead ||
        fabls::lsp::classifyReference(*parameter) != ReferenceContext::FunctionHeader ||
        fabls::lsp::classifyReference(*modifier) != ReferenceContext::FunctionHeader ||
        fabls::lsp::classifyReference(*bodyRead) != ReferenceContext::Other)
    {
        std::cerr << "parameters and modifiers should classify as function header references\n";
        return false;
    }

    ScopedTempDir              workspace("resolver-header");
    fabls::FabParser           parser;
    fabls::lsp::ProjectIndex   index(parser);
    fabls::lsp::SymbolResolver resolver(index);
    const std::string          path = workspace.file("move.fab");
    if (llvm::Error error = index.updateFile(path, text))
    {
        std::cerr << "header fixture update failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }

    if (resolver.hover(path, SourcePoint{1, 10}) || resolver.gotoDefinition(path, SourcePoint{1, 11}) ||
        resolver.hover(path, SourcePoint{4, 6}))
    {
        std::cerr << "a header parameter must not resolve to a global variable\n";
        return false;
    }
    const auto body = resolver.hover(path, SourcePoint{2, 11});
    if (!body || body->description != "U px = 1")
    {
        std::cerr << "body reads should still resolve global variables\n";
        return false;
    }
    return true;
}

bool testUntypedCallScenario()
{
    ScopedTempDir              workspace("resolver-scenario");
    fabls::FabParser           parser;
    fabls::lsp::ProjectIndex   index(parser);
    fabls::lsp::SymbolResolver resolver(index);
    const std::string          definitionPath = workspace.file("add.fab");
    const std::string          callerPath     = workspace.file("caller.fab");

    if (llvm::Error error = index.updateFile(definitionPath, "fn add(a, b)\n    return a + b\n"))
    {
        std::cerr << "definition update failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    if (llvm::Error error = index.updateFile(callerPath, "fn run()\n    add(1, 2)\n"))
    {
        std::cerr << "caller update failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }

    const auto match = resolver.findSymbol(callerPath, SourcePoint{1, 5});
    if (!match || match->symbol.description != "fn add(a, b)")
    {
        std::cerr << "uncommented function should describe itself by its bare signature\n";
        return false;
    }
    const auto definition = resolver.gotoDefinition(callerPath, SourcePoint{1, 4});
    if (!definition || definition->filePath != fabls::normalizePath(definitionPath) ||
        !(definition->range.start == SourcePoint{0, 0}) || !(definition->range.end == SourcePoint{1, 16}))
    {
        std::cerr << "definition should span the whole add definition\n";
        return false;
    }
    return true;
}

}  // namespace

bool runSymbolResolverTests()
{
    return testClassification() && testQueries() && testHeaderParameterShadowsGlobal() && testUntypedCallScenario();
}
