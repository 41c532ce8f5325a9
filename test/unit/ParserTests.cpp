//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "TestFixtures.h"

#include "fabls/Frontend/Parser.h"
#include "fabls/Frontend/SyntaxTree.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <iostream>
#include <string>

namespace
{

using fabls::test::parseOrReport;
namespace node_kind = fabls::node_kind;

bool expectParseError(const std::string& text, llvm::StringRef expectedFragment)
{
    auto tree = fabls::parseFabSource("bad.fab", text);
    if (tree)
    {
        std::cerr << "expected parse failure for: " << text << "\n";
        return false;
    }
    const std::string message = llvm::toString(tree.takeError());
    if (!llvm::StringRef(message).contains(expectedFragment))
    {
        std::cerr << "unexpected parse error text: " << message << "\n";
        return false;
    }
    return true;
}

const fabls::SyntaxNode* childOfKind(const fabls::SyntaxNode& parent, llvm::StringRef kind, std::size_t skip = 0)
{
    for (std::size_t i = 0; i < parent.childCount(); ++i)
    {
        const fabls::SyntaxNode* child = parent.child(i);
        if (child && child->is(kind) && skip-- == 0)
        {
            return child;
        }
    }
    return nullptr;
}

bool testFunctionDefinitionShape()
{
    const auto tree = parseOrReport("fn add(U a, U b) U\n    return a + b\n");
    if (!tree)
    {
        return false;
    }
    const fabls::SyntaxNode& root = tree->root();
    if (!root.is(node_kind::SourceFile) || root.childCount() != 1)
    {
        std::cerr << "expected a single top-level definition\n";
        return false;
    }
    const fabls::SyntaxNode* definition = root.child(0);
    if (!definition->is(node_kind::FunctionDefinition) || definition->parent() != &root)
    {
        std::cerr << "expected function_definition, got " << definition->kind().str() << "\n";
        return false;
    }
    const fabls::SyntaxNode* signature = definition->childByFieldName("signature");
    if (!signature || tree->textOf(*signature) != "fn add(U a, U b) U")
    {
        std::cerr << "unexpected signature text\n";
        return false;
    }
    const fabls::SyntaxNode* name       = signature->childByFieldName("name");
    const fabls::SyntaxNode* parameters = signature->childByFieldName("parameters");
    const fabls::SyntaxNode* returnType = signature->childByFieldName("return_type");
    if (!name || tree->textOf(*name) != "add" || !parameters || parameters->childCount() != 2 || !returnType ||
        tree->textOf(*returnType) != "U")
    {
        std::cerr << "unexpected signature fields\n";
        return false;
    }
    const fabls::SyntaxNode* second = parameters->child(1);
    if (!second->is(node_kind::Parameter) || !second->childByFieldName("type") ||
        tree->textOf(*second->childByFieldName("name")) != "b")
    {
        std::cerr << "unexpected parameter shape\n";
        return false;
    }

    const fabls::SyntaxNode* body = definition->childByFieldName("body");
    if (!body || !body->is(node_kind::Block) || body->childCount() != 1 || !body->child(0)->is(node_kind::Statement))
    {
        std::cerr << "expected a block body with one statement\n";
        return false;
    }
    const fabls::SourceRange range = definition->range();
    if (range.start.row != 0 || range.start.column != 0 || range.end.row != 1 || range.end.column != 16)
    {
        std::cerr << "definition range should span the body\n";
        return false;
    }
    return true;
}

bool testVarsAndModifiers()
{
    const std::string text = "vars\n"
                             "    // Player position:\n"
                             "    SS px = 128\n"
                             "    SS py\n"
                             "\n"
                             "mode main()\n"
                             ": nmi game_nmi\n"
                             "    nmi\n"
                             "\n"
                             "asm fn reset()\n"
                             "    default\n";
    const auto tree = parseOrReport(text);
    if (!tree)
    {
        return false;
    }
    const fabls::SyntaxNode& root = tree->root();
    const fabls::SyntaxNode* vars = childOfKind(root, node_kind::VarsBlock);
    if (!vars || vars->childCount() != 3 || !vars->child(0)->is(node_kind::Comment) ||
        !vars->child(1)->is(node_kind::VariableDefinition) || !vars->child(2)->is(node_kind::VariableDefinition))
    {
        std::cerr << "vars block should hold comment + two variable definitions\n";
        return false;
    }
    const fabls::SyntaxNode* px = vars->child(1);
    if (tree->textOf(*px->childByFieldName("name")) != "px" || tree->textOf(*px->childByFieldName("type")) != "SS" ||
        !px->childByFieldName("value") || tree->textOf(*px) != "SS px = 128")
    {
        std::cerr << "unexpected variable definition shape\n";
        return false;
    }
    if (px->previousSibling() != vars->child(0))
    {
        std::cerr << "previous sibling link is wrong\n";
        return false;
    }

    const fabls::SyntaxNode* mode = childOfKind(root, node_kind::FunctionDefinition);
    if (!mode)
    {
        std::cerr << "mode should parse as a function definition\n";
        return false;
    }
    const fabls::SyntaxNode* modifiers = mode->childByFieldName("modifiers");
    if (!modifiers || modifiers->childCount() != 2 || tree->textOf(*modifiers->child(1)) != "game_nmi")
    {
        std::cerr << "modifier line should attach to the mode definition\n";
        return false;
    }
    if (!mode->childByFieldName("body"))
    {
        std::cerr << "mode body missing\n";
        return false;
    }

    const fabls::SyntaxNode* reset = childOfKind(root, node_kind::AsmFunctionDefinition);
    if (!reset || tree->textOf(*reset->childByFieldName("signature")) != "asm fn reset()")
    {
        std::cerr << "expected an asm function definition\n";
        return false;
    }
    return true;
}

bool testExpressions()
{
    const std::string text = "fn f()\n"
                           "    add(1, 2)\n"
                           "    pads[0].held & BUTTON_LEFT\n"
                           "    x = 1 ; 2\n"
                           "U total = sum(1,\n"
                           "              2)\n"
                           "U after = 3\n";
    const auto tree = parseOrReport(text);
    if (!tree)
    {
        return false;
    }
    const fabls::SyntaxNode& root = tree->root();
    if (root.childCount() != 3)
    {
        std::cerr << "bracketed continuation lines should join: " << root.childCount() << " top-level nodes\n";
        return false;
    }

    const fabls::SyntaxNode* body = root.child(0)->childByFieldName("body");
    if (!body || body->childCount() != 3)
    {
        std::cerr << "expected three body statements\n";
        return false;
    }
    const fabls::SyntaxNode* call = body->child(0)->child(0);
    if (!call || !call->is(node_kind::Call) || tree->textOf(*call->childByFieldName("function")) != "add" ||
        call->childByFieldName("arguments")->childCount() != 2)
    {
        std::cerr << "unexpected call expression shape\n";
        return false;
    }

    const fabls::SyntaxNode* binary = body->child(1)->child(0);
    if (!binary || !binary->is(node_kind::BinaryExpression) ||
        !binary->childByFieldName("left")->is(node_kind::MemberExpression))
    {
        std::cerr << "member access should bind tighter than '&'\n";
        return false;
    }

    const fabls::SyntaxNode* tolerant = body->child(2);
    if (!childOfKind(*tolerant, node_kind::AssignmentExpression) || !childOfKind(*tolerant, node_kind::Error))
    {
        std::cerr << "unparseable token should degrade to an ERROR node\n";
        return false;
    }

    const fabls::SyntaxNode* hit = fabls::descendantForPoint(root, fabls::SourcePoint{1, 5});
    if (!hit || !hit->is(node_kind::Identifier) || tree->textOf(*hit) != "add" || hit->parent() != call)
    {
        std::cerr << "descendantForPoint should find the callee identifier\n";
        return false;
    }
    const fabls::SyntaxNode* atEnd = fabls::descendantForPoint(root, fabls::SourcePoint{1, 7});
    if (!atEnd || tree->textOf(*atEnd) != "add")
    {
        std::cerr << "identifier end column should be inclusive\n";
        return false;
    }
    return true;
}

}  // namespace

bool runParserTests()
{
    if (!testFunctionDefinitionShape() || !testVarsAndModifiers() || !testExpressions())
    {
        return false;
    }

    {
        const auto tree = parseOrReport("");
        if (!tree || tree->root().childCount() != 0)
        {
            std::cerr << "empty input should parse to an empty source_file\n";
            return false;
        }
    }

    if (!expectParseError("fn f(\n", "bad.fab:1:5: unclosed '('"))
    {
        return false;
    }
    if (!expectParseError("U a = 1)\n", "unmatched ')'"))
    {
        return false;
    }
    if (!expectParseError("fn f()\n        a\n    b\n", "bad.fab:3:5: inconsistent dedent"))
    {
        return false;
    }
    if (!expectParseError("    a\nb\n", "inconsistent dedent"))
    {
        return false;
    }
    return true;
}
