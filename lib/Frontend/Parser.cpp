//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the indentation-aware NESFab parser.
///
/// Parsing happens in three passes: the lexer produces tokens, tokens are
/// grouped into logical lines, and the lines are nested into blocks by
/// indentation while each line is parsed by a small precedence-climbing
/// expression parser.
///
//===----------------------------------------------------------------------===//

#include "fabls/Frontend/Parser.h"

#include "fabls/Frontend/Lexer.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringSwitch.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace fabls
{
namespace
{

/// Words that never start a variable definition.
constexpr std::array<llvm::StringLiteral, 30> ReservedWords = {
    "if",   "else",   "for",   "while",   "do",      "break",   "continue", "return", "fn",    "ct",
    "mode", "nmi",    "irq",   "goto",    "label",   "file",    "struct",   "vars",   "data",  "omni",
    "asm",  "fence",  "default", "switch", "case",   "charmap", "chrrom",   "audio",  "ready", "swap",
};

constexpr std::array<llvm::StringLiteral, 14> StatementKeywords = {
    "if",    "else",  "for",   "while",  "do",     "break", "continue",
    "return", "goto", "label", "switch", "case",   "default", "fence",
};

constexpr std::array<llvm::StringLiteral, 5> DataKeywords = {"data", "omni", "chrrom", "charmap", "audio"};

constexpr std::array<llvm::StringLiteral, 9> PrefixOperators = {"-", "+", "!", "~", "&", "#", "@", "++", "--"};

constexpr int AssignmentPrecedence = 1;

int binaryPrecedence(const Token& token)
{
    if (token.kind == TokenKind::Equal)
    {
        return AssignmentPrecedence;
    }
    if (token.kind != TokenKind::Operator)
    {
        return -1;
    }
    return llvm::StringSwitch<int>(token.text)
        .Case("+=", AssignmentPrecedence)
        .Case("-=", AssignmentPrecedence)
        .Case("*=", AssignmentPrecedence)
        .Case("/=", AssignmentPrecedence)
        .Case("%=", AssignmentPrecedence)
        .Case("&=", AssignmentPrecedence)
        .Case("|=", AssignmentPrecedence)
        .Case("^=", AssignmentPrecedence)
        .Case("<<=", AssignmentPrecedence)
        .Case(">>=", AssignmentPrecedence)
        .Case("||", 2)
        .Case("&&", 3)
        .Case("|", 4)
        .Case("^", 5)
        .Case("&", 6)
        .Case("==", 7)
        .Case("!=", 7)
        .Case("<", 8)
        .Case(">", 8)
        .Case("<=", 8)
        .Case(">=", 8)
        .Case("<<", 9)
        .Case(">>", 9)
        .Case("+", 10)
        .Case("-", 10)
        .Case("*", 11)
        .Case("/", 11)
        .Case("%", 11)
        .Default(-1);
}

bool isOpening(const TokenKind kind)
{
    return kind == TokenKind::LParen || kind == TokenKind::LBracket || kind == TokenKind::LBrace;
}

bool isClosing(const TokenKind kind)
{
    return kind == TokenKind::RParen || kind == TokenKind::RBracket || kind == TokenKind::RBrace;
}

TokenKind closerFor(const TokenKind opener)
{
    switch (opener)
    {
    case TokenKind::LParen:
        return TokenKind::RParen;
    case TokenKind::LBracket:
        return TokenKind::RBracket;
    default:
        return TokenKind::RBrace;
    }
}

llvm::Error makeError(llvm::StringRef file, const SourcePoint& at, const std::string& message)
{
    const SourceLocation location{file.str(), at.row + 1U, at.column + 1U};
    return llvm::createStringError(llvm::inconvertibleErrorCode(), location.str() + ": " + message);
}

/// Concrete node of the NESFab syntax tree.
class CstNode final : public SyntaxNode
{
public:
    CstNode(llvm::StringRef kind, const SourceRange& range)
        : kind_(kind)
        , range_(range)
        , empty_(false)
    {
    }

    /// Creates a node whose range is taken from the first child or token added.
    explicit CstNode(llvm::StringRef kind)
        : kind_(kind)
    {
    }

    [[nodiscard]] llvm::StringRef kind() const override
    {
        return kind_;
    }

    [[nodiscard]] SourceRange range() const override
    {
        return range_;
    }

    [[nodiscard]] const SyntaxNode* parent() const override
    {
        return parent_;
    }

    [[nodiscard]] const SyntaxNode* previousSibling() const override
    {
        return previous_;
    }

    [[nodiscard]] std::size_t childCount() const override
    {
        return children_.size();
    }

    [[nodiscard]] const SyntaxNode* child(const std::size_t index) const override
    {
        return index < children_.size() ? children_[index].get() : nullptr;
    }

    [[nodiscard]] const SyntaxNode* childByFieldName(llvm::StringRef field) const override
    {
        for (const auto& [name, node] : fields_)
        {
            if (name == field)
            {
                return node;
            }
        }
        return nullptr;
    }

    CstNode& addChild(std::unique_ptr<CstNode> node, llvm::StringRef field = {})
    {
        CstNode& added = *node;
        added.parent_   = this;
        added.previous_ = children_.empty() ? nullptr : children_.back().get();
        if (!field.empty())
        {
            fields_.emplace_back(field, &added);
        }
        extendTo(added.range_);
        children_.push_back(std::move(node));
        return added;
    }

    /// Grows the range so that it also covers `span`.
    void extendTo(const SourceRange& span)
    {
        if (empty_)
        {
            range_ = span;
            empty_ = false;
            return;
        }
        if (span.startByte < range_.startByte)
        {
            range_.startByte = span.startByte;
            range_.start     = span.start;
        }
        if (span.endByte > range_.endByte)
        {
            range_.endByte = span.endByte;
            range_.end     = span.end;
        }
    }

private:
    llvm::StringRef                                         kind_;
    SourceRange                                             range_;
    bool                                                    empty_{true};
    const CstNode*                                          parent_{nullptr};
    const CstNode*                                          previous_{nullptr};
    std::vector<std::unique_ptr<CstNode>>                   children_;
    std::vector<std::pair<llvm::StringRef, const CstNode*>> fields_;
};

class FabSyntaxTree final : public SyntaxTree
{
public:
    FabSyntaxTree(std::string text, std::unique_ptr<CstNode> root)
        : text_(std::move(text))
        , root_(std::move(root))
    {
    }

    [[nodiscard]] const SyntaxNode& root() const override
    {
        return *root_;
    }

    [[nodiscard]] llvm::StringRef text() const override
    {
        return text_;
    }

private:
    std::string              text_;
    std::unique_ptr<CstNode> root_;
};

std::unique_ptr<CstNode> makeNode(llvm::StringRef kind, const Token& token)
{
    return std::make_unique<CstNode>(kind, token.range);
}

void appendComments(CstNode& node, const std::vector<const Token*>& comments)
{
    for (const Token* comment : comments)
    {
        node.addChild(makeNode(node_kind::Comment, *comment));
    }
}

/// One statement line after joining bracketed continuation lines.
struct LogicalLine
{
    /// Comment-only lines immediately preceding this line.
    std::vector<const Token*> comments;

    /// Comments before the first code token on the same line.
    std::vector<const Token*> leadingComments;

    /// Code tokens, never empty.
    std::vector<const Token*> code;

    /// Comments after the first code token.
    std::vector<const Token*> trailingComments;

    std::uint32_t indent{0};
};

/// Groups tokens into logical lines. Comments left over at end of file are
/// returned through `trailingComments`.
llvm::Error splitLogicalLines(llvm::StringRef                file,
                              const std::vector<Token>&      tokens,
                              std::vector<LogicalLine>&      lines,
                              std::vector<const Token*>&     trailingComments)
{
    std::vector<const Token*> current;
    std::vector<const Token*> pendingComments;
    std::vector<const Token*> openBrackets;

    const auto finishLine = [&]() {
        if (current.empty())
        {
            return;
        }
        const auto firstCode = std::find_if(current.begin(), current.end(), [](const Token* token) {
            return token->kind != TokenKind::Comment;
        });
        if (firstCode == current.end())
        {
            pendingComments.insert(pendingComments.end(), current.begin(), current.end());
            current.clear();
            return;
        }

        LogicalLine line;
        line.indent   = current.front()->range.start.column;
        line.comments = std::move(pendingComments);
        pendingComments.clear();
        line.leadingComments.assign(current.begin(), firstCode);
        for (auto it = firstCode; it != current.end(); ++it)
        {
            if ((*it)->kind == TokenKind::Comment)
            {
                line.trailingComments.push_back(*it);
            }
            else
            {
                line.code.push_back(*it);
            }
        }
        lines.push_back(std::move(line));
        current.clear();
    };

    for (const Token& token : tokens)
    {
        if (token.kind == TokenKind::Eof)
        {
            break;
        }
        if (token.kind == TokenKind::Newline)
        {
            if (openBrackets.empty())
            {
                finishLine();
            }
            continue;
        }
        if (isOpening(token.kind))
        {
            openBrackets.push_back(&token);
        }
        else if (isClosing(token.kind))
        {
            if (openBrackets.empty() || closerFor(openBrackets.back()->kind) != token.kind)
            {
                return makeError(file, token.range.start, "unmatched '" + token.text + "'");
            }
            openBrackets.pop_back();
        }
        current.push_back(&token);
    }

    if (!openBrackets.empty())
    {
        const Token& open = *openBrackets.back();
        return makeError(file, open.range.start, "unclosed '" + open.text + "'");
    }
    finishLine();
    trailingComments = std::move(pendingComments);
    return llvm::Error::success();
}

/// Parses the code tokens of a single logical line.
class LineParser final
{
public:
    explicit LineParser(const std::vector<const Token*>& code)
        : code_(code)
        , closers_(code.size(), 0)
        , end_(code.size())
    {
        std::vector<std::size_t> stack;
        for (std::size_t i = 0; i < code_.size(); ++i)
        {
            if (isOpening(code_[i]->kind))
            {
                stack.push_back(i);
            }
            else if (isClosing(code_[i]->kind) && !stack.empty())
            {
                closers_[stack.back()] = i;
                stack.pop_back();
            }
        }
    }

    std::unique_ptr<CstNode> parseStatement()
    {
        const Token& first = current();
        if (first.kind == TokenKind::Colon)
        {
            return parseModifiers();
        }
        if (first.kind == TokenKind::Identifier)
        {
            const llvm::StringRef word = first.text;
            if (word == "vars")
            {
                return parseKeywordStatement(node_kind::VarsBlock);
            }
            if (word == "struct")
            {
                return parseStruct();
            }
            if (llvm::is_contained(DataKeywords, word))
            {
                return parseKeywordStatement(node_kind::DataBlock);
            }
            if (startsFunctionDefinition())
            {
                return parseFunctionDefinition();
            }
            if (llvm::is_contained(StatementKeywords, word))
            {
                return parseKeywordStatement(node_kind::Statement);
            }
            if (auto variable = tryParseVariableDefinition())
            {
                return variable;
            }
        }

        auto statement = std::make_unique<CstNode>(node_kind::ExpressionStatement);
        parseSequenceInto(*statement);
        return statement;
    }

    /// Parses a `: modifier ...` line.
    std::unique_ptr<CstNode> parseModifiers()
    {
        auto modifiers = makeNode(node_kind::Modifiers, current());
        ++pos_;
        parseSequenceInto(*modifiers);
        return modifiers;
    }

private:
    [[nodiscard]] bool atEnd() const
    {
        return pos_ >= end_;
    }

    [[nodiscard]] const Token& current() const
    {
        return *code_[pos_];
    }

    [[nodiscard]] const Token* peekToken(const std::size_t lookahead) const
    {
        return pos_ + lookahead < end_ ? code_[pos_ + lookahead] : nullptr;
    }

    [[nodiscard]] static bool isWord(const Token* token, llvm::StringRef word)
    {
        return token && token->kind == TokenKind::Identifier && token->text == word;
    }

    [[nodiscard]] bool startsFunctionDefinition() const
    {
        std::size_t lookahead = 0;
        if (isWord(peekToken(lookahead), "ct"))
        {
            ++lookahead;
        }
        if (isWord(peekToken(lookahead), "asm"))
        {
            ++lookahead;
        }
        const Token* introducer = peekToken(lookahead);
        if (isWord(introducer, "fn"))
        {
            return true;
        }
        if (isWord(introducer, "mode") || isWord(introducer, "nmi") || isWord(introducer, "irq"))
        {
            const Token* name = peekToken(lookahead + 1);
            return name && name->kind == TokenKind::Identifier;
        }
        return false;
    }

    std::unique_ptr<CstNode> parseFunctionDefinition()
    {
        auto signature  = makeNode(node_kind::FunctionSignature, current());
        bool isAssembly = false;
        if (isWord(&current(), "ct"))
        {
            ++pos_;
        }
        if (isWord(&current(), "asm"))
        {
            isAssembly = true;
            ++pos_;
        }
        ++pos_;

        if (!atEnd() && current().kind == TokenKind::Identifier)
        {
            signature->addChild(makeNode(node_kind::Identifier, current()), "name");
            ++pos_;
        }
        if (!atEnd() && current().kind == TokenKind::LParen)
        {
            signature->addChild(parseParameterList(), "parameters");
        }
        if (!atEnd() && current().kind != TokenKind::Colon)
        {
            auto returnType = std::make_unique<CstNode>(node_kind::Type);
            while (!atEnd() && current().kind != TokenKind::Colon)
            {
                returnType->extendTo(current().range);
                ++pos_;
            }
            signature->addChild(std::move(returnType), "return_type");
        }

        auto definition = std::make_unique<CstNode>(isAssembly ? node_kind::AsmFunctionDefinition
                                                               : node_kind::FunctionDefinition);
        definition->addChild(std::move(signature), "signature");
        if (!atEnd())
        {
            definition->addChild(parseModifiers(), "modifiers");
        }
        return definition;
    }

    std::unique_ptr<CstNode> parseParameterList()
    {
        const std::size_t close = closers_[pos_];
        auto              list  = makeNode(node_kind::ParameterList, current());
        list->extendTo(code_[close]->range);

        std::size_t segmentStart = pos_ + 1;
        std::size_t i            = segmentStart;
        while (i <= close)
        {
            if (i == close || code_[i]->kind == TokenKind::Comma)
            {
                if (i > segmentStart)
                {
                    list->addChild(parseParameter(segmentStart, i));
                }
                segmentStart = i + 1;
                ++i;
                continue;
            }
            i = isOpening(code_[i]->kind) ? closers_[i] + 1 : i + 1;
        }

        pos_ = close + 1;
        return list;
    }

    std::unique_ptr<CstNode> parseParameter(const std::size_t begin, const std::size_t end)
    {
        const std::size_t savedEnd = end_;
        pos_                       = begin;
        end_                       = end;

        auto                             parameter = std::make_unique<CstNode>(node_kind::Parameter);
        const std::optional<std::size_t> typeEnd   = scanType(begin);
        if (typeEnd && *typeEnd < end_ && code_[*typeEnd]->kind == TokenKind::Identifier)
        {
            parameter->addChild(makeTypeNode(begin, *typeEnd), "type");
            parameter->addChild(makeNode(node_kind::Identifier, *code_[*typeEnd]), "name");
            pos_ = *typeEnd + 1;
        }
        parseSequenceInto(*parameter);

        end_ = savedEnd;
        return parameter;
    }

    /// Returns the index one past a type spelling that starts at `begin`.
    [[nodiscard]] std::optional<std::size_t> scanType(std::size_t begin) const
    {
        std::size_t i = begin;
        if (i < end_ && isWord(code_[i], "ct"))
        {
            ++i;
        }
        if (i >= end_ || code_[i]->kind != TokenKind::Identifier || llvm::is_contained(ReservedWords, code_[i]->text))
        {
            return std::nullopt;
        }
        ++i;
        while (i < end_)
        {
            if (code_[i]->kind == TokenKind::LBracket)
            {
                i = closers_[i] + 1;
            }
            else if (code_[i]->kind == TokenKind::Operator && code_[i]->text == "/" && i + 1 < end_ &&
                     code_[i + 1]->kind == TokenKind::Identifier)
            {
                i += 2;
            }
            else
            {
                break;
            }
        }
        return i;
    }

    std::unique_ptr<CstNode> makeTypeNode(const std::size_t begin, const std::size_t end) const
    {
        auto type = std::make_unique<CstNode>(node_kind::Type);
        for (std::size_t i = begin; i < end; ++i)
        {
            type->extendTo(code_[i]->range);
        }
        return type;
    }

    /// Matches `[ct] Type name [= value]`.
    std::unique_ptr<CstNode> tryParseVariableDefinition()
    {
        const std::optional<std::size_t> typeEnd = scanType(pos_);
        if (!typeEnd || *typeEnd >= end_)
        {
            return nullptr;
        }
        const Token& name = *code_[*typeEnd];
        if (name.kind != TokenKind::Identifier || llvm::is_contained(ReservedWords, name.text))
        {
            return nullptr;
        }
        const std::size_t afterName = *typeEnd + 1;
        if (afterName < end_ && code_[afterName]->kind != TokenKind::Equal)
        {
            return nullptr;
        }

        auto variable = std::make_unique<CstNode>(node_kind::VariableDefinition);
        variable->addChild(makeTypeNode(pos_, *typeEnd), "type");
        variable->addChild(makeNode(node_kind::Identifier, name), "name");
        pos_ = afterName;
        if (!atEnd())
        {
            variable->extendTo(current().range);
            ++pos_;
            if (auto value = parseExpression())
            {
                variable->addChild(std::move(value), "value");
            }
            parseSequenceInto(*variable);
        }
        return variable;
    }

    std::unique_ptr<CstNode> parseStruct()
    {
        auto definition = makeNode(node_kind::StructDefinition, current());
        ++pos_;
        if (!atEnd() && current().kind == TokenKind::Identifier)
        {
            definition->addChild(makeNode(node_kind::Identifier, current()), "name");
            ++pos_;
        }
        parseSequenceInto(*definition);
        return definition;
    }

    std::unique_ptr<CstNode> parseKeywordStatement(llvm::StringRef kind)
    {
        auto statement = makeNode(kind, current());
        ++pos_;
        parseSequenceInto(*statement);
        return statement;
    }

    /// Parses comma- or juxtaposition-separated expressions up to `end_`.
    /// Tokens that cannot start an expression become `ERROR` nodes.
    void parseSequenceInto(CstNode& node)
    {
        while (!atEnd())
        {
            if (current().kind == TokenKind::Comma)
            {
                node.extendTo(current().range);
                ++pos_;
                continue;
            }
            if (auto expression = parseExpression())
            {
                node.addChild(std::move(expression));
                continue;
            }
            node.addChild(makeNode(node_kind::Error, current()));
            ++pos_;
        }
    }

    std::unique_ptr<CstNode> parseExpression(const int minPrecedence = 0)
    {
        std::unique_ptr<CstNode> lhs = parseUnary();
        if (!lhs)
        {
            return nullptr;
        }
        while (!atEnd())
        {
            const Token& op         = current();
            const int    precedence = binaryPrecedence(op);
            if (precedence < 0 || precedence < minPrecedence)
            {
                break;
            }
            ++pos_;

            const bool assignment = precedence == AssignmentPrecedence;
            auto       combined   = std::make_unique<CstNode>(assignment ? node_kind::AssignmentExpression
                                                                         : node_kind::BinaryExpression);
            combined->addChild(std::move(lhs), "left");
            combined->extendTo(op.range);
            if (auto rhs = parseExpression(assignment ? precedence : precedence + 1))
            {
                combined->addChild(std::move(rhs), "right");
            }
            lhs = std::move(combined);
        }
        return lhs;
    }

    std::unique_ptr<CstNode> parseUnary()
    {
        if (atEnd())
        {
            return nullptr;
        }
        const Token& token = current();
        if (token.kind == TokenKind::Operator && llvm::is_contained(PrefixOperators, token.text))
        {
            ++pos_;
            auto unary = makeNode(node_kind::UnaryExpression, token);
            if (auto operand = parseUnary())
            {
                unary->addChild(std::move(operand), "argument");
            }
            return unary;
        }
        return parsePostfix();
    }

    std::unique_ptr<CstNode> parsePostfix()
    {
        std::unique_ptr<CstNode> expression = parsePrimary();
        if (!expression)
        {
            return nullptr;
        }
        while (!atEnd())
        {
            const Token& token = current();
            if (token.kind == TokenKind::LParen)
            {
                auto call = std::make_unique<CstNode>(node_kind::Call);
                call->addChild(std::move(expression), "function");
                auto arguments = makeNode(node_kind::ArgumentList, token);
                parseBracketedInto(*arguments);
                call->addChild(std::move(arguments), "arguments");
                expression = std::move(call);
            }
            else if (token.kind == TokenKind::LBracket)
            {
                auto index = std::make_unique<CstNode>(node_kind::IndexExpression);
                index->addChild(std::move(expression), "object");
                parseBracketedInto(*index);
                expression = std::move(index);
            }
            else if (token.kind == TokenKind::Dot && peekToken(1) && peekToken(1)->kind == TokenKind::Identifier)
            {
                auto member = std::make_unique<CstNode>(node_kind::MemberExpression);
                member->addChild(std::move(expression), "object");
                member->addChild(makeNode(node_kind::Identifier, *peekToken(1)), "property");
                pos_ += 2;
                expression = std::move(member);
            }
            else
            {
                break;
            }
        }
        return expression;
    }

    std::unique_ptr<CstNode> parsePrimary()
    {
        const Token& token = current();
        switch (token.kind)
        {
        case TokenKind::Identifier:
            ++pos_;
            return makeNode(node_kind::Identifier, token);
        case TokenKind::Number:
            ++pos_;
            return makeNode(node_kind::Number, token);
        case TokenKind::String:
            ++pos_;
            return makeNode(node_kind::String, token);
        case TokenKind::LParen: {
            auto group = makeNode(node_kind::ParenthesizedExpr, token);
            parseBracketedInto(*group);
            return group;
        }
        case TokenKind::LBrace: {
            auto group = makeNode(node_kind::BraceExpression, token);
            parseBracketedInto(*group);
            return group;
        }
        case TokenKind::LBracket: {
            auto group = makeNode(node_kind::ArrayExpression, token);
            parseBracketedInto(*group);
            return group;
        }
        default:
            return nullptr;
        }
    }

    /// Parses the contents of the bracket pair opening at the cursor into `node`.
    void parseBracketedInto(CstNode& node)
    {
        const std::size_t close = closers_[pos_];
        node.extendTo(code_[pos_]->range);
        node.extendTo(code_[close]->range);

        const std::size_t savedEnd = end_;
        ++pos_;
        end_ = close;
        parseSequenceInto(node);
        end_ = savedEnd;
        pos_ = close + 1;
    }

    const std::vector<const Token*>& code_;
    std::vector<std::size_t>         closers_;
    std::size_t                      pos_{0};
    std::size_t                      end_{0};
};

/// Nests logical lines into blocks by indentation.
class BlockBuilder final
{
public:
    BlockBuilder(llvm::StringRef file, const std::vector<LogicalLine>& lines)
        : file_(file)
        , lines_(lines)
    {
    }

    llvm::Error build(CstNode& root)
    {
        if (lines_.empty())
        {
            return llvm::Error::success();
        }
        if (llvm::Error error = parseBlock(root))
        {
            return error;
        }
        if (index_ < lines_.size())
        {
            return inconsistentDedent(lines_[index_]);
        }
        return llvm::Error::success();
    }

private:
    [[nodiscard]] llvm::Error inconsistentDedent(const LogicalLine& line) const
    {
        return makeError(file_, line.code.front()->range.start, "inconsistent dedent");
    }

    [[nodiscard]] bool continuesWithModifiers(const std::uint32_t blockIndent) const
    {
        return index_ < lines_.size() && lines_[index_].indent == blockIndent &&
               lines_[index_].code.front()->kind == TokenKind::Colon;
    }

    llvm::Error parseBlock(CstNode& container)
    {
        const std::uint32_t blockIndent = lines_[index_].indent;
        while (index_ < lines_.size() && lines_[index_].indent == blockIndent)
        {
            const LogicalLine& line = lines_[index_++];
            appendComments(container, line.comments);
            appendComments(container, line.leadingComments);

            LineParser               parser(line.code);
            std::unique_ptr<CstNode> statement = parser.parseStatement();
            appendComments(*statement, line.trailingComments);

            const bool isDefinition =
                statement->is(node_kind::FunctionDefinition) || statement->is(node_kind::AsmFunctionDefinition);
            while (isDefinition && continuesWithModifiers(blockIndent))
            {
                const LogicalLine& modifierLine = lines_[index_++];
                appendComments(*statement, modifierLine.comments);
                appendComments(*statement, modifierLine.leadingComments);
                LineParser modifierParser(modifierLine.code);
                statement->addChild(modifierParser.parseModifiers(), "modifiers");
                appendComments(*statement, modifierLine.trailingComments);
            }

            if (index_ < lines_.size() && lines_[index_].indent > blockIndent)
            {
                if (statement->is(node_kind::VarsBlock))
                {
                    if (llvm::Error error = parseBlock(*statement))
                    {
                        return error;
                    }
                }
                else
                {
                    auto body = std::make_unique<CstNode>(node_kind::Block);
                    if (llvm::Error error = parseBlock(*body))
                    {
                        return error;
                    }
                    statement->addChild(std::move(body), "body");
                }
                if (index_ < lines_.size() && lines_[index_].indent > blockIndent)
                {
                    return inconsistentDedent(lines_[index_]);
                }
            }

            container.addChild(std::move(statement));
        }
        return llvm::Error::success();
    }

    llvm::StringRef                 file_;
    const std::vector<LogicalLine>& lines_;
    std::size_t                     index_{0};
};

}  // namespace

llvm::Expected<SyntaxTreeRef> FabParser::parse(llvm::StringRef filePath, std::string text) const
{
    Lexer lexer(filePath.str(), text);
    auto  tokens = lexer.lex();
    if (!tokens)
    {
        return tokens.takeError();
    }

    std::vector<LogicalLine>  lines;
    std::vector<const Token*> trailingComments;
    if (llvm::Error error = splitLogicalLines(filePath, *tokens, lines, trailingComments))
    {
        return std::move(error);
    }

    const SourcePoint end  = tokens->back().range.end;
    auto              root = std::make_unique<CstNode>(node_kind::SourceFile,
                                          SourceRange{0, text.size(), SourcePoint{}, end});
    BlockBuilder builder(filePath, lines);
    if (llvm::Error error = builder.build(*root))
    {
        return std::move(error);
    }
    appendComments(*root, trailingComments);

    return std::make_shared<FabSyntaxTree>(std::move(text), std::move(root));
}

llvm::Expected<SyntaxTreeRef> parseFabSource(llvm::StringRef filePath, std::string text)
{
    return FabParser().parse(filePath, std::move(text));
}

}  // namespace fabls
