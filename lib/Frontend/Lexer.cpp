//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements lexical analysis for NESFab source text.
///
/// The lexer converts source characters into parser tokens while keeping exact byte and row/column spans.
///
//===----------------------------------------------------------------------===//

#include "fabls/Frontend/Lexer.h"

#include "llvm/ADT/StringRef.h"

#include <array>
#include <cctype>

namespace fabls
{
namespace
{

/// Multi-character operators, longest first.
constexpr std::array<llvm::StringLiteral, 20> MultiCharOperators = {
    "<<=", ">>=", "==", "!=", "<=", ">=", "<<", ">>", "&&", "||",
    "+=",  "-=",  "*=", "/=", "%=", "&=", "|=", "^=", "++", "--",
};

bool isOperatorChar(const char c)
{
    switch (c)
    {
    case '+':
    case '-':
    case '*':
    case '/':
    case '%':
    case '&':
    case '|':
    case '^':
    case '~':
    case '!':
    case '<':
    case '>':
    case '#':
    case '@':
    case '?':
    case ';':
        return true;
    default:
        return false;
    }
}

}  // namespace

Lexer::Lexer(std::string file, std::string text)
    : file_(std::move(file))
    , text_(std::move(text))
{
}

bool Lexer::isAtEnd() const
{
    return index_ >= text_.size();
}

char Lexer::peek(std::size_t lookahead) const
{
    const std::size_t i = index_ + lookahead;
    return i < text_.size() ? text_[i] : '\0';
}

char Lexer::advance()
{
    if (isAtEnd())
    {
        return '\0';
    }
    const char c = text_[index_++];
    if (c == '\n')
    {
        ++row_;
        column_ = 0;
    }
    else
    {
        ++column_;
    }
    return c;
}

void Lexer::emit(TokenKind kind, const std::size_t startByte, const SourcePoint& start)
{
    tokens_.push_back(Token{kind,
                            text_.substr(startByte, index_ - startByte),
                            SourceRange{startByte, index_, start, point()}});
}

llvm::Error Lexer::makeError(const SourcePoint& start, const std::string& message) const
{
    const SourceLocation location{file_, start.row + 1U, start.column + 1U};
    return llvm::createStringError(llvm::inconvertibleErrorCode(), location.str() + ": " + message);
}

void Lexer::lexIdentifier()
{
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
    {
        (void) advance();
    }
}

void Lexer::lexNumber()
{
    if (peek() == '$')
    {
        (void) advance();
        while (std::isxdigit(static_cast<unsigned char>(peek())) || peek() == '_')
        {
            (void) advance();
        }
        return;
    }

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'b' || peek(1) == 'B'))
    {
        (void) advance();
        (void) advance();
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
        {
            (void) advance();
        }
        return;
    }

    while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')
    {
        (void) advance();
    }
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))
    {
        (void) advance();
        while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')
        {
            (void) advance();
        }
    }
}

bool Lexer::lexString(const char quote)
{
    (void) advance();
    while (!isAtEnd() && peek() != quote && peek() != '\n')
    {
        if (advance() == '\\' && !isAtEnd() && peek() != '\n')
        {
            (void) advance();
        }
    }
    if (peek() != quote)
    {
        return false;
    }
    (void) advance();
    return true;
}

bool Lexer::lexBlockComment()
{
    (void) advance();
    (void) advance();
    while (!isAtEnd())
    {
        if (peek() == '*' && peek(1) == '/')
        {
            (void) advance();
            (void) advance();
            return true;
        }
        (void) advance();
    }
    return false;
}

void Lexer::lexOperator()
{
    const llvm::StringRef rest = llvm::StringRef(text_).drop_front(index_);
    for (const llvm::StringLiteral& op : MultiCharOperators)
    {
        if (rest.take_front(op.size()) == op)
        {
            for (std::size_t i = 0; i < op.size(); ++i)
            {
                (void) advance();
            }
            return;
        }
    }
    (void) advance();
}

llvm::Expected<std::vector<Token>> Lexer::lex()
{
    if (llvm::StringRef(text_).take_front(3) == "\xEF\xBB\xBF")
    {
        index_ = 3;
    }

    while (!isAtEnd())
    {
        const std::size_t startByte = index_;
        const SourcePoint start     = point();
        const char        c         = peek();

        if (c == '\r' || c == ' ' || c == '\t' || c == '\f')
        {
            (void) advance();
            continue;
        }
        if (c == '\n')
        {
            (void) advance();
            tokens_.push_back(Token{TokenKind::Newline, "\\n", SourceRange{startByte, index_, start, start}});
            continue;
        }
        if (c == '/' && peek(1) == '/')
        {
            while (!isAtEnd() && peek() != '\n')
            {
                (void) advance();
            }
            std::size_t endByte = index_;
            if (endByte > startByte && text_[endByte - 1] == '\r')
            {
                --endByte;
            }
            const std::uint32_t trimmed = static_cast<std::uint32_t>(index_ - endByte);
            tokens_.push_back(Token{TokenKind::Comment,
                                    text_.substr(startByte, endByte - startByte),
                                    SourceRange{startByte, endByte, start, SourcePoint{row_, column_ - trimmed}}});
            continue;
        }
        if (c == '/' && peek(1) == '*')
        {
            if (!lexBlockComment())
            {
                return makeError(start, "unterminated block comment");
            }
            emit(TokenKind::Comment, startByte, start);
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
        {
            lexIdentifier();
            emit(TokenKind::Identifier, startByte, start);
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || (c == '$' && std::isxdigit(static_cast<unsigned char>(peek(1)))))
        {
            lexNumber();
            emit(TokenKind::Number, startByte, start);
            continue;
        }
        if (c == '"' || c == '\'')
        {
            if (!lexString(c))
            {
                return makeError(start, "unterminated string literal");
            }
            emit(TokenKind::String, startByte, start);
            continue;
        }

        TokenKind kind = TokenKind::Operator;
        switch (c)
        {
        case '(':
            kind = TokenKind::LParen;
            break;
        case ')':
            kind = TokenKind::RParen;
            break;
        case '[':
            kind = TokenKind::LBracket;
            break;
        case ']':
            kind = TokenKind::RBracket;
            break;
        case '{':
            kind = TokenKind::LBrace;
            break;
        case '}':
            kind = TokenKind::RBrace;
            break;
        case ',':
            kind = TokenKind::Comma;
            break;
        case '.':
            kind = TokenKind::Dot;
            break;
        case ':':
            kind = TokenKind::Colon;
            break;
        case '=':
            kind = peek(1) == '=' ? TokenKind::Operator : TokenKind::Equal;
            break;
        default:
            if (!isOperatorChar(c))
            {
                return makeError(start, std::string("unexpected character '") + c + "'");
            }
            break;
        }

        if (kind == TokenKind::Operator)
        {
            lexOperator();
        }
        else
        {
            (void) advance();
        }
        emit(kind, startByte, start);
    }

    tokens_.push_back(Token{TokenKind::Eof, "", SourceRange{index_, index_, point(), point()}});
    return std::move(tokens_);
}

}  // namespace fabls
