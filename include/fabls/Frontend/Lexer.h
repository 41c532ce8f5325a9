//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Token and lexer declarations for transforming NESFab text into token streams.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_FRONTEND_LEXER_H
#define FABLS_FRONTEND_LEXER_H

#include "fabls/Frontend/SourceLocation.h"

#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fabls
{

/// @file
/// @brief Tokenization interfaces for NESFab source text.

/// @brief Token categories recognized by the lexer.
enum class TokenKind
{

    /// @brief End-of-file sentinel.
    Eof,

    /// @brief Line break token preserving statement boundaries.
    Newline,

    /// @brief `//` line comment or `/* */` block comment.
    Comment,

    /// @brief Identifier or keyword token.
    Identifier,

    /// @brief Decimal, `$` hexadecimal, or `0x`/`0b` literal.
    Number,

    /// @brief Quoted string or character literal.
    String,

    /// @brief `(` token.
    LParen,

    /// @brief `)` token.
    RParen,

    /// @brief `[` token.
    LBracket,

    /// @brief `]` token.
    RBracket,

    /// @brief `{` token.
    LBrace,

    /// @brief `}` token.
    RBrace,

    /// @brief `,` token.
    Comma,

    /// @brief `.` token.
    Dot,

    /// @brief `:` token.
    Colon,

    /// @brief `=` token.
    Equal,

    /// @brief Any other operator spelling, such as `+=` or `<<`.
    Operator,
};

/// @brief Single lexical token emitted by @ref Lexer.
struct Token
{
    /// @brief Token category.
    TokenKind kind{TokenKind::Eof};

    /// @brief Original token spelling.
    std::string text;

    /// @brief Source span of the token.
    SourceRange range;
};

/// @brief Converts NESFab source text into a token stream.
class Lexer final
{
public:
    /// @brief Constructs a lexer for one source file.
    /// @param[in] file Logical file name used in error messages.
    /// @param[in] text Full source text to tokenize.
    Lexer(std::string file, std::string text);

    /// @brief Tokenizes the input source.
    /// @return Token sequence terminated by @ref TokenKind::Eof, or an error on
    ///         an unexpected character or an unterminated literal/comment.
    [[nodiscard]] llvm::Expected<std::vector<Token>> lex();

private:
    [[nodiscard]] bool isAtEnd() const;

    [[nodiscard]] char peek(std::size_t lookahead = 0) const;

    char advance();

    [[nodiscard]] SourcePoint point() const
    {
        return SourcePoint{row_, column_};
    }

    /// @brief Emits the token spanning from `startByte`/`start` to the cursor.
    void emit(TokenKind kind, std::size_t startByte, const SourcePoint& start);

    /// @brief Builds an error anchored at `start`.
    [[nodiscard]] llvm::Error makeError(const SourcePoint& start, const std::string& message) const;

    void lexIdentifier();

    void lexNumber();

    [[nodiscard]] bool lexString(char quote);

    [[nodiscard]] bool lexBlockComment();

    void lexOperator();

    /// @brief Logical file name for messages.
    std::string file_;

    /// @brief Full source text.
    std::string text_;

    /// @brief Current byte offset.
    std::size_t index_{0};

    /// @brief Current 0-based row.
    std::uint32_t row_{0};

    /// @brief Current 0-based byte column.
    std::uint32_t column_{0};

    /// @brief Output token buffer.
    std::vector<Token> tokens_;
};

}  // namespace fabls

#endif  // FABLS_FRONTEND_LEXER_H
