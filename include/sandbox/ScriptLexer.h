#pragma once

#include <string>
#include <vector>

namespace sigscan {
namespace sandbox {

enum class TokenType {
    Number,
    String,
    Identifier,
    // keywords
    Let, Fn, If, Else, While, For, In, Return, Break, Continue, True, False, Null,
    // punctuation
    LParen, RParen, LBrace, RBrace, LBracket, RBracket,
    Comma, Semicolon, Colon, Dot, DotDot,
    Plus, Minus, Star, Slash, Percent,
    Bang, Assign, Eq, NotEq, Less, LessEq, Greater, GreaterEq,
    AndAnd, OrOr,
    End
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    double number = 0.0;
    int line = 1;
    int column = 1;
};

const char* toString(TokenType type);

class ScriptLexer {
public:
    explicit ScriptLexer(const std::string& source);

    // Throws ScriptError on an unexpected character or unterminated string.
    std::vector<Token> tokenize();

private:
    char peek(size_t ahead = 0) const;
    char advance();
    void skipWhitespaceAndComments();
    Token makeToken(TokenType type, int line, int column, std::string text = {});
    Token lexNumber();
    Token lexString();
    Token lexIdentifier();

    std::string source_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
};

} // namespace sandbox
} // namespace sigscan
