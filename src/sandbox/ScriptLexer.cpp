#include "sandbox/ScriptLexer.h"
#include "sandbox/ScriptValue.h"

#include <cctype>
#include <map>

namespace sigscan {
namespace sandbox {

namespace {
const std::map<std::string, TokenType>& keywords() {
    static const std::map<std::string, TokenType> kKeywords = {
        {"let", TokenType::Let},
        {"fn", TokenType::Fn},
        {"if", TokenType::If},
        {"else", TokenType::Else},
        {"while", TokenType::While},
        {"for", TokenType::For},
        {"in", TokenType::In},
        {"return", TokenType::Return},
        {"break", TokenType::Break},
        {"continue", TokenType::Continue},
        {"true", TokenType::True},
        {"false", TokenType::False},
        {"null", TokenType::Null},
    };
    return kKeywords;
}
}

const char* toString(TokenType type) {
    switch (type) {
        case TokenType::Number: return "number";
        case TokenType::String: return "string";
        case TokenType::Identifier: return "identifier";
        case TokenType::Let: return "'let'";
        case TokenType::Fn: return "'fn'";
        case TokenType::If: return "'if'";
        case TokenType::Else: return "'else'";
        case TokenType::While: return "'while'";
        case TokenType::For: return "'for'";
        case TokenType::In: return "'in'";
        case TokenType::Return: return "'return'";
        case TokenType::Break: return "'break'";
        case TokenType::Continue: return "'continue'";
        case TokenType::True: return "'true'";
        case TokenType::False: return "'false'";
        case TokenType::Null: return "'null'";
        case TokenType::LParen: return "'('";
        case TokenType::RParen: return "')'";
        case TokenType::LBrace: return "'{'";
        case TokenType::RBrace: return "'}'";
        case TokenType::LBracket: return "'['";
        case TokenType::RBracket: return "']'";
        case TokenType::Comma: return "','";
        case TokenType::Semicolon: return "';'";
        case TokenType::Colon: return "':'";
        case TokenType::Dot: return "'.'";
        case TokenType::DotDot: return "'..'";
        case TokenType::Plus: return "'+'";
        case TokenType::Minus: return "'-'";
        case TokenType::Star: return "'*'";
        case TokenType::Slash: return "'/'";
        case TokenType::Percent: return "'%'";
        case TokenType::Bang: return "'!'";
        case TokenType::Assign: return "'='";
        case TokenType::Eq: return "'=='";
        case TokenType::NotEq: return "'!='";
        case TokenType::Less: return "'<'";
        case TokenType::LessEq: return "'<='";
        case TokenType::Greater: return "'>'";
        case TokenType::GreaterEq: return "'>='";
        case TokenType::AndAnd: return "'&&'";
        case TokenType::OrOr: return "'||'";
        case TokenType::End: return "end of input";
    }
    return "token";
}

ScriptLexer::ScriptLexer(const std::string& source)
    : source_(source) {}

char ScriptLexer::peek(size_t ahead) const {
    const size_t at = pos_ + ahead;
    return at < source_.size() ? source_[at] : '\0';
}

char ScriptLexer::advance() {
    const char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void ScriptLexer::skipWhitespaceAndComments() {
    while (pos_ < source_.size()) {
        const char c = peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
        } else if (c == '/' && peek(1) == '/') {
            while (pos_ < source_.size() && peek() != '\n') {
                advance();
            }
        } else if (c == '/' && peek(1) == '*') {
            const int line = line_;
            const int column = column_;
            advance();
            advance();
            while (!(peek() == '*' && peek(1) == '/')) {
                if (pos_ >= source_.size()) {
                    throw ScriptError("unterminated block comment", line, column);
                }
                advance();
            }
            advance();
            advance();
        } else {
            break;
        }
    }
}

Token ScriptLexer::makeToken(TokenType type, int line, int column, std::string text) {
    Token token;
    token.type = type;
    token.line = line;
    token.column = column;
    token.text = std::move(text);
    return token;
}

Token ScriptLexer::lexNumber() {
    const int line = line_;
    const int column = column_;
    const size_t start = pos_;

    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        advance();
    }
    // "1..5" 범위 연산자와 소수점 구분
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        advance();
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        const size_t sign = (peek(1) == '+' || peek(1) == '-') ? 1 : 0;
        if (std::isdigit(static_cast<unsigned char>(peek(1 + sign)))) {
            advance();
            if (sign) advance();
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                advance();
            }
        }
    }

    Token token = makeToken(TokenType::Number, line, column, source_.substr(start, pos_ - start));
    try {
        token.number = std::stod(token.text);
    } catch (const std::exception&) {
        throw ScriptError("invalid number literal '" + token.text + "'", line, column);
    }
    return token;
}

Token ScriptLexer::lexString() {
    const int line = line_;
    const int column = column_;
    const char quote = advance();

    std::string value;
    while (true) {
        if (pos_ >= source_.size() || peek() == '\n') {
            throw ScriptError("unterminated string literal", line, column);
        }
        const char c = advance();
        if (c == quote) {
            break;
        }
        if (c == '\\') {
            if (pos_ >= source_.size()) {
                throw ScriptError("unterminated string literal", line, column);
            }
            const char esc = advance();
            switch (esc) {
                case 'n': value.push_back('\n'); break;
                case 't': value.push_back('\t'); break;
                case '\\': value.push_back('\\'); break;
                case '"': value.push_back('"'); break;
                case '\'': value.push_back('\''); break;
                default:
                    throw ScriptError(std::string("unknown escape sequence \\") + esc, line_, column_ - 1);
            }
            continue;
        }
        value.push_back(c);
    }
    return makeToken(TokenType::String, line, column, std::move(value));
}

Token ScriptLexer::lexIdentifier() {
    const int line = line_;
    const int column = column_;
    const size_t start = pos_;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') {
        advance();
    }
    std::string word = source_.substr(start, pos_ - start);
    auto it = keywords().find(word);
    if (it != keywords().end()) {
        return makeToken(it->second, line, column, std::move(word));
    }
    return makeToken(TokenType::Identifier, line, column, std::move(word));
}

std::vector<Token> ScriptLexer::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        skipWhitespaceAndComments();
        if (pos_ >= source_.size()) {
            tokens.push_back(makeToken(TokenType::End, line_, column_));
            return tokens;
        }

        const char c = peek();
        if (std::isdigit(static_cast<unsigned char>(c))) {
            tokens.push_back(lexNumber());
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            tokens.push_back(lexIdentifier());
            continue;
        }
        if (c == '"' || c == '\'') {
            tokens.push_back(lexString());
            continue;
        }

        const int line = line_;
        const int column = column_;
        advance();

        auto two = [&](char next, TokenType matched, TokenType single) {
            if (peek() == next) {
                advance();
                return makeToken(matched, line, column);
            }
            return makeToken(single, line, column);
        };

        switch (c) {
            case '(': tokens.push_back(makeToken(TokenType::LParen, line, column)); break;
            case ')': tokens.push_back(makeToken(TokenType::RParen, line, column)); break;
            case '{': tokens.push_back(makeToken(TokenType::LBrace, line, column)); break;
            case '}': tokens.push_back(makeToken(TokenType::RBrace, line, column)); break;
            case '[': tokens.push_back(makeToken(TokenType::LBracket, line, column)); break;
            case ']': tokens.push_back(makeToken(TokenType::RBracket, line, column)); break;
            case ',': tokens.push_back(makeToken(TokenType::Comma, line, column)); break;
            case ';': tokens.push_back(makeToken(TokenType::Semicolon, line, column)); break;
            case ':': tokens.push_back(makeToken(TokenType::Colon, line, column)); break;
            case '+': tokens.push_back(makeToken(TokenType::Plus, line, column)); break;
            case '-': tokens.push_back(makeToken(TokenType::Minus, line, column)); break;
            case '*': tokens.push_back(makeToken(TokenType::Star, line, column)); break;
            case '/': tokens.push_back(makeToken(TokenType::Slash, line, column)); break;
            case '%': tokens.push_back(makeToken(TokenType::Percent, line, column)); break;
            case '.': tokens.push_back(two('.', TokenType::DotDot, TokenType::Dot)); break;
            case '!': tokens.push_back(two('=', TokenType::NotEq, TokenType::Bang)); break;
            case '=': tokens.push_back(two('=', TokenType::Eq, TokenType::Assign)); break;
            case '<': tokens.push_back(two('=', TokenType::LessEq, TokenType::Less)); break;
            case '>': tokens.push_back(two('=', TokenType::GreaterEq, TokenType::Greater)); break;
            case '&':
                if (peek() != '&') throw ScriptError("expected '&&'", line, column);
                advance();
                tokens.push_back(makeToken(TokenType::AndAnd, line, column));
                break;
            case '|':
                if (peek() != '|') throw ScriptError("expected '||'", line, column);
                advance();
                tokens.push_back(makeToken(TokenType::OrOr, line, column));
                break;
            default:
                throw ScriptError(std::string("unexpected character '") + c + "'", line, column);
        }
    }
}

} // namespace sandbox
} // namespace sigscan
