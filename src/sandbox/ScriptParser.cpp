#include "sandbox/ScriptParser.h"

#include "sandbox/ScriptBuiltins.h"
#include "sandbox/ScriptValue.h"

#include <algorithm>
#include <functional>

namespace sigscan {
namespace sandbox {

ScriptParser::DepthGuard::DepthGuard(ScriptParser& p, const Token& at)
    : parser(p) {
    if (++parser.depth_ > parser.max_depth_) {
        parser.fail("nesting too deep", at);
    }
}

ScriptParser::ScriptParser(std::vector<Token> tokens, int max_depth)
    : tokens_(std::move(tokens))
    , max_depth_(max_depth) {
    if (tokens_.empty() || tokens_.back().type != TokenType::End) {
        Token end;
        end.type = TokenType::End;
        tokens_.push_back(end);
    }
}

std::shared_ptr<const CompiledScript> ScriptParser::compile(const std::string& source, int max_depth) {
    ScriptLexer lexer(source);
    ScriptParser parser(lexer.tokenize(), max_depth);
    return parser.parseProgram();
}

// ===== token helpers =====

const Token& ScriptParser::peek(size_t ahead) const {
    const size_t at = std::min(pos_ + ahead, tokens_.size() - 1);
    return tokens_[at];
}

const Token& ScriptParser::advance() {
    const Token& token = tokens_[pos_];
    if (pos_ < tokens_.size() - 1) {
        ++pos_;
    }
    return token;
}

bool ScriptParser::check(TokenType type) const {
    return peek().type == type;
}

bool ScriptParser::match(TokenType type) {
    if (!check(type)) {
        return false;
    }
    advance();
    return true;
}

const Token& ScriptParser::expect(TokenType type, const char* context) {
    if (!check(type)) {
        fail(std::string("expected ") + toString(type) + " " + context + ", found " + toString(peek().type), peek());
    }
    return advance();
}

void ScriptParser::fail(const std::string& message, const Token& at) const {
    throw ScriptError(message, at.line, at.column);
}

void ScriptParser::skipSemicolons() {
    while (match(TokenType::Semicolon)) {
    }
}

// ===== scopes =====

void ScriptParser::pushScope() {
    current_->scopes.emplace_back();
}

void ScriptParser::popScope() {
    const auto& scope = current_->scopes.back();
    current_->next_slot -= static_cast<int>(scope.size());
    current_->scopes.pop_back();
}

int ScriptParser::declare(const std::string& name, const Token& at) {
    if (ScriptBuiltins::find(name) >= 0 || function_names_.count(name) > 0) {
        fail("'" + name + "' shadows a function", at);
    }
    auto& scope = current_->scopes.back();
    if (scope.count(name) > 0) {
        fail("'" + name + "' is already declared in this scope", at);
    }
    const int slot = current_->next_slot++;
    current_->max_slot = std::max(current_->max_slot, current_->next_slot);
    scope[name] = slot;
    return slot;
}

int ScriptParser::lookup(const std::string& name) const {
    for (auto it = current_->scopes.rbegin(); it != current_->scopes.rend(); ++it) {
        auto found = it->find(name);
        if (found != it->end()) {
            return found->second;
        }
    }
    return -1;
}

// ===== program =====

void ScriptParser::collectFunctionNames() {
    for (size_t i = 0; i + 1 < tokens_.size(); ++i) {
        if (tokens_[i].type != TokenType::Fn || tokens_[i + 1].type != TokenType::Identifier) {
            continue;
        }
        const Token& name = tokens_[i + 1];
        if (function_names_.count(name.text) > 0) {
            fail("function '" + name.text + "' is declared twice", name);
        }
        if (ScriptBuiltins::find(name.text) >= 0) {
            fail("function '" + name.text + "' redefines a builtin", name);
        }

        size_t params = 0;
        size_t j = i + 2;
        if (j < tokens_.size() && tokens_[j].type == TokenType::LParen) {
            for (++j; j < tokens_.size() && tokens_[j].type != TokenType::RParen && tokens_[j].type != TokenType::End; ++j) {
                if (tokens_[j].type == TokenType::Identifier) {
                    ++params;
                }
            }
        }

        function_names_[name.text] = static_cast<int>(function_arity_.size());
        function_arity_.push_back(params);
    }
}

std::shared_ptr<CompiledScript> ScriptParser::parseProgram() {
    collectFunctionNames();

    auto script = std::make_shared<CompiledScript>();
    script->functions.resize(function_arity_.size());

    FunctionScope top;
    current_ = &top;
    pushScope();

    skipSemicolons();
    while (!check(TokenType::End)) {
        if (check(TokenType::Fn)) {
            parseFunction(*script);
        } else {
            script->body.push_back(parseStatement());
        }
        skipSemicolons();
    }

    script->slot_count = static_cast<size_t>(top.max_slot);
    current_ = nullptr;
    return script;
}

void ScriptParser::parseFunction(CompiledScript& script) {
    const Token& fn_token = expect(TokenType::Fn, "");
    const Token& name = expect(TokenType::Identifier, "after 'fn'");
    const int index = function_names_.at(name.text);

    FunctionScope scope;
    FunctionScope* outer = current_;
    current_ = &scope;
    pushScope();

    expect(TokenType::LParen, "after function name");
    size_t params = 0;
    if (!check(TokenType::RParen)) {
        do {
            const Token& param = expect(TokenType::Identifier, "in parameter list");
            declare(param.text, param);
            ++params;
        } while (match(TokenType::Comma));
    }
    expect(TokenType::RParen, "after parameters");

    FunctionDef def;
    def.name = name.text;
    def.line = fn_token.line;
    def.param_count = params;
    def.body = parseBlock();
    def.slot_count = static_cast<size_t>(scope.max_slot);

    current_ = outer;
    script.functions[index] = std::move(def);
}

// ===== statements =====

std::vector<std::unique_ptr<Stmt>> ScriptParser::parseBlock() {
    expect(TokenType::LBrace, "to open block");
    pushScope();

    std::vector<std::unique_ptr<Stmt>> body;
    skipSemicolons();
    while (!check(TokenType::RBrace)) {
        if (check(TokenType::End)) {
            fail("unterminated block, expected '}'", peek());
        }
        body.push_back(parseStatement());
        skipSemicolons();
    }
    expect(TokenType::RBrace, "to close block");

    popScope();
    return body;
}

std::unique_ptr<Stmt> ScriptParser::parseStatement() {
    DepthGuard guard(*this, peek());
    const Token& start = peek();

    auto stmt = std::make_unique<Stmt>();
    stmt->line = start.line;

    switch (start.type) {
        case TokenType::Fn:
            fail("functions may only be declared at top level", start);

        case TokenType::Let: {
            advance();
            const Token& name = expect(TokenType::Identifier, "after 'let'");
            expect(TokenType::Assign, "in let declaration");
            stmt->kind = StmtKind::Let;
            stmt->name = name.text;
            // 초기값은 선언 전에 평가 (let x = x + 1 금지)
            stmt->expr = parseExpression();
            stmt->slot = declare(name.text, name);
            return stmt;
        }

        case TokenType::If:
            return parseIf();

        case TokenType::While: {
            advance();
            stmt->kind = StmtKind::While;
            stmt->expr = parseExpression();
            ++current_->loop_depth;
            stmt->body = parseBlock();
            --current_->loop_depth;
            return stmt;
        }

        case TokenType::For:
            return parseFor();

        case TokenType::Return: {
            advance();
            stmt->kind = StmtKind::Return;
            if (!check(TokenType::Semicolon) && !check(TokenType::RBrace) && !check(TokenType::End)) {
                stmt->expr = parseExpression();
            }
            return stmt;
        }

        case TokenType::Break:
        case TokenType::Continue: {
            advance();
            if (current_->loop_depth == 0) {
                fail(std::string(toString(start.type)) + " outside of a loop", start);
            }
            stmt->kind = start.type == TokenType::Break ? StmtKind::Break : StmtKind::Continue;
            return stmt;
        }

        case TokenType::LBrace:
            stmt->kind = StmtKind::Block;
            stmt->body = parseBlock();
            return stmt;

        default:
            break;
    }

    auto expr = parseExpression();
    if (check(TokenType::Assign)) {
        const Token& eq = advance();
        if (expr->kind != ExprKind::Variable && expr->kind != ExprKind::Index && expr->kind != ExprKind::Member) {
            fail("invalid assignment target", eq);
        }
        stmt->kind = StmtKind::Assign;
        stmt->target = std::move(expr);
        stmt->expr = parseExpression();
        return stmt;
    }

    stmt->kind = StmtKind::ExprStmt;
    stmt->expr = std::move(expr);
    return stmt;
}

std::unique_ptr<Stmt> ScriptParser::parseIf() {
    const Token& if_token = expect(TokenType::If, "");
    auto stmt = std::make_unique<Stmt>();
    stmt->kind = StmtKind::If;
    stmt->line = if_token.line;
    stmt->expr = parseExpression();
    stmt->body = parseBlock();

    if (match(TokenType::Else)) {
        if (check(TokenType::If)) {
            stmt->else_body.push_back(parseIf());
        } else {
            stmt->else_body = parseBlock();
        }
    }
    return stmt;
}

std::unique_ptr<Stmt> ScriptParser::parseFor() {
    const Token& for_token = expect(TokenType::For, "");
    const Token& name = expect(TokenType::Identifier, "after 'for'");
    expect(TokenType::In, "in for loop");

    auto stmt = std::make_unique<Stmt>();
    stmt->line = for_token.line;
    stmt->name = name.text;
    stmt->expr = parseExpression();
    if (match(TokenType::DotDot)) {
        stmt->kind = StmtKind::ForRange;
        stmt->range_end = parseExpression();
    } else {
        stmt->kind = StmtKind::ForEach;
    }

    // 루프 변수는 본문 스코프 바깥의 전용 스코프
    pushScope();
    stmt->slot = declare(name.text, name);
    ++current_->loop_depth;
    stmt->body = parseBlock();
    --current_->loop_depth;
    popScope();
    return stmt;
}

// ===== expressions =====

std::unique_ptr<Expr> ScriptParser::parseExpression() {
    DepthGuard guard(*this, peek());
    return parseOr();
}

std::unique_ptr<Expr> ScriptParser::parseOr() {
    auto left = parseAnd();
    while (check(TokenType::OrOr)) {
        const Token& op = advance();
        auto node = std::make_unique<Expr>();
        node->kind = ExprKind::Logical;
        node->op = Op::Or;
        node->line = op.line;
        node->children.push_back(std::move(left));
        node->children.push_back(parseAnd());
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<Expr> ScriptParser::parseAnd() {
    auto left = parseEquality();
    while (check(TokenType::AndAnd)) {
        const Token& op = advance();
        auto node = std::make_unique<Expr>();
        node->kind = ExprKind::Logical;
        node->op = Op::And;
        node->line = op.line;
        node->children.push_back(std::move(left));
        node->children.push_back(parseEquality());
        left = std::move(node);
    }
    return left;
}

namespace {
std::unique_ptr<Expr> makeBinary(Op op, int line, std::unique_ptr<Expr> left, std::unique_ptr<Expr> right) {
    auto node = std::make_unique<Expr>();
    node->kind = ExprKind::Binary;
    node->op = op;
    node->line = line;
    node->children.push_back(std::move(left));
    node->children.push_back(std::move(right));
    return node;
}
}

std::unique_ptr<Expr> ScriptParser::parseEquality() {
    auto left = parseComparison();
    while (check(TokenType::Eq) || check(TokenType::NotEq)) {
        const Token& op = advance();
        left = makeBinary(op.type == TokenType::Eq ? Op::Eq : Op::NotEq, op.line, std::move(left), parseComparison());
    }
    return left;
}

std::unique_ptr<Expr> ScriptParser::parseComparison() {
    auto left = parseAdditive();
    while (true) {
        Op op;
        switch (peek().type) {
            case TokenType::Less: op = Op::Less; break;
            case TokenType::LessEq: op = Op::LessEq; break;
            case TokenType::Greater: op = Op::Greater; break;
            case TokenType::GreaterEq: op = Op::GreaterEq; break;
            default: return left;
        }
        const Token& token = advance();
        left = makeBinary(op, token.line, std::move(left), parseAdditive());
    }
}

std::unique_ptr<Expr> ScriptParser::parseAdditive() {
    auto left = parseMultiplicative();
    while (check(TokenType::Plus) || check(TokenType::Minus)) {
        const Token& op = advance();
        left = makeBinary(op.type == TokenType::Plus ? Op::Add : Op::Sub, op.line, std::move(left), parseMultiplicative());
    }
    return left;
}

std::unique_ptr<Expr> ScriptParser::parseMultiplicative() {
    auto left = parseUnary();
    while (true) {
        Op op;
        switch (peek().type) {
            case TokenType::Star: op = Op::Mul; break;
            case TokenType::Slash: op = Op::Div; break;
            case TokenType::Percent: op = Op::Mod; break;
            default: return left;
        }
        const Token& token = advance();
        left = makeBinary(op, token.line, std::move(left), parseUnary());
    }
}

std::unique_ptr<Expr> ScriptParser::parseUnary() {
    if (check(TokenType::Minus) || check(TokenType::Bang)) {
        DepthGuard guard(*this, peek());
        const Token& op = advance();
        auto node = std::make_unique<Expr>();
        node->kind = ExprKind::Unary;
        node->op = op.type == TokenType::Minus ? Op::Neg : Op::Not;
        node->line = op.line;
        node->children.push_back(parseUnary());
        return node;
    }
    return parsePostfix();
}

std::unique_ptr<Expr> ScriptParser::parsePostfix() {
    auto expr = parsePrimary();
    while (true) {
        if (check(TokenType::LBracket)) {
            const Token& open = advance();
            auto node = std::make_unique<Expr>();
            node->kind = ExprKind::Index;
            node->line = open.line;
            node->children.push_back(std::move(expr));
            node->children.push_back(parseExpression());
            expect(TokenType::RBracket, "after index");
            expr = std::move(node);
        } else if (check(TokenType::Dot)) {
            const Token& dot = advance();
            const Token& member = expect(TokenType::Identifier, "after '.'");
            auto node = std::make_unique<Expr>();
            node->kind = ExprKind::Member;
            node->line = dot.line;
            node->name = member.text;
            node->children.push_back(std::move(expr));
            expr = std::move(node);
        } else {
            return expr;
        }
    }
}

std::unique_ptr<Expr> ScriptParser::parseCall(const Token& name) {
    auto node = std::make_unique<Expr>();
    node->kind = ExprKind::Call;
    node->line = name.line;
    node->name = name.text;

    expect(TokenType::LParen, "to open call");
    if (!check(TokenType::RParen)) {
        do {
            node->children.push_back(parseExpression());
        } while (match(TokenType::Comma));
    }
    expect(TokenType::RParen, "to close call");

    const int argc = static_cast<int>(node->children.size());
    auto fn = function_names_.find(name.text);
    if (fn != function_names_.end()) {
        node->function = fn->second;
        if (static_cast<size_t>(argc) != function_arity_[fn->second]) {
            fail("function '" + name.text + "' expects " + std::to_string(function_arity_[fn->second]) +
                 " argument(s), got " + std::to_string(argc), name);
        }
        return node;
    }

    node->builtin = ScriptBuiltins::find(name.text);
    if (node->builtin < 0) {
        fail("unknown function '" + name.text + "'", name);
    }
    const auto& def = ScriptBuiltins::all()[node->builtin];
    if (argc < def.min_args || argc > def.max_args) {
        fail("'" + name.text + "' expects " + std::to_string(def.min_args) +
             (def.max_args != def.min_args ? "-" + std::to_string(def.max_args) : std::string()) +
             " argument(s), got " + std::to_string(argc), name);
    }
    return node;
}

std::unique_ptr<Expr> ScriptParser::parsePrimary() {
    const Token& token = peek();
    auto node = std::make_unique<Expr>();
    node->line = token.line;

    switch (token.type) {
        case TokenType::Number:
            advance();
            node->kind = ExprKind::Number;
            node->number = token.number;
            return node;

        case TokenType::String:
            advance();
            node->kind = ExprKind::String;
            node->name = token.text;
            return node;

        case TokenType::True:
        case TokenType::False:
            advance();
            node->kind = ExprKind::Bool;
            node->boolean = token.type == TokenType::True;
            return node;

        case TokenType::Null:
            advance();
            node->kind = ExprKind::Null;
            return node;

        case TokenType::Identifier: {
            const Token& name = advance();
            if (check(TokenType::LParen)) {
                return parseCall(name);
            }
            const int slot = lookup(name.text);
            if (slot < 0) {
                if (ScriptBuiltins::find(name.text) >= 0 || function_names_.count(name.text) > 0) {
                    fail("'" + name.text + "' is a function and must be called", name);
                }
                fail("undeclared identifier '" + name.text + "'", name);
            }
            node->kind = ExprKind::Variable;
            node->name = name.text;
            node->slot = slot;
            return node;
        }

        case TokenType::LParen: {
            advance();
            auto inner = parseExpression();
            expect(TokenType::RParen, "to close parenthesis");
            return inner;
        }

        case TokenType::LBracket: {
            advance();
            node->kind = ExprKind::ArrayLiteral;
            while (!check(TokenType::RBracket)) {
                node->children.push_back(parseExpression());
                if (!match(TokenType::Comma)) {
                    break;
                }
            }
            expect(TokenType::RBracket, "to close array literal");
            return node;
        }

        case TokenType::LBrace: {
            advance();
            node->kind = ExprKind::ObjectLiteral;
            while (!check(TokenType::RBrace)) {
                const Token& key = peek();
                if (key.type != TokenType::Identifier && key.type != TokenType::String) {
                    fail("expected object key", key);
                }
                advance();
                expect(TokenType::Colon, "after object key");
                node->keys.push_back(key.text);
                node->children.push_back(parseExpression());
                if (!match(TokenType::Comma)) {
                    break;
                }
            }
            expect(TokenType::RBrace, "to close object literal");
            return node;
        }

        default:
            fail(std::string("unexpected ") + toString(token.type), token);
    }
}

} // namespace sandbox
} // namespace sigscan
