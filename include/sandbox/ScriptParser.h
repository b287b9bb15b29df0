#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "sandbox/ScriptAst.h"
#include "sandbox/ScriptLexer.h"

namespace sigscan {
namespace sandbox {

// Parses and resolves strategy source. Every identifier is bound to a
// local slot, a user function or a builtin; anything else is a compile error.
class ScriptParser {
public:
    ScriptParser(std::vector<Token> tokens, int max_depth = 200);

    std::shared_ptr<CompiledScript> parseProgram();

    // lex + parse; throws ScriptError
    static std::shared_ptr<const CompiledScript> compile(const std::string& source, int max_depth = 200);

private:
    struct FunctionScope {
        std::vector<std::map<std::string, int>> scopes;
        int next_slot = 0;
        int max_slot = 0;
        int loop_depth = 0;
    };

    const Token& peek(size_t ahead = 0) const;
    const Token& advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    const Token& expect(TokenType type, const char* context);
    [[noreturn]] void fail(const std::string& message, const Token& at) const;

    void collectFunctionNames();
    void parseFunction(CompiledScript& script);

    std::unique_ptr<Stmt> parseStatement();
    std::vector<std::unique_ptr<Stmt>> parseBlock();
    std::unique_ptr<Stmt> parseIf();
    std::unique_ptr<Stmt> parseFor();
    void skipSemicolons();

    std::unique_ptr<Expr> parseExpression();
    std::unique_ptr<Expr> parseOr();
    std::unique_ptr<Expr> parseAnd();
    std::unique_ptr<Expr> parseEquality();
    std::unique_ptr<Expr> parseComparison();
    std::unique_ptr<Expr> parseAdditive();
    std::unique_ptr<Expr> parseMultiplicative();
    std::unique_ptr<Expr> parseUnary();
    std::unique_ptr<Expr> parsePostfix();
    std::unique_ptr<Expr> parsePrimary();
    std::unique_ptr<Expr> parseCall(const Token& name);

    void pushScope();
    void popScope();
    int declare(const std::string& name, const Token& at);
    int lookup(const std::string& name) const;

    struct DepthGuard {
        ScriptParser& parser;
        explicit DepthGuard(ScriptParser& p, const Token& at);
        ~DepthGuard() { --parser.depth_; }
    };

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int max_depth_;
    int depth_ = 0;
    std::map<std::string, int> function_names_;
    std::vector<size_t> function_arity_;
    FunctionScope* current_ = nullptr;
};

} // namespace sandbox
} // namespace sigscan
