#pragma once

#include <vector>

#include "sandbox/ScriptAst.h"
#include "sandbox/ScriptBuiltins.h"
#include "sandbox/ScriptValue.h"

namespace sigscan {
namespace sandbox {

// Tree-walking evaluator for a CompiledScript. One instance per run;
// the compiled script itself is shared read-only.
class ScriptInterpreter {
public:
    ScriptInterpreter(const CompiledScript& script, ExecContext& ctx);

    // Returns the value of the top-level 'return', or null.
    // Throws ScriptRuntimeError / ScriptTimeout.
    ScriptValue run();

private:
    enum class Flow { Normal, Break, Continue, Return };

    struct Frame {
        std::vector<ScriptValue> slots;
        ScriptValue return_value;
    };

    Flow execBlock(const std::vector<std::unique_ptr<Stmt>>& body, Frame& frame);
    Flow exec(const Stmt& stmt, Frame& frame);
    void assign(const Expr& target, ScriptValue value, Frame& frame);

    ScriptValue eval(const Expr& expr, Frame& frame);
    ScriptValue evalCall(const Expr& expr, Frame& frame);
    void storeCheck(const ScriptValue& value, const void* container, int line);
    ScriptValue binary(Op op, const ScriptValue& left, const ScriptValue& right, int line) const;
    ScriptValue index(const ScriptValue& target, const ScriptValue& key, int line) const;
    ScriptValue member(const ScriptValue& target, const std::string& name, int line) const;

    const CompiledScript& script_;
    ExecContext& ctx_;
};

} // namespace sandbox
} // namespace sigscan
