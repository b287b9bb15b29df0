#include "sandbox/ScriptInterpreter.h"

#include <cmath>

namespace sigscan {
namespace sandbox {

namespace {
long long toIndex(const ScriptValue& key, int line) {
    const double d = key.asNumber();
    if (std::floor(d) != d || std::isnan(d)) {
        throw ScriptRuntimeError("index must be an integer", line);
    }
    return static_cast<long long>(d);
}

// 음수 인덱스는 끝에서부터 (-1 = 마지막)
bool resolveIndex(long long idx, size_t size, size_t& out) {
    if (idx < 0) {
        idx += static_cast<long long>(size);
    }
    if (idx < 0 || idx >= static_cast<long long>(size)) {
        return false;
    }
    out = static_cast<size_t>(idx);
    return true;
}
}

ScriptInterpreter::ScriptInterpreter(const CompiledScript& script, ExecContext& ctx)
    : script_(script)
    , ctx_(ctx) {}

ScriptValue ScriptInterpreter::run() {
    Frame frame;
    frame.slots.resize(script_.slot_count);
    execBlock(script_.body, frame);
    return frame.return_value;
}

ScriptInterpreter::Flow ScriptInterpreter::execBlock(const std::vector<std::unique_ptr<Stmt>>& body, Frame& frame) {
    for (const auto& stmt : body) {
        const Flow flow = exec(*stmt, frame);
        if (flow != Flow::Normal) {
            return flow;
        }
    }
    return Flow::Normal;
}

ScriptInterpreter::Flow ScriptInterpreter::exec(const Stmt& stmt, Frame& frame) {
    ctx_.tick(stmt.line);

    switch (stmt.kind) {
        case StmtKind::Let:
            frame.slots[stmt.slot] = eval(*stmt.expr, frame);
            return Flow::Normal;

        case StmtKind::Assign:
            assign(*stmt.target, eval(*stmt.expr, frame), frame);
            return Flow::Normal;

        case StmtKind::ExprStmt:
            eval(*stmt.expr, frame);
            return Flow::Normal;

        case StmtKind::If:
            if (eval(*stmt.expr, frame).truthy()) {
                return execBlock(stmt.body, frame);
            }
            return execBlock(stmt.else_body, frame);

        case StmtKind::While:
            while (eval(*stmt.expr, frame).truthy()) {
                ctx_.tick(stmt.line);
                const Flow flow = execBlock(stmt.body, frame);
                if (flow == Flow::Break) break;
                if (flow == Flow::Return) return flow;
            }
            return Flow::Normal;

        case StmtKind::ForRange: {
            const ScriptValue from = eval(*stmt.expr, frame);
            const ScriptValue to = eval(*stmt.range_end, frame);
            const long long begin = toIndex(from, stmt.line);
            const long long end = toIndex(to, stmt.line);
            for (long long i = begin; i < end; ++i) {
                ctx_.tick(stmt.line);
                frame.slots[stmt.slot] = static_cast<double>(i);
                const Flow flow = execBlock(stmt.body, frame);
                if (flow == Flow::Break) break;
                if (flow == Flow::Return) return flow;
            }
            return Flow::Normal;
        }

        case StmtKind::ForEach: {
            const ScriptValue source = eval(*stmt.expr, frame);
            std::vector<ScriptValue> items;
            if (source.isArray()) {
                items = source.asArray();
            } else if (source.isCandles()) {
                for (const auto& c : source.asCandles()) {
                    items.push_back(ScriptValue::fromCandle(c));
                }
            } else if (source.isObject()) {
                for (const auto& entry : source.asObject()) {
                    items.emplace_back(entry.first);
                }
            } else if (!source.isNull()) {
                throw ScriptRuntimeError("cannot iterate over " + source.typeName(), stmt.line);
            }

            for (auto& item : items) {
                ctx_.tick(stmt.line);
                frame.slots[stmt.slot] = std::move(item);
                const Flow flow = execBlock(stmt.body, frame);
                if (flow == Flow::Break) break;
                if (flow == Flow::Return) return flow;
            }
            return Flow::Normal;
        }

        case StmtKind::Return:
            frame.return_value = stmt.expr ? eval(*stmt.expr, frame) : ScriptValue();
            return Flow::Return;

        case StmtKind::Break:
            return Flow::Break;

        case StmtKind::Continue:
            return Flow::Continue;

        case StmtKind::Block:
            return execBlock(stmt.body, frame);
    }
    return Flow::Normal;
}

void ScriptInterpreter::assign(const Expr& target, ScriptValue value, Frame& frame) {
    if (target.kind == ExprKind::Variable) {
        frame.slots[target.slot] = std::move(value);
        return;
    }

    const ScriptValue container = eval(*target.children[0], frame);
    storeCheck(value, container.identity(), target.line);

    if (target.kind == ExprKind::Member) {
        if (!container.isObject()) {
            throw ScriptRuntimeError("cannot set field '" + target.name + "' on " + container.typeName(), target.line);
        }
        container.asObject()[target.name] = std::move(value);
        return;
    }

    const ScriptValue key = eval(*target.children[1], frame);
    if (container.isArray()) {
        auto& items = container.asArray();
        size_t at = 0;
        if (!resolveIndex(toIndex(key, target.line), items.size(), at)) {
            throw ScriptRuntimeError("array index out of range", target.line);
        }
        items[at] = std::move(value);
        return;
    }
    if (container.isObject()) {
        if (!key.isString()) {
            throw ScriptRuntimeError("object key must be a string", target.line);
        }
        container.asObject()[key.asString()] = std::move(value);
        return;
    }
    throw ScriptRuntimeError("cannot assign into " + container.typeName(), target.line);
}

ScriptValue ScriptInterpreter::eval(const Expr& expr, Frame& frame) {
    switch (expr.kind) {
        case ExprKind::Number: return expr.number;
        case ExprKind::String: return expr.name;
        case ExprKind::Bool: return expr.boolean;
        case ExprKind::Null: return ScriptValue();
        case ExprKind::Variable: return frame.slots[expr.slot];

        case ExprKind::ArrayLiteral: {
            ScriptArray items;
            items.reserve(expr.children.size());
            for (const auto& child : expr.children) {
                items.push_back(eval(*child, frame));
                storeCheck(items.back(), nullptr, expr.line);
            }
            return ScriptValue::makeArray(std::move(items));
        }

        case ExprKind::ObjectLiteral: {
            ScriptObject fields;
            for (size_t i = 0; i < expr.children.size(); ++i) {
                ScriptValue field = eval(*expr.children[i], frame);
                storeCheck(field, nullptr, expr.line);
                fields[expr.keys[i]] = std::move(field);
            }
            return ScriptValue::makeObject(std::move(fields));
        }

        case ExprKind::Unary: {
            const ScriptValue operand = eval(*expr.children[0], frame);
            if (expr.op == Op::Not) {
                return !operand.truthy();
            }
            if (operand.isNull()) {
                return ScriptValue();
            }
            if (!operand.isNumber()) {
                throw ScriptRuntimeError("cannot negate " + operand.typeName(), expr.line);
            }
            return -operand.asNumber();
        }

        case ExprKind::Logical: {
            const bool left = eval(*expr.children[0], frame).truthy();
            if (expr.op == Op::And) {
                return left && eval(*expr.children[1], frame).truthy();
            }
            return left || eval(*expr.children[1], frame).truthy();
        }

        case ExprKind::Binary: {
            const ScriptValue left = eval(*expr.children[0], frame);
            const ScriptValue right = eval(*expr.children[1], frame);
            return binary(expr.op, left, right, expr.line);
        }

        case ExprKind::Call:
            return evalCall(expr, frame);

        case ExprKind::Index:
            return index(eval(*expr.children[0], frame), eval(*expr.children[1], frame), expr.line);

        case ExprKind::Member:
            return member(eval(*expr.children[0], frame), expr.name, expr.line);
    }
    return ScriptValue();
}

ScriptValue ScriptInterpreter::evalCall(const Expr& expr, Frame& frame) {
    std::vector<ScriptValue> args;
    args.reserve(expr.children.size());
    for (const auto& child : expr.children) {
        args.push_back(eval(*child, frame));
    }

    if (expr.function >= 0) {
        const FunctionDef& fn = script_.functions[expr.function];
        if (++ctx_.call_depth > ctx_.max_call_depth) {
            --ctx_.call_depth;
            throw ScriptRuntimeError("call depth exceeded in '" + fn.name + "'", expr.line);
        }

        Frame callee;
        callee.slots.resize(fn.slot_count);
        for (size_t i = 0; i < fn.param_count; ++i) {
            callee.slots[i] = std::move(args[i]);
        }

        try {
            execBlock(fn.body, callee);
        } catch (...) {
            --ctx_.call_depth;
            throw;
        }
        --ctx_.call_depth;
        return callee.return_value;
    }

    const BuiltinDef& def = ScriptBuiltins::all()[expr.builtin];
    try {
        return def.fn(ctx_, args);
    } catch (const ScriptRuntimeError& e) {
        if (e.line() > 0) {
            throw;
        }
        throw ScriptRuntimeError(def.name + ": " + e.what(), expr.line);
    }
}

// 컨테이너에 넣기 전 순환/깊이 검사, 훑은 원소 수만큼 step 소모
void ScriptInterpreter::storeCheck(const ScriptValue& value, const void* container, int line) {
    size_t walked = 0;
    try {
        walked = value.checkStorableIn(container);
    } catch (const ScriptRuntimeError& e) {
        throw ScriptRuntimeError(e.what(), line);
    }
    ctx_.charge(static_cast<long long>(walked));
}

ScriptValue ScriptInterpreter::binary(Op op, const ScriptValue& left, const ScriptValue& right, int line) const {
    switch (op) {
        case Op::Eq: return left.equals(right);
        case Op::NotEq: return !left.equals(right);

        case Op::Less:
        case Op::LessEq:
        case Op::Greater:
        case Op::GreaterEq: {
            // null과의 비교는 항상 false
            if (left.isNull() || right.isNull()) {
                return false;
            }
            int cmp = 0;
            if (left.isNumber() && right.isNumber()) {
                const double l = left.asNumber();
                const double r = right.asNumber();
                if (std::isnan(l) || std::isnan(r)) return false;
                cmp = l < r ? -1 : (l > r ? 1 : 0);
            } else if (left.isString() && right.isString()) {
                cmp = left.asString().compare(right.asString());
            } else {
                throw ScriptRuntimeError("cannot compare " + left.typeName() + " with " + right.typeName(), line);
            }
            switch (op) {
                case Op::Less: return cmp < 0;
                case Op::LessEq: return cmp <= 0;
                case Op::Greater: return cmp > 0;
                default: return cmp >= 0;
            }
        }

        default:
            break;
    }

    if (op == Op::Add && (left.isString() || right.isString())) {
        std::string joined = left.toDisplayString();
        const std::string tail = right.toDisplayString();
        if (joined.size() + tail.size() > kMaxStringLength) {
            throw ScriptRuntimeError("string too large", line);
        }
        joined += tail;
        ctx_.charge(static_cast<long long>(joined.size() / 64));
        return joined;
    }

    if (left.isNull() || right.isNull()) {
        return ScriptValue();
    }
    if (!left.isNumber() || !right.isNumber()) {
        throw ScriptRuntimeError("arithmetic on " + left.typeName() + " and " + right.typeName(), line);
    }

    const double l = left.asNumber();
    const double r = right.asNumber();
    switch (op) {
        case Op::Add: return l + r;
        case Op::Sub: return l - r;
        case Op::Mul: return l * r;
        case Op::Div:
            if (r == 0.0) throw ScriptRuntimeError("division by zero", line);
            return l / r;
        case Op::Mod:
            if (r == 0.0) throw ScriptRuntimeError("modulo by zero", line);
            return std::fmod(l, r);
        default:
            throw ScriptRuntimeError("invalid binary operator", line);
    }
}

ScriptValue ScriptInterpreter::index(const ScriptValue& target, const ScriptValue& key, int line) const {
    if (target.isNull()) {
        return ScriptValue();
    }

    size_t at = 0;
    switch (target.type()) {
        case ScriptValue::Type::Array: {
            const auto& items = target.asArray();
            if (!resolveIndex(toIndex(key, line), items.size(), at)) return ScriptValue();
            return items[at];
        }
        case ScriptValue::Type::Candles: {
            const auto& candles = target.asCandles();
            if (!resolveIndex(toIndex(key, line), candles.size(), at)) return ScriptValue();
            return ScriptValue::fromCandle(candles[at]);
        }
        case ScriptValue::Type::String: {
            const auto& text = target.asString();
            if (!resolveIndex(toIndex(key, line), text.size(), at)) return ScriptValue();
            return std::string(1, text[at]);
        }
        case ScriptValue::Type::Object: {
            if (!key.isString()) {
                throw ScriptRuntimeError("object key must be a string", line);
            }
            const auto& fields = target.asObject();
            auto it = fields.find(key.asString());
            return it == fields.end() ? ScriptValue() : it->second;
        }
        default:
            throw ScriptRuntimeError("cannot index " + target.typeName(), line);
    }
}

ScriptValue ScriptInterpreter::member(const ScriptValue& target, const std::string& name, int line) const {
    if (target.isNull()) {
        return ScriptValue();
    }
    if (name == "length") {
        if (target.isArray()) return static_cast<double>(target.asArray().size());
        if (target.isCandles()) return static_cast<double>(target.asCandles().size());
        if (target.isString()) return static_cast<double>(target.asString().size());
    }
    if (target.isObject()) {
        const auto& fields = target.asObject();
        auto it = fields.find(name);
        return it == fields.end() ? ScriptValue() : it->second;
    }
    throw ScriptRuntimeError("no field '" + name + "' on " + target.typeName(), line);
}

} // namespace sandbox
} // namespace sigscan
