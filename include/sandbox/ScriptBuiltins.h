#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "market/MarketSnapshot.h"
#include "sandbox/ScriptValue.h"

namespace sigscan {
namespace sandbox {

constexpr size_t kMaxArrayLength = 100000;
constexpr size_t kMaxStringLength = 1 << 20;

// Everything a running script may observe or produce.
struct ExecContext {
    const market::MarketSnapshot* snapshot = nullptr;
    std::string primary_interval;

    std::string reasoning;
    nlohmann::json indicators = nlohmann::json::object();

    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    const std::atomic<bool>* cancel = nullptr;
    long long max_steps = 5000000;
    long long steps = 0;
    int max_call_depth = 64;
    int call_depth = 0;

    // Throws ScriptTimeout / ScriptRuntimeError. Called on every statement and loop iteration.
    void tick(int line) {
        ++steps;
        if (steps > max_steps) {
            throw ScriptRuntimeError("step limit exceeded", line);
        }
        if ((steps & 0xFF) == 0) {
            checkDeadline();
        }
    }

    // Builtins and string operations pay for the elements they touch.
    // The deadline is checked on every charge.
    void charge(long long units) {
        steps += units;
        if (steps > max_steps) {
            throw ScriptRuntimeError("step limit exceeded");
        }
        checkDeadline();
    }

    void checkDeadline() const {
        if (cancel && cancel->load(std::memory_order_relaxed)) {
            throw ScriptTimeout();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw ScriptTimeout();
        }
    }
};

using BuiltinFn = std::function<ScriptValue(ExecContext&, const std::vector<ScriptValue>&)>;

struct BuiltinDef {
    std::string name;
    int min_args;
    int max_args;
    BuiltinFn fn;
};

// The complete capability surface exposed to strategy code:
// market data accessors, indicators, math and collection helpers.
class ScriptBuiltins {
public:
    static const std::vector<BuiltinDef>& all();
    static int find(const std::string& name);
};

} // namespace sandbox
} // namespace sigscan
