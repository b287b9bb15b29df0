#pragma once

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "market/MarketSnapshot.h"

namespace sigscan {
namespace sandbox {

// Source failed to lex, parse or resolve.
class ScriptError : public std::runtime_error {
public:
    ScriptError(const std::string& message, int line, int column)
        : std::runtime_error(formatMessage(message, line, column))
        , line_(line)
        , column_(column) {}

    int line() const { return line_; }
    int column() const { return column_; }

private:
    static std::string formatMessage(const std::string& message, int line, int column) {
        return message + " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")";
    }

    int line_;
    int column_;
};

// Raised while a compiled script is executing.
class ScriptRuntimeError : public std::runtime_error {
public:
    explicit ScriptRuntimeError(const std::string& message, int line = 0)
        : std::runtime_error(line > 0 ? message + " (line " + std::to_string(line) + ")" : message)
        , line_(line) {}

    int line() const { return line_; }

private:
    int line_;
};

// Deadline passed or the run was cancelled.
class ScriptTimeout : public std::runtime_error {
public:
    ScriptTimeout() : std::runtime_error("script execution timed out") {}
};

class ScriptValue;
using ScriptArray = std::vector<ScriptValue>;
using ScriptObject = std::map<std::string, ScriptValue>;
using ArrayPtr = std::shared_ptr<ScriptArray>;
using ObjectPtr = std::shared_ptr<ScriptObject>;

class ScriptValue {
public:
    enum class Type { Null, Bool, Number, String, Array, Object, Candles };

    // Containers nest at most this deep, and serialization emits at most
    // kMaxSerializedNodes values.
    static constexpr int kMaxNesting = 64;
    static constexpr size_t kMaxSerializedNodes = 1000000;

    ScriptValue() = default;
    ScriptValue(const ScriptValue&) = default;
    ScriptValue(ScriptValue&&) = default;
    ScriptValue& operator=(const ScriptValue&) = default;
    ScriptValue& operator=(ScriptValue&&) = default;
    ~ScriptValue();

    ScriptValue(bool b) : data_(b) {}
    ScriptValue(double d) : data_(d) {}
    ScriptValue(int i) : data_(static_cast<double>(i)) {}
    ScriptValue(std::string s) : data_(std::move(s)) {}
    ScriptValue(const char* s) : data_(std::string(s)) {}
    ScriptValue(ArrayPtr a) : data_(std::move(a)) {}
    ScriptValue(ObjectPtr o) : data_(std::move(o)) {}
    ScriptValue(market::CandleView c) : data_(std::move(c)) {}

    static ScriptValue makeArray(ScriptArray items = {});
    static ScriptValue makeObject(ScriptObject fields = {});
    static ScriptValue fromCandle(const Candle& candle);

    Type type() const { return static_cast<Type>(data_.index()); }
    bool isNull() const { return type() == Type::Null; }
    bool isNumber() const { return type() == Type::Number; }
    bool isString() const { return type() == Type::String; }
    bool isArray() const { return type() == Type::Array; }
    bool isObject() const { return type() == Type::Object; }
    bool isCandles() const { return type() == Type::Candles; }

    // Typed accessors throw ScriptRuntimeError on mismatch.
    bool asBool() const;
    double asNumber() const;
    const std::string& asString() const;
    ScriptArray& asArray() const;
    ScriptObject& asObject() const;
    const std::vector<Candle>& asCandles() const;
    const market::CandleView& candleView() const;

    // Array/object storage address, nullptr for every other type.
    const void* identity() const;

    // Throws ScriptRuntimeError when storing this value inside `container`
    // would make a cycle or nest deeper than kMaxNesting.
    // Returns the number of elements walked.
    size_t checkStorableIn(const void* container) const;

    bool truthy() const;
    bool equals(const ScriptValue& other) const;
    std::string typeName() const;
    std::string toDisplayString() const;
    nlohmann::json toJson() const;

private:
    nlohmann::json toJsonBounded(int depth, size_t& budget) const;
    void releaseChildren();

    std::variant<std::monostate, bool, double, std::string, ArrayPtr, ObjectPtr, market::CandleView> data_;
};

const char* typeName(ScriptValue::Type type);

} // namespace sandbox
} // namespace sigscan
