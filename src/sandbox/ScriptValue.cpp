#include "sandbox/ScriptValue.h"

#include <cmath>
#include <sstream>
#include <unordered_set>

namespace sigscan {
namespace sandbox {

const char* typeName(ScriptValue::Type type) {
    switch (type) {
        case ScriptValue::Type::Null: return "null";
        case ScriptValue::Type::Bool: return "bool";
        case ScriptValue::Type::Number: return "number";
        case ScriptValue::Type::String: return "string";
        case ScriptValue::Type::Array: return "array";
        case ScriptValue::Type::Object: return "object";
        case ScriptValue::Type::Candles: return "candles";
    }
    return "null";
}

ScriptValue::~ScriptValue() {
    if (type() == Type::Array || type() == Type::Object) {
        releaseChildren();
    }
}

// 마지막 참조일 때 하위 컨테이너를 꺼내 반복문으로 해제한다 (깊은 체인의 재귀 소멸 방지)
void ScriptValue::releaseChildren() {
    std::vector<ScriptValue> pending;
    auto detach = [&pending](ScriptValue& value) {
        if (value.type() == Type::Array) {
            auto& items = std::get<ArrayPtr>(value.data_);
            if (items && items.use_count() == 1) {
                for (auto& item : *items) {
                    if (item.identity()) pending.push_back(std::move(item));
                }
            }
        } else if (value.type() == Type::Object) {
            auto& fields = std::get<ObjectPtr>(value.data_);
            if (fields && fields.use_count() == 1) {
                for (auto& entry : *fields) {
                    if (entry.second.identity()) pending.push_back(std::move(entry.second));
                }
            }
        }
    };

    detach(*this);
    while (!pending.empty()) {
        ScriptValue next = std::move(pending.back());
        pending.pop_back();
        detach(next);
    }
}

ScriptValue ScriptValue::makeArray(ScriptArray items) {
    return ScriptValue(std::make_shared<ScriptArray>(std::move(items)));
}

ScriptValue ScriptValue::makeObject(ScriptObject fields) {
    return ScriptValue(std::make_shared<ScriptObject>(std::move(fields)));
}

ScriptValue ScriptValue::fromCandle(const Candle& candle) {
    ScriptObject fields;
    fields["open"] = candle.open;
    fields["high"] = candle.high;
    fields["low"] = candle.low;
    fields["close"] = candle.close;
    fields["volume"] = candle.volume;
    fields["time"] = static_cast<double>(candle.open_time);
    fields["closeTime"] = static_cast<double>(candle.close_time);
    fields["closed"] = candle.closed;
    return makeObject(std::move(fields));
}

bool ScriptValue::asBool() const {
    if (type() != Type::Bool) {
        throw ScriptRuntimeError(std::string("expected bool, got ") + typeName());
    }
    return std::get<bool>(data_);
}

double ScriptValue::asNumber() const {
    if (type() != Type::Number) {
        throw ScriptRuntimeError(std::string("expected number, got ") + typeName());
    }
    return std::get<double>(data_);
}

const std::string& ScriptValue::asString() const {
    if (type() != Type::String) {
        throw ScriptRuntimeError(std::string("expected string, got ") + typeName());
    }
    return std::get<std::string>(data_);
}

ScriptArray& ScriptValue::asArray() const {
    if (type() != Type::Array) {
        throw ScriptRuntimeError(std::string("expected array, got ") + typeName());
    }
    return *std::get<ArrayPtr>(data_);
}

ScriptObject& ScriptValue::asObject() const {
    if (type() != Type::Object) {
        throw ScriptRuntimeError(std::string("expected object, got ") + typeName());
    }
    return *std::get<ObjectPtr>(data_);
}

const std::vector<Candle>& ScriptValue::asCandles() const {
    return *candleView();
}

const market::CandleView& ScriptValue::candleView() const {
    if (type() != Type::Candles) {
        throw ScriptRuntimeError(std::string("expected candles, got ") + typeName());
    }
    const auto& view = std::get<market::CandleView>(data_);
    if (!view) {
        throw ScriptRuntimeError("candle list is empty");
    }
    return view;
}

const void* ScriptValue::identity() const {
    if (type() == Type::Array) {
        return std::get<ArrayPtr>(data_).get();
    }
    if (type() == Type::Object) {
        return std::get<ObjectPtr>(data_).get();
    }
    return nullptr;
}

size_t ScriptValue::checkStorableIn(const void* container) const {
    if (!identity()) {
        return 0;
    }

    struct Pending {
        const ScriptValue* value;
        int depth;
    };
    std::vector<Pending> stack{{this, 1}};
    std::unordered_set<const void*> visited;
    size_t walked = 0;

    while (!stack.empty()) {
        const Pending top = stack.back();
        stack.pop_back();

        const void* id = top.value->identity();
        if (container && id == container) {
            throw ScriptRuntimeError("cannot store a container inside itself");
        }
        if (top.depth >= kMaxNesting) {
            throw ScriptRuntimeError("value nested too deeply");
        }
        if (!visited.insert(id).second) {
            continue;
        }

        if (top.value->isArray()) {
            for (const auto& item : top.value->asArray()) {
                ++walked;
                if (item.identity()) stack.push_back({&item, top.depth + 1});
            }
        } else {
            for (const auto& entry : top.value->asObject()) {
                ++walked;
                if (entry.second.identity()) stack.push_back({&entry.second, top.depth + 1});
            }
        }
    }
    return walked;
}

bool ScriptValue::truthy() const {
    switch (type()) {
        case Type::Null: return false;
        case Type::Bool: return std::get<bool>(data_);
        case Type::Number: {
            const double d = std::get<double>(data_);
            return d != 0.0 && !std::isnan(d);
        }
        case Type::String: return !std::get<std::string>(data_).empty();
        case Type::Array: return !std::get<ArrayPtr>(data_)->empty();
        case Type::Object: return true;
        case Type::Candles: {
            const auto& view = std::get<market::CandleView>(data_);
            return view && !view->empty();
        }
    }
    return false;
}

bool ScriptValue::equals(const ScriptValue& other) const {
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
        case Type::Null: return true;
        case Type::Bool: return std::get<bool>(data_) == std::get<bool>(other.data_);
        case Type::Number: return std::get<double>(data_) == std::get<double>(other.data_);
        case Type::String: return std::get<std::string>(data_) == std::get<std::string>(other.data_);
        case Type::Array: return std::get<ArrayPtr>(data_) == std::get<ArrayPtr>(other.data_);
        case Type::Object: return std::get<ObjectPtr>(data_) == std::get<ObjectPtr>(other.data_);
        case Type::Candles: return std::get<market::CandleView>(data_) == std::get<market::CandleView>(other.data_);
    }
    return false;
}

std::string ScriptValue::typeName() const {
    return sandbox::typeName(type());
}

std::string ScriptValue::toDisplayString() const {
    switch (type()) {
        case Type::Null: return "null";
        case Type::Bool: return std::get<bool>(data_) ? "true" : "false";
        case Type::Number: {
            std::ostringstream oss;
            oss << std::get<double>(data_);
            return oss.str();
        }
        case Type::String: return std::get<std::string>(data_);
        case Type::Candles: return "<candles:" + std::to_string(asCandles().size()) + ">";
        default: return toJson().dump();
    }
}

nlohmann::json ScriptValue::toJson() const {
    size_t budget = kMaxSerializedNodes;
    return toJsonBounded(0, budget);
}

nlohmann::json ScriptValue::toJsonBounded(int depth, size_t& budget) const {
    if (budget == 0) {
        throw ScriptRuntimeError("value too large to serialize");
    }
    --budget;
    if (depth > kMaxNesting) {
        throw ScriptRuntimeError("value nested too deeply");
    }

    switch (type()) {
        case Type::Null: return nullptr;
        case Type::Bool: return std::get<bool>(data_);
        case Type::Number: {
            const double d = std::get<double>(data_);
            if (std::isnan(d) || std::isinf(d)) {
                return nullptr;
            }
            return d;
        }
        case Type::String: return std::get<std::string>(data_);
        case Type::Array: {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& item : *std::get<ArrayPtr>(data_)) {
                out.push_back(item.toJsonBounded(depth + 1, budget));
            }
            return out;
        }
        case Type::Object: {
            nlohmann::json out = nlohmann::json::object();
            for (const auto& [key, value] : *std::get<ObjectPtr>(data_)) {
                out[key] = value.toJsonBounded(depth + 1, budget);
            }
            return out;
        }
        case Type::Candles: {
            nlohmann::json out = nlohmann::json::array();
            const auto& view = std::get<market::CandleView>(data_);
            if (view) {
                if (view->size() > budget) {
                    throw ScriptRuntimeError("value too large to serialize");
                }
                budget -= view->size();
                for (const auto& c : *view) {
                    out.push_back({{"open", c.open}, {"high", c.high}, {"low", c.low}, {"close", c.close},
                                   {"volume", c.volume}, {"time", c.open_time}, {"closeTime", c.close_time}});
                }
            }
            return out;
        }
    }
    return nullptr;
}

} // namespace sandbox
} // namespace sigscan
