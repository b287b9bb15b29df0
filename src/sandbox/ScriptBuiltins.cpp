#include "sandbox/ScriptBuiltins.h"

#include <algorithm>
#include <cmath>

#include "analytics/TechnicalIndicators.h"

namespace sigscan {
namespace sandbox {

using analytics::TechnicalIndicators;
using Args = std::vector<ScriptValue>;

namespace {

ScriptValue optionalNumber(const std::optional<double>& value) {
    return value ? ScriptValue(*value) : ScriptValue();
}

ScriptValue numberArray(const std::vector<double>& values) {
    ScriptArray items;
    items.reserve(values.size());
    for (double v : values) {
        items.emplace_back(v);
    }
    return ScriptValue::makeArray(std::move(items));
}

ScriptValue channelObject(const std::optional<TechnicalIndicators::Channel>& r) {
    if (!r) return ScriptValue();
    ScriptObject fields;
    fields["upper"] = r->upper;
    fields["middle"] = r->middle;
    fields["lower"] = r->lower;
    return ScriptValue::makeObject(std::move(fields));
}

ScriptValue channelSeriesObject(const TechnicalIndicators::ChannelSeries& s) {
    ScriptObject fields;
    fields["upper"] = numberArray(s.upper);
    fields["middle"] = numberArray(s.middle);
    fields["lower"] = numberArray(s.lower);
    return ScriptValue::makeObject(std::move(fields));
}

double numberArg(const Args& args, size_t i, const char* what) {
    if (i >= args.size() || !args[i].isNumber()) {
        throw ScriptRuntimeError(std::string(what) + " must be a number");
    }
    return args[i].asNumber();
}

int periodArg(const Args& args, size_t i, int fallback) {
    if (i >= args.size() || args[i].isNull()) {
        return fallback;
    }
    const double d = numberArg(args, i, "period");
    if (d < 1.0 || d > 10000.0) {
        throw ScriptRuntimeError("period out of range");
    }
    return static_cast<int>(d);
}

const market::CandleView& emptyView() {
    static const market::CandleView kEmpty = std::make_shared<const std::vector<Candle>>();
    return kEmpty;
}

market::CandleView klinesFor(const ExecContext& ctx, const std::string& interval) {
    if (!ctx.snapshot) {
        return emptyView();
    }
    auto it = ctx.snapshot->klines.find(interval);
    if (it == ctx.snapshot->klines.end() || !it->second) {
        return emptyView();
    }
    return it->second;
}

// 캔들 인자: 생략 시 기본 인터벌, 문자열이면 해당 인터벌, 또는 klines() 결과
market::CandleView resolveCandles(const ExecContext& ctx, const Args& args, size_t i) {
    if (i >= args.size() || args[i].isNull()) {
        return klinesFor(ctx, ctx.primary_interval);
    }
    if (args[i].isString()) {
        return klinesFor(ctx, args[i].asString());
    }
    if (args[i].isCandles()) {
        return args[i].candleView();
    }
    throw ScriptRuntimeError("expected candles, got " + args[i].typeName());
}

// 지표 계산용 캔들. 읽는 캔들 수만큼 step을 소모한다
market::CandleView candlesArg(ExecContext& ctx, const Args& args, size_t i) {
    market::CandleView view = resolveCandles(ctx, args, i);
    ctx.charge(static_cast<long long>(view->size()) + 1);
    return view;
}

// 윈도우마다 period개를 다시 훑는 지표의 추가 비용
void chargeWindow(ExecContext& ctx, size_t n, int period) {
    ctx.charge(static_cast<long long>(n) * period);
}

// 가격 인자: 캔들이면 종가, 배열이면 숫자 배열
std::vector<double> pricesArg(ExecContext& ctx, const Args& args, size_t i) {
    if (i < args.size() && args[i].isArray()) {
        ctx.charge(static_cast<long long>(args[i].asArray().size()) + 1);
        std::vector<double> prices;
        prices.reserve(args[i].asArray().size());
        for (const auto& item : args[i].asArray()) {
            if (!item.isNumber()) {
                throw ScriptRuntimeError("expected array of numbers");
            }
            prices.push_back(item.asNumber());
        }
        return prices;
    }
    return TechnicalIndicators::extractClosePrices(*candlesArg(ctx, args, i));
}

template <typename Field>
ScriptValue candleField(ExecContext& ctx, const Args& args, Field field) {
    const auto view = candlesArg(ctx, args, 0);
    ScriptArray items;
    items.reserve(view->size());
    for (const auto& c : *view) {
        items.emplace_back(field(c));
    }
    return ScriptValue::makeArray(std::move(items));
}

ScriptValue minMax(ExecContext& ctx, const Args& args, bool want_max) {
    std::vector<double> values;
    if (args.size() == 1 && args[0].isArray()) {
        ctx.charge(static_cast<long long>(args[0].asArray().size()));
        for (const auto& item : args[0].asArray()) {
            if (item.isNumber()) values.push_back(item.asNumber());
        }
    } else {
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i].isNull()) return ScriptValue();
            values.push_back(numberArg(args, i, "argument"));
        }
    }
    if (values.empty()) {
        return ScriptValue();
    }
    return want_max ? *std::max_element(values.begin(), values.end())
                    : *std::min_element(values.begin(), values.end());
}

template <typename Fn>
ScriptValue unaryMath(const Args& args, Fn fn) {
    if (args[0].isNull()) {
        return ScriptValue();
    }
    return fn(numberArg(args, 0, "argument"));
}

// series의 warm-up 0을 잘라내고 캔들과 꼬리 기준으로 정렬
ScriptValue points(ExecContext& ctx, const Args& args) {
    if (!args[0].isCandles()) {
        throw ScriptRuntimeError("first argument must be candles");
    }
    const auto& candles = args[0].asCandles();
    ctx.charge(static_cast<long long>(candles.size()) + 1);

    std::vector<std::vector<double>> lines;
    for (size_t i = 1; i < args.size(); ++i) {
        std::vector<double> line;
        if (!args[i].isArray()) {
            throw ScriptRuntimeError("series must be an array");
        }
        ctx.charge(static_cast<long long>(args[i].asArray().size()));
        for (const auto& item : args[i].asArray()) {
            line.push_back(item.isNumber() ? item.asNumber() : 0.0);
        }
        lines.push_back(std::move(line));
    }

    const auto& ys = lines[0];
    const size_t n = std::min(candles.size(), ys.size());
    const size_t candle_offset = candles.size() - n;
    const size_t y_offset = ys.size() - n;
    const size_t skip = TechnicalIndicators::leadingZeros(ys);

    static const char* kNames[] = {"y", "y2", "y3"};
    ScriptArray out;
    for (size_t j = 0; j < n; ++j) {
        const size_t yi = y_offset + j;
        if (yi < skip) continue;

        ScriptObject point;
        point["x"] = static_cast<double>(candles[candle_offset + j].open_time);
        for (size_t l = 0; l < lines.size(); ++l) {
            const auto& line = lines[l];
            const long long li = static_cast<long long>(yi) -
                (static_cast<long long>(ys.size()) - static_cast<long long>(line.size()));
            if (li >= static_cast<long long>(TechnicalIndicators::leadingZeros(line)) &&
                li < static_cast<long long>(line.size())) {
                point[kNames[l]] = line[static_cast<size_t>(li)];
            }
        }
        out.push_back(ScriptValue::makeObject(std::move(point)));
    }
    return ScriptValue::makeArray(std::move(out));
}

ScriptValue slice(ExecContext& ctx, const Args& args) {
    auto bounds = [&](size_t size, long long& begin, long long& end) {
        begin = static_cast<long long>(numberArg(args, 1, "start"));
        end = args.size() > 2 && !args[2].isNull()
            ? static_cast<long long>(numberArg(args, 2, "end"))
            : static_cast<long long>(size);
        const long long n = static_cast<long long>(size);
        if (begin < 0) begin += n;
        if (end < 0) end += n;
        begin = std::max(0LL, std::min(begin, n));
        end = std::max(begin, std::min(end, n));
    };

    long long begin = 0;
    long long end = 0;
    if (args[0].isArray()) {
        const auto& items = args[0].asArray();
        bounds(items.size(), begin, end);
        ctx.charge(end - begin + 1);
        return ScriptValue::makeArray(ScriptArray(items.begin() + begin, items.begin() + end));
    }
    if (args[0].isCandles()) {
        const auto& candles = args[0].asCandles();
        bounds(candles.size(), begin, end);
        ctx.charge(end - begin + 1);
        return ScriptValue(market::CandleView(std::make_shared<const std::vector<Candle>>(
            candles.begin() + begin, candles.begin() + end)));
    }
    throw ScriptRuntimeError("cannot slice " + args[0].typeName());
}

std::vector<BuiltinDef> buildRegistry() {
    std::vector<BuiltinDef> defs;

    // ===== market data =====
    defs.push_back({"klines", 0, 1, [](ExecContext& ctx, const Args& args) {
        return ScriptValue(resolveCandles(ctx, args, 0));
    }});
    defs.push_back({"symbol", 0, 0, [](ExecContext& ctx, const Args&) {
        return ctx.snapshot ? ScriptValue(ctx.snapshot->symbol) : ScriptValue();
    }});
    defs.push_back({"ticker", 0, 0, [](ExecContext& ctx, const Args&) {
        if (!ctx.snapshot || !ctx.snapshot->ticker) {
            return ScriptValue();
        }
        const Ticker& t = *ctx.snapshot->ticker;
        ScriptObject fields;
        fields["symbol"] = t.symbol;
        fields["price"] = t.last_price;
        fields["change"] = t.price_change_pct;
        fields["volume"] = t.quote_volume;
        fields["time"] = static_cast<double>(t.event_time);
        return ScriptValue::makeObject(std::move(fields));
    }});
    defs.push_back({"price", 0, 0, [](ExecContext& ctx, const Args&) {
        if (!ctx.snapshot) return ScriptValue();
        const double p = ctx.snapshot->lastPrice(ctx.primary_interval);
        return p > 0.0 ? ScriptValue(p) : ScriptValue();
    }});
    defs.push_back({"change", 0, 0, [](ExecContext& ctx, const Args&) {
        if (!ctx.snapshot || !ctx.snapshot->ticker) return ScriptValue();
        return ScriptValue(ctx.snapshot->ticker->price_change_pct);
    }});
    defs.push_back({"volume", 0, 0, [](ExecContext& ctx, const Args&) {
        if (!ctx.snapshot || !ctx.snapshot->ticker) return ScriptValue();
        return ScriptValue(ctx.snapshot->ticker->quote_volume);
    }});

    defs.push_back({"closes", 0, 1, [](ExecContext& ctx, const Args& args) {
        return candleField(ctx, args, [](const Candle& c) { return c.close; });
    }});
    defs.push_back({"opens", 0, 1, [](ExecContext& ctx, const Args& args) {
        return candleField(ctx, args, [](const Candle& c) { return c.open; });
    }});
    defs.push_back({"highs", 0, 1, [](ExecContext& ctx, const Args& args) {
        return candleField(ctx, args, [](const Candle& c) { return c.high; });
    }});
    defs.push_back({"lows", 0, 1, [](ExecContext& ctx, const Args& args) {
        return candleField(ctx, args, [](const Candle& c) { return c.low; });
    }});
    defs.push_back({"volumes", 0, 1, [](ExecContext& ctx, const Args& args) {
        return candleField(ctx, args, [](const Candle& c) { return c.volume; });
    }});

    // ===== collections =====
    defs.push_back({"len", 1, 1, [](ExecContext&, const Args& args) {
        const ScriptValue& v = args[0];
        switch (v.type()) {
            case ScriptValue::Type::Array: return ScriptValue(static_cast<double>(v.asArray().size()));
            case ScriptValue::Type::Object: return ScriptValue(static_cast<double>(v.asObject().size()));
            case ScriptValue::Type::String: return ScriptValue(static_cast<double>(v.asString().size()));
            case ScriptValue::Type::Candles: return ScriptValue(static_cast<double>(v.asCandles().size()));
            case ScriptValue::Type::Null: return ScriptValue(0);
            default: throw ScriptRuntimeError("len of " + v.typeName());
        }
    }});
    defs.push_back({"last", 1, 1, [](ExecContext&, const Args& args) {
        if (args[0].isArray()) {
            const auto& items = args[0].asArray();
            return items.empty() ? ScriptValue() : items.back();
        }
        if (args[0].isCandles()) {
            const auto& candles = args[0].asCandles();
            return candles.empty() ? ScriptValue() : ScriptValue::fromCandle(candles.back());
        }
        if (args[0].isNull()) return ScriptValue();
        throw ScriptRuntimeError("last of " + args[0].typeName());
    }});
    defs.push_back({"push", 2, 2, [](ExecContext& ctx, const Args& args) {
        if (!args[0].isArray()) {
            throw ScriptRuntimeError("push target must be an array");
        }
        auto& items = args[0].asArray();
        if (items.size() >= kMaxArrayLength) {
            throw ScriptRuntimeError("array too large");
        }
        ctx.charge(static_cast<long long>(args[1].checkStorableIn(args[0].identity())) + 1);
        items.push_back(args[1]);
        return ScriptValue(static_cast<double>(items.size()));
    }});
    defs.push_back({"slice", 2, 3, [](ExecContext& ctx, const Args& args) {
        return slice(ctx, args);
    }});

    // ===== math =====
    defs.push_back({"abs", 1, 1, [](ExecContext&, const Args& args) {
        return unaryMath(args, [](double x) { return std::fabs(x); });
    }});
    defs.push_back({"floor", 1, 1, [](ExecContext&, const Args& args) {
        return unaryMath(args, [](double x) { return std::floor(x); });
    }});
    defs.push_back({"ceil", 1, 1, [](ExecContext&, const Args& args) {
        return unaryMath(args, [](double x) { return std::ceil(x); });
    }});
    defs.push_back({"sqrt", 1, 1, [](ExecContext&, const Args& args) {
        return unaryMath(args, [](double x) {
            if (x < 0.0) throw ScriptRuntimeError("sqrt of negative number");
            return std::sqrt(x);
        });
    }});
    defs.push_back({"round", 1, 2, [](ExecContext&, const Args& args) {
        if (args[0].isNull()) return ScriptValue();
        const double x = numberArg(args, 0, "argument");
        const int digits = args.size() > 1 ? static_cast<int>(numberArg(args, 1, "digits")) : 0;
        const double scale = std::pow(10.0, std::max(0, std::min(digits, 12)));
        return ScriptValue(std::round(x * scale) / scale);
    }});
    defs.push_back({"min", 1, 16, [](ExecContext& ctx, const Args& args) { return minMax(ctx, args, false); }});
    defs.push_back({"max", 1, 16, [](ExecContext& ctx, const Args& args) { return minMax(ctx, args, true); }});

    // ===== indicators (latest) =====
    defs.push_back({"sma", 2, 2, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateSMA(pricesArg(ctx, args, 0), periodArg(args, 1, 20)));
    }});
    defs.push_back({"ema", 2, 2, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateEMA(pricesArg(ctx, args, 0), periodArg(args, 1, 20)));
    }});
    defs.push_back({"rsi", 1, 2, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateRSI(pricesArg(ctx, args, 0), periodArg(args, 1, 14)));
    }});
    defs.push_back({"macd", 1, 4, [](ExecContext& ctx, const Args& args) {
        auto r = TechnicalIndicators::calculateMACD(pricesArg(ctx, args, 0),
            periodArg(args, 1, 12), periodArg(args, 2, 26), periodArg(args, 3, 9));
        if (!r) return ScriptValue();
        ScriptObject fields;
        fields["macd"] = r->macd;
        fields["signal"] = r->signal;
        fields["histogram"] = r->histogram;
        return ScriptValue::makeObject(std::move(fields));
    }});
    defs.push_back({"bollinger", 1, 3, [](ExecContext& ctx, const Args& args) {
        const double mult = args.size() > 2 ? numberArg(args, 2, "multiplier") : 2.0;
        const int period = periodArg(args, 1, 20);
        auto r = TechnicalIndicators::calculateBollingerBands(pricesArg(ctx, args, 0), period, mult);
        if (!r) return ScriptValue();
        ScriptObject fields;
        fields["upper"] = r->upper;
        fields["middle"] = r->middle;
        fields["lower"] = r->lower;
        fields["width"] = r->width;
        fields["percentB"] = r->percent_b;
        return ScriptValue::makeObject(std::move(fields));
    }});
    defs.push_back({"atr", 1, 2, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateATR(*candlesArg(ctx, args, 0), periodArg(args, 1, 14)));
    }});
    defs.push_back({"stochastic", 1, 3, [](ExecContext& ctx, const Args& args) {
        const auto candles = candlesArg(ctx, args, 0);
        const int period = periodArg(args, 1, 14);
        chargeWindow(ctx, period, period);
        auto r = TechnicalIndicators::calculateStochastic(*candles, period, periodArg(args, 2, 3));
        if (!r) return ScriptValue();
        ScriptObject fields;
        fields["k"] = r->k;
        fields["d"] = r->d;
        return ScriptValue::makeObject(std::move(fields));
    }});
    defs.push_back({"vwap", 1, 1, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateVWAP(*candlesArg(ctx, args, 0)));
    }});
    defs.push_back({"avg_volume", 2, 2, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateAvgVolume(*candlesArg(ctx, args, 0), periodArg(args, 1, 20)));
    }});
    defs.push_back({"highest", 2, 2, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateHighestHigh(*candlesArg(ctx, args, 0), periodArg(args, 1, 20)));
    }});
    defs.push_back({"lowest", 2, 2, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateLowestLow(*candlesArg(ctx, args, 0), periodArg(args, 1, 20)));
    }});
    defs.push_back({"bullish_engulfing", 1, 1, [](ExecContext& ctx, const Args& args) {
        return ScriptValue(TechnicalIndicators::detectBullishEngulfing(*candlesArg(ctx, args, 0)));
    }});
    defs.push_back({"bearish_engulfing", 1, 1, [](ExecContext& ctx, const Args& args) {
        return ScriptValue(TechnicalIndicators::detectBearishEngulfing(*candlesArg(ctx, args, 0)));
    }});

    defs.push_back({"wma", 2, 2, [](ExecContext& ctx, const Args& args) {
        const int period = periodArg(args, 1, 20);
        chargeWindow(ctx, 1, period);
        return optionalNumber(TechnicalIndicators::calculateWMA(pricesArg(ctx, args, 0), period));
    }});
    defs.push_back({"roc", 1, 2, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateROC(pricesArg(ctx, args, 0), periodArg(args, 1, 10)));
    }});
    defs.push_back({"cci", 1, 2, [](ExecContext& ctx, const Args& args) {
        const int period = periodArg(args, 1, 20);
        chargeWindow(ctx, 1, period);
        return optionalNumber(TechnicalIndicators::calculateCCI(*candlesArg(ctx, args, 0), period));
    }});
    defs.push_back({"williams_r", 1, 2, [](ExecContext& ctx, const Args& args) {
        const int period = periodArg(args, 1, 14);
        chargeWindow(ctx, 1, period);
        return optionalNumber(TechnicalIndicators::calculateWilliamsR(*candlesArg(ctx, args, 0), period));
    }});
    defs.push_back({"keltner", 1, 4, [](ExecContext& ctx, const Args& args) {
        const double mult = args.size() > 3 ? numberArg(args, 3, "multiplier") : 2.0;
        return channelObject(TechnicalIndicators::calculateKeltner(*candlesArg(ctx, args, 0),
            periodArg(args, 1, 20), periodArg(args, 2, 10), mult));
    }});
    defs.push_back({"donchian", 1, 2, [](ExecContext& ctx, const Args& args) {
        const int period = periodArg(args, 1, 20);
        chargeWindow(ctx, 1, period);
        return channelObject(TechnicalIndicators::calculateDonchian(*candlesArg(ctx, args, 0), period));
    }});
    defs.push_back({"obv", 1, 1, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateOBV(*candlesArg(ctx, args, 0)));
    }});
    defs.push_back({"adx", 1, 2, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateADX(*candlesArg(ctx, args, 0), periodArg(args, 1, 14)));
    }});
    defs.push_back({"aroon", 1, 2, [](ExecContext& ctx, const Args& args) {
        const int period = periodArg(args, 1, 25);
        chargeWindow(ctx, 1, period);
        auto r = TechnicalIndicators::calculateAroon(*candlesArg(ctx, args, 0), period);
        if (!r) return ScriptValue();
        ScriptObject fields;
        fields["up"] = r->up;
        fields["down"] = r->down;
        return ScriptValue::makeObject(std::move(fields));
    }});
    defs.push_back({"volume_change", 1, 2, [](ExecContext& ctx, const Args& args) {
        return optionalNumber(TechnicalIndicators::calculateVolumeChange(*candlesArg(ctx, args, 0), periodArg(args, 1, 20)));
    }});

    // ===== indicators (series) =====
    defs.push_back({"sma_series", 2, 2, [](ExecContext& ctx, const Args& args) {
        return numberArray(TechnicalIndicators::smaSeries(pricesArg(ctx, args, 0), periodArg(args, 1, 20)));
    }});
    defs.push_back({"ema_series", 2, 2, [](ExecContext& ctx, const Args& args) {
        return numberArray(TechnicalIndicators::emaSeries(pricesArg(ctx, args, 0), periodArg(args, 1, 20)));
    }});
    defs.push_back({"rsi_series", 1, 2, [](ExecContext& ctx, const Args& args) {
        return numberArray(TechnicalIndicators::rsiSeries(pricesArg(ctx, args, 0), periodArg(args, 1, 14)));
    }});
    defs.push_back({"macd_series", 1, 4, [](ExecContext& ctx, const Args& args) {
        auto s = TechnicalIndicators::macdSeries(pricesArg(ctx, args, 0),
            periodArg(args, 1, 12), periodArg(args, 2, 26), periodArg(args, 3, 9));
        ScriptObject fields;
        fields["macd"] = numberArray(s.macd);
        fields["signal"] = numberArray(s.signal);
        fields["histogram"] = numberArray(s.histogram);
        return ScriptValue::makeObject(std::move(fields));
    }});
    defs.push_back({"bollinger_series", 1, 3, [](ExecContext& ctx, const Args& args) {
        const double mult = args.size() > 2 ? numberArg(args, 2, "multiplier") : 2.0;
        const auto prices = pricesArg(ctx, args, 0);
        const int period = periodArg(args, 1, 20);
        chargeWindow(ctx, prices.size(), period);
        auto s = TechnicalIndicators::bollingerSeries(prices, period, mult);
        ScriptObject fields;
        fields["upper"] = numberArray(s.upper);
        fields["middle"] = numberArray(s.middle);
        fields["lower"] = numberArray(s.lower);
        return ScriptValue::makeObject(std::move(fields));
    }});
    defs.push_back({"atr_series", 1, 2, [](ExecContext& ctx, const Args& args) {
        return numberArray(TechnicalIndicators::atrSeries(*candlesArg(ctx, args, 0), periodArg(args, 1, 14)));
    }});
    defs.push_back({"stochastic_series", 1, 3, [](ExecContext& ctx, const Args& args) {
        const auto candles = candlesArg(ctx, args, 0);
        const int period = periodArg(args, 1, 14);
        chargeWindow(ctx, candles->size(), period);
        auto s = TechnicalIndicators::stochasticSeries(*candles, period, periodArg(args, 2, 3));
        ScriptObject fields;
        fields["k"] = numberArray(s.k);
        fields["d"] = numberArray(s.d);
        return ScriptValue::makeObject(std::move(fields));
    }});
    defs.push_back({"vwap_series", 1, 1, [](ExecContext& ctx, const Args& args) {
        return numberArray(TechnicalIndicators::vwapSeries(*candlesArg(ctx, args, 0)));
    }});
    defs.push_back({"avg_volume_series", 2, 2, [](ExecContext& ctx, const Args& args) {
        return numberArray(TechnicalIndicators::avgVolumeSeries(*candlesArg(ctx, args, 0), periodArg(args, 1, 20)));
    }});

    defs.push_back({"wma_series", 2, 2, [](ExecContext& ctx, const Args& args) {
        const auto prices = pricesArg(ctx, args, 0);
        const int period = periodArg(args, 1, 20);
        chargeWindow(ctx, prices.size(), period);
        return numberArray(TechnicalIndicators::wmaSeries(prices, period));
    }});
    defs.push_back({"roc_series", 1, 2, [](ExecContext& ctx, const Args& args) {
        return numberArray(TechnicalIndicators::rocSeries(pricesArg(ctx, args, 0), periodArg(args, 1, 10)));
    }});
    defs.push_back({"cci_series", 1, 2, [](ExecContext& ctx, const Args& args) {
        const auto candles = candlesArg(ctx, args, 0);
        const int period = periodArg(args, 1, 20);
        chargeWindow(ctx, candles->size(), period);
        return numberArray(TechnicalIndicators::cciSeries(*candles, period));
    }});
    defs.push_back({"williams_r_series", 1, 2, [](ExecContext& ctx, const Args& args) {
        const auto candles = candlesArg(ctx, args, 0);
        const int period = periodArg(args, 1, 14);
        chargeWindow(ctx, candles->size(), period);
        return numberArray(TechnicalIndicators::williamsRSeries(*candles, period));
    }});
    defs.push_back({"keltner_series", 1, 4, [](ExecContext& ctx, const Args& args) {
        const double mult = args.size() > 3 ? numberArg(args, 3, "multiplier") : 2.0;
        return channelSeriesObject(TechnicalIndicators::keltnerSeries(*candlesArg(ctx, args, 0),
            periodArg(args, 1, 20), periodArg(args, 2, 10), mult));
    }});
    defs.push_back({"donchian_series", 1, 2, [](ExecContext& ctx, const Args& args) {
        const auto candles = candlesArg(ctx, args, 0);
        const int period = periodArg(args, 1, 20);
        chargeWindow(ctx, candles->size(), period);
        return channelSeriesObject(TechnicalIndicators::donchianSeries(*candles, period));
    }});
    defs.push_back({"obv_series", 1, 1, [](ExecContext& ctx, const Args& args) {
        return numberArray(TechnicalIndicators::obvSeries(*candlesArg(ctx, args, 0)));
    }});
    defs.push_back({"adx_series", 1, 2, [](ExecContext& ctx, const Args& args) {
        return numberArray(TechnicalIndicators::adxSeries(*candlesArg(ctx, args, 0), periodArg(args, 1, 14)));
    }});
    defs.push_back({"aroon_series", 1, 2, [](ExecContext& ctx, const Args& args) {
        const auto candles = candlesArg(ctx, args, 0);
        const int period = periodArg(args, 1, 25);
        chargeWindow(ctx, candles->size(), period);
        auto s = TechnicalIndicators::aroonSeries(*candles, period);
        ScriptObject fields;
        fields["up"] = numberArray(s.up);
        fields["down"] = numberArray(s.down);
        return ScriptValue::makeObject(std::move(fields));
    }});
    defs.push_back({"volume_change_series", 1, 2, [](ExecContext& ctx, const Args& args) {
        return numberArray(TechnicalIndicators::volumeChangeSeries(*candlesArg(ctx, args, 0), periodArg(args, 1, 20)));
    }});

    // ===== output =====
    defs.push_back({"points", 2, 4, [](ExecContext& ctx, const Args& args) {
        return points(ctx, args);
    }});
    defs.push_back({"reason", 1, 1, [](ExecContext& ctx, const Args& args) {
        ctx.reasoning = args[0].toDisplayString();
        ctx.charge(static_cast<long long>(ctx.reasoning.size()) + 1);
        return ScriptValue();
    }});
    defs.push_back({"indicator", 2, 2, [](ExecContext& ctx, const Args& args) {
        if (!args[0].isString()) {
            throw ScriptRuntimeError("indicator name must be a string");
        }
        ctx.charge(static_cast<long long>(args[1].checkStorableIn(nullptr)) + 1);
        ctx.indicators[args[0].asString()] = args[1].toJson();
        return ScriptValue();
    }});

    return defs;
}

} // namespace

const std::vector<BuiltinDef>& ScriptBuiltins::all() {
    static const std::vector<BuiltinDef> kBuiltins = buildRegistry();
    return kBuiltins;
}

int ScriptBuiltins::find(const std::string& name) {
    const auto& defs = all();
    for (size_t i = 0; i < defs.size(); ++i) {
        if (defs[i].name == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace sandbox
} // namespace sigscan
