#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace sigscan {
namespace analytics {

// ===== 이동평균 =====

std::vector<double> TechnicalIndicators::smaSeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), 0.0);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return out;
    }

    double window_sum = 0.0;
    for (size_t i = 0; i < prices.size(); ++i) {
        window_sum += prices[i];
        if (i >= static_cast<size_t>(period)) {
            window_sum -= prices[i - period];
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            out[i] = window_sum / period;
        }
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    return calculateMean(prices, prices.size() - period, prices.size());
}

// EMA는 첫 period 구간의 SMA로 시작한다
std::vector<double> TechnicalIndicators::emaSeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), 0.0);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return out;
    }

    const double multiplier = 2.0 / (period + 1.0);
    double ema = calculateMean(prices, 0, period);
    out[period - 1] = ema;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        out[i] = ema;
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    return emaSeries(prices, period).back();
}

// ===== RSI =====

std::vector<double> TechnicalIndicators::rsiSeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), 0.0);
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return out;
    }

    auto toRsi = [](double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) {
            // 변동이 전혀 없으면 중립
            return avg_gain == 0.0 ? 50.0 : 100.0;
        }
        const double rs = avg_gain / avg_loss;
        return 100.0 - (100.0 / (1.0 + rs));
    };

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // 1. 초기 평균 (첫 period 개의 변화량)
    for (int i = 1; i <= period; ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += -change;
    }
    avg_gain /= period;
    avg_loss /= period;
    out[period] = toRsi(avg_gain, avg_loss);

    // 2. Wilder's Smoothing
    for (size_t i = period + 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        const double gain = change > 0 ? change : 0.0;
        const double loss = change < 0 ? -change : 0.0;

        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
        out[i] = toRsi(avg_gain, avg_loss);
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return std::nullopt;
    }
    return rsiSeries(prices, period).back();
}

// ===== MACD =====

TechnicalIndicators::MACDSeries TechnicalIndicators::macdSeries(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDSeries result;
    result.macd.assign(prices.size(), 0.0);
    result.signal.assign(prices.size(), 0.0);
    result.histogram.assign(prices.size(), 0.0);

    if (fast <= 0 || slow <= 0 || signal_period <= 0) {
        return result;
    }

    const size_t line_start = static_cast<size_t>(std::max(fast, slow)) - 1;
    if (prices.size() <= line_start) {
        return result;
    }

    const auto fast_ema = emaSeries(prices, fast);
    const auto slow_ema = emaSeries(prices, slow);
    for (size_t i = line_start; i < prices.size(); ++i) {
        result.macd[i] = fast_ema[i] - slow_ema[i];
    }

    // Signal 선: MACD 선의 EMA (유효 구간의 첫 signal_period 평균으로 시작)
    const size_t signal_start = line_start + signal_period - 1;
    if (prices.size() <= signal_start) {
        return result;
    }

    const double multiplier = 2.0 / (signal_period + 1.0);
    double signal = calculateMean(result.macd, line_start, signal_start + 1);
    result.signal[signal_start] = signal;
    result.histogram[signal_start] = result.macd[signal_start] - signal;

    for (size_t i = signal_start + 1; i < prices.size(); ++i) {
        signal = (result.macd[i] - signal) * multiplier + signal;
        result.signal[i] = signal;
        result.histogram[i] = result.macd[i] - signal;
    }
    return result;
}

std::optional<TechnicalIndicators::MACDResult> TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    if (fast <= 0 || slow <= 0 || signal_period <= 0) {
        return std::nullopt;
    }
    const size_t required = static_cast<size_t>(std::max(fast, slow) + signal_period - 1);
    if (prices.size() < required) {
        return std::nullopt;
    }

    const auto series = macdSeries(prices, fast, slow, signal_period);
    MACDResult result;
    result.macd = series.macd.back();
    result.signal = series.signal.back();
    result.histogram = series.histogram.back();
    return result;
}

// ===== Bollinger Bands =====

TechnicalIndicators::BollingerSeries TechnicalIndicators::bollingerSeries(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerSeries result;
    result.upper.assign(prices.size(), 0.0);
    result.middle.assign(prices.size(), 0.0);
    result.lower.assign(prices.size(), 0.0);

    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    for (size_t i = period - 1; i < prices.size(); ++i) {
        const size_t begin = i + 1 - period;
        const double mean = calculateMean(prices, begin, i + 1);
        const double sd = calculateStandardDeviation(prices, begin, i + 1, mean);
        result.middle[i] = mean;
        result.upper[i] = mean + std_dev_mult * sd;
        result.lower[i] = mean - std_dev_mult * sd;
    }
    return result;
}

std::optional<TechnicalIndicators::BollingerBands> TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }

    const size_t begin = prices.size() - period;
    BollingerBands bands;
    bands.middle = calculateMean(prices, begin, prices.size());
    const double sd = calculateStandardDeviation(prices, begin, prices.size(), bands.middle);
    bands.upper = bands.middle + std_dev_mult * sd;
    bands.lower = bands.middle - std_dev_mult * sd;
    bands.width = bands.middle != 0.0 ? (bands.upper - bands.lower) / bands.middle : 0.0;

    const double range = bands.upper - bands.lower;
    bands.percent_b = range > 0.0 ? (prices.back() - bands.lower) / range : 0.5;
    return bands;
}

// ===== ATR =====

std::vector<double> TechnicalIndicators::trueRanges(const std::vector<Candle>& candles) {
    std::vector<double> tr(candles.size(), 0.0);
    for (size_t i = 0; i < candles.size(); ++i) {
        const double high_low = candles[i].high - candles[i].low;
        if (i == 0) {
            tr[i] = high_low;
            continue;
        }
        const double prev_close = candles[i - 1].close;
        tr[i] = std::max({high_low,
                          std::abs(candles[i].high - prev_close),
                          std::abs(candles[i].low - prev_close)});
    }
    return tr;
}

std::vector<double> TechnicalIndicators::atrSeries(const std::vector<Candle>& candles, int period) {
    std::vector<double> out(candles.size(), 0.0);
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return out;
    }

    const auto tr = trueRanges(candles);
    double atr = calculateMean(tr, 1, period + 1);
    out[period] = atr;
    for (size_t i = period + 1; i < candles.size(); ++i) {
        atr = (atr * (period - 1) + tr[i]) / period;
        out[i] = atr;
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return std::nullopt;
    }
    return atrSeries(candles, period).back();
}

// ===== Stochastic =====

TechnicalIndicators::StochasticSeries TechnicalIndicators::stochasticSeries(
    const std::vector<Candle>& candles,
    int k_period,
    int d_period
) {
    StochasticSeries result;
    result.k.assign(candles.size(), 0.0);
    result.d.assign(candles.size(), 0.0);

    if (k_period <= 0 || d_period <= 0 || candles.size() < static_cast<size_t>(k_period)) {
        return result;
    }

    for (size_t i = k_period - 1; i < candles.size(); ++i) {
        double highest = candles[i].high;
        double lowest = candles[i].low;
        for (size_t j = i + 1 - k_period; j <= i; ++j) {
            highest = std::max(highest, candles[j].high);
            lowest = std::min(lowest, candles[j].low);
        }
        const double range = highest - lowest;
        result.k[i] = range > 0.0 ? 100.0 * (candles[i].close - lowest) / range : 50.0;
    }

    const size_t d_start = static_cast<size_t>(k_period + d_period - 2);
    for (size_t i = d_start; i < candles.size(); ++i) {
        result.d[i] = calculateMean(result.k, i + 1 - d_period, i + 1);
    }
    return result;
}

std::optional<TechnicalIndicators::StochasticResult> TechnicalIndicators::calculateStochastic(
    const std::vector<Candle>& candles,
    int k_period,
    int d_period
) {
    if (k_period <= 0 || d_period <= 0 ||
        candles.size() < static_cast<size_t>(k_period + d_period - 1)) {
        return std::nullopt;
    }
    const auto series = stochasticSeries(candles, k_period, d_period);
    StochasticResult result;
    result.k = series.k.back();
    result.d = series.d.back();
    return result;
}

// ===== Volume =====

std::vector<double> TechnicalIndicators::vwapSeries(const std::vector<Candle>& candles) {
    std::vector<double> out(candles.size(), 0.0);
    double cum_pv = 0.0;
    double cum_volume = 0.0;
    for (size_t i = 0; i < candles.size(); ++i) {
        const double typical = (candles[i].high + candles[i].low + candles[i].close) / 3.0;
        cum_pv += typical * candles[i].volume;
        cum_volume += candles[i].volume;
        if (cum_volume > 0.0) {
            out[i] = cum_pv / cum_volume;
        }
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateVWAP(const std::vector<Candle>& candles) {
    if (candles.empty()) {
        return std::nullopt;
    }
    double pv = 0.0;
    double total_volume = 0.0;
    for (const auto& c : candles) {
        pv += (c.high + c.low + c.close) / 3.0 * c.volume;
        total_volume += c.volume;
    }
    if (total_volume <= 0.0) {
        return std::nullopt;
    }
    return pv / total_volume;
}

std::vector<double> TechnicalIndicators::avgVolumeSeries(const std::vector<Candle>& candles, int period) {
    return smaSeries(extractVolumes(candles), period);
}

std::optional<double> TechnicalIndicators::calculateAvgVolume(const std::vector<Candle>& candles, int period) {
    return calculateSMA(extractVolumes(candles), period);
}

std::optional<double> TechnicalIndicators::calculateHighestHigh(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    double highest = candles.back().high;
    for (size_t i = candles.size() - period; i < candles.size(); ++i) {
        highest = std::max(highest, candles[i].high);
    }
    return highest;
}

std::optional<double> TechnicalIndicators::calculateLowestLow(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    double lowest = candles.back().low;
    for (size_t i = candles.size() - period; i < candles.size(); ++i) {
        lowest = std::min(lowest, candles[i].low);
    }
    return lowest;
}

// ===== WMA / ROC =====

std::vector<double> TechnicalIndicators::wmaSeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), 0.0);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return out;
    }

    // 가중치 1..period, 최신 값이 가장 크다
    const double weight_total = period * (period + 1) / 2.0;
    for (size_t i = period - 1; i < prices.size(); ++i) {
        double weighted = 0.0;
        for (int k = 0; k < period; ++k) {
            weighted += prices[i + 1 - period + k] * (k + 1);
        }
        out[i] = weighted / weight_total;
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateWMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    return wmaSeries(prices, period).back();
}

std::vector<double> TechnicalIndicators::rocSeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), 0.0);
    if (period <= 0) {
        return out;
    }
    for (size_t i = period; i < prices.size(); ++i) {
        const double past = prices[i - period];
        out[i] = past != 0.0 ? (prices[i] - past) / past * 100.0 : 0.0;
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateROC(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return std::nullopt;
    }
    return rocSeries(prices, period).back();
}

// ===== CCI / Williams %R =====

std::vector<double> TechnicalIndicators::cciSeries(const std::vector<Candle>& candles, int period) {
    std::vector<double> out(candles.size(), 0.0);
    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        return out;
    }

    std::vector<double> typical(candles.size());
    for (size_t i = 0; i < candles.size(); ++i) {
        typical[i] = (candles[i].high + candles[i].low + candles[i].close) / 3.0;
    }

    for (size_t i = period - 1; i < candles.size(); ++i) {
        const size_t begin = i + 1 - period;
        const double mean = calculateMean(typical, begin, i + 1);
        double deviation = 0.0;
        for (size_t j = begin; j <= i; ++j) {
            deviation += std::abs(typical[j] - mean);
        }
        deviation /= period;
        out[i] = deviation != 0.0 ? (typical[i] - mean) / (0.015 * deviation) : 0.0;
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateCCI(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    return cciSeries(candles, period).back();
}

// -100(저점) ~ 0(고점). 고저가 같으면 -50
std::vector<double> TechnicalIndicators::williamsRSeries(const std::vector<Candle>& candles, int period) {
    std::vector<double> out(candles.size(), 0.0);
    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        return out;
    }

    for (size_t i = period - 1; i < candles.size(); ++i) {
        double highest = candles[i].high;
        double lowest = candles[i].low;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            highest = std::max(highest, candles[j].high);
            lowest = std::min(lowest, candles[j].low);
        }
        const double range = highest - lowest;
        out[i] = range > 0.0 ? (highest - candles[i].close) / range * -100.0 : -50.0;
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateWilliamsR(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    return williamsRSeries(candles, period).back();
}

// ===== Channels =====

TechnicalIndicators::ChannelSeries TechnicalIndicators::keltnerSeries(
    const std::vector<Candle>& candles,
    int period,
    int atr_period,
    double multiplier
) {
    ChannelSeries result;
    result.upper.assign(candles.size(), 0.0);
    result.middle.assign(candles.size(), 0.0);
    result.lower.assign(candles.size(), 0.0);

    if (period <= 0 || atr_period <= 0) {
        return result;
    }
    const size_t start = static_cast<size_t>(std::max(period - 1, atr_period));
    if (candles.size() <= start) {
        return result;
    }

    const auto middle = emaSeries(extractClosePrices(candles), period);
    const auto atr = atrSeries(candles, atr_period);
    for (size_t i = start; i < candles.size(); ++i) {
        result.middle[i] = middle[i];
        result.upper[i] = middle[i] + multiplier * atr[i];
        result.lower[i] = middle[i] - multiplier * atr[i];
    }
    return result;
}

std::optional<TechnicalIndicators::Channel> TechnicalIndicators::calculateKeltner(
    const std::vector<Candle>& candles,
    int period,
    int atr_period,
    double multiplier
) {
    if (period <= 0 || atr_period <= 0 ||
        candles.size() <= static_cast<size_t>(std::max(period - 1, atr_period))) {
        return std::nullopt;
    }
    const auto series = keltnerSeries(candles, period, atr_period, multiplier);
    Channel channel;
    channel.upper = series.upper.back();
    channel.middle = series.middle.back();
    channel.lower = series.lower.back();
    return channel;
}

TechnicalIndicators::ChannelSeries TechnicalIndicators::donchianSeries(const std::vector<Candle>& candles, int period) {
    ChannelSeries result;
    result.upper.assign(candles.size(), 0.0);
    result.middle.assign(candles.size(), 0.0);
    result.lower.assign(candles.size(), 0.0);

    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        return result;
    }

    for (size_t i = period - 1; i < candles.size(); ++i) {
        double highest = candles[i].high;
        double lowest = candles[i].low;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            highest = std::max(highest, candles[j].high);
            lowest = std::min(lowest, candles[j].low);
        }
        result.upper[i] = highest;
        result.lower[i] = lowest;
        result.middle[i] = (highest + lowest) / 2.0;
    }
    return result;
}

std::optional<TechnicalIndicators::Channel> TechnicalIndicators::calculateDonchian(
    const std::vector<Candle>& candles,
    int period
) {
    const auto upper = calculateHighestHigh(candles, period);
    const auto lower = calculateLowestLow(candles, period);
    if (!upper || !lower) {
        return std::nullopt;
    }
    Channel channel;
    channel.upper = *upper;
    channel.lower = *lower;
    channel.middle = (*upper + *lower) / 2.0;
    return channel;
}

// ===== OBV / ADX / Aroon =====

std::vector<double> TechnicalIndicators::obvSeries(const std::vector<Candle>& candles) {
    std::vector<double> out(candles.size(), 0.0);
    double obv = 0.0;
    for (size_t i = 1; i < candles.size(); ++i) {
        if (candles[i].close > candles[i - 1].close) {
            obv += candles[i].volume;
        } else if (candles[i].close < candles[i - 1].close) {
            obv -= candles[i].volume;
        }
        out[i] = obv;
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateOBV(const std::vector<Candle>& candles) {
    if (candles.size() < 2) {
        return std::nullopt;
    }
    return obvSeries(candles).back();
}

std::vector<double> TechnicalIndicators::adxSeries(const std::vector<Candle>& candles, int period) {
    std::vector<double> out(candles.size(), 0.0);
    if (period <= 0 || candles.size() < static_cast<size_t>(2 * period)) {
        return out;
    }

    const auto tr = trueRanges(candles);
    std::vector<double> dx(candles.size(), 0.0);
    double smooth_tr = 0.0;
    double smooth_plus = 0.0;
    double smooth_minus = 0.0;

    // 1. +DM / -DM / TR 을 Wilder 방식으로 평활화
    for (size_t i = 1; i < candles.size(); ++i) {
        const double up_move = candles[i].high - candles[i - 1].high;
        const double down_move = candles[i - 1].low - candles[i].low;
        const double plus_dm = (up_move > down_move && up_move > 0.0) ? up_move : 0.0;
        const double minus_dm = (down_move > up_move && down_move > 0.0) ? down_move : 0.0;

        if (i <= static_cast<size_t>(period)) {
            smooth_tr += tr[i];
            smooth_plus += plus_dm;
            smooth_minus += minus_dm;
            if (i < static_cast<size_t>(period)) {
                continue;
            }
        } else {
            smooth_tr = smooth_tr - smooth_tr / period + tr[i];
            smooth_plus = smooth_plus - smooth_plus / period + plus_dm;
            smooth_minus = smooth_minus - smooth_minus / period + minus_dm;
        }

        const double plus_di = smooth_tr > 0.0 ? 100.0 * smooth_plus / smooth_tr : 0.0;
        const double minus_di = smooth_tr > 0.0 ? 100.0 * smooth_minus / smooth_tr : 0.0;
        const double di_sum = plus_di + minus_di;
        dx[i] = di_sum > 0.0 ? 100.0 * std::abs(plus_di - minus_di) / di_sum : 0.0;
    }

    // 2. ADX: 첫 값은 DX 평균, 이후 Wilder 평활
    const size_t first = static_cast<size_t>(2 * period - 1);
    double adx = calculateMean(dx, period, first + 1);
    out[first] = adx;
    for (size_t i = first + 1; i < candles.size(); ++i) {
        adx = (adx * (period - 1) + dx[i]) / period;
        out[i] = adx;
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateADX(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(2 * period)) {
        return std::nullopt;
    }
    return adxSeries(candles, period).back();
}

TechnicalIndicators::AroonSeries TechnicalIndicators::aroonSeries(const std::vector<Candle>& candles, int period) {
    AroonSeries result;
    result.up.assign(candles.size(), 0.0);
    result.down.assign(candles.size(), 0.0);

    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        return result;
    }

    for (size_t i = period - 1; i < candles.size(); ++i) {
        double highest = candles[i].high;
        double lowest = candles[i].low;
        size_t since_high = 0;
        size_t since_low = 0;
        // 같은 값이면 더 오래된 봉을 기준으로 한다
        for (size_t j = i + 1; j-- > i + 1 - period;) {
            if (candles[j].high >= highest) {
                highest = candles[j].high;
                since_high = i - j;
            }
            if (candles[j].low <= lowest) {
                lowest = candles[j].low;
                since_low = i - j;
            }
        }
        result.up[i] = (period - static_cast<double>(since_high)) / period * 100.0;
        result.down[i] = (period - static_cast<double>(since_low)) / period * 100.0;
    }
    return result;
}

std::optional<TechnicalIndicators::AroonResult> TechnicalIndicators::calculateAroon(
    const std::vector<Candle>& candles,
    int period
) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    const auto series = aroonSeries(candles, period);
    AroonResult result;
    result.up = series.up.back();
    result.down = series.down.back();
    return result;
}

std::vector<double> TechnicalIndicators::volumeChangeSeries(const std::vector<Candle>& candles, int period) {
    std::vector<double> out(candles.size(), 0.0);
    if (period <= 0) {
        return out;
    }
    const auto averages = smaSeries(extractVolumes(candles), period);
    for (size_t i = period; i < candles.size(); ++i) {
        const double average = averages[i];
        out[i] = average > 0.0 ? (candles[i].volume - average) / average * 100.0 : 0.0;
    }
    return out;
}

std::optional<double> TechnicalIndicators::calculateVolumeChange(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return std::nullopt;
    }
    return volumeChangeSeries(candles, period).back();
}

// ===== 캔들 패턴 =====

bool TechnicalIndicators::detectBullishEngulfing(const std::vector<Candle>& candles) {
    if (candles.size() < 2) {
        return false;
    }
    const auto& prev = candles[candles.size() - 2];
    const auto& curr = candles.back();
    return prev.close < prev.open &&
           curr.close > curr.open &&
           curr.open <= prev.close &&
           curr.close >= prev.open;
}

bool TechnicalIndicators::detectBearishEngulfing(const std::vector<Candle>& candles) {
    if (candles.size() < 2) {
        return false;
    }
    const auto& prev = candles[candles.size() - 2];
    const auto& curr = candles.back();
    return prev.close > prev.open &&
           curr.close < curr.open &&
           curr.open >= prev.close &&
           curr.close <= prev.open;
}

// ===== Helpers =====

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& c : candles) {
        prices.push_back(c.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Candle>& candles) {
    std::vector<double> volumes;
    volumes.reserve(candles.size());
    for (const auto& c : candles) {
        volumes.push_back(c.volume);
    }
    return volumes;
}

size_t TechnicalIndicators::leadingZeros(const std::vector<double>& series) {
    size_t n = 0;
    while (n < series.size() && series[n] == 0.0) {
        ++n;
    }
    return n;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values, size_t begin, size_t end) {
    if (end <= begin) return 0.0;
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) {
        sum += values[i];
    }
    return sum / static_cast<double>(end - begin);
}

// 모집단 표준편차
double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values,
                                                       size_t begin, size_t end, double mean) {
    if (end <= begin) return 0.0;
    double sum_sq = 0.0;
    for (size_t i = begin; i < end; ++i) {
        const double diff = values[i] - mean;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / static_cast<double>(end - begin));
}

} // namespace analytics
} // namespace sigscan
