#include "analytics/TechnicalIndicators.h"

#include <cassert>
#include <cmath>
#include <iostream>

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

std::vector<sigscan::Candle> makeCandles(const std::vector<double>& closes) {
    std::vector<sigscan::Candle> out;
    long long t = 0;
    for (double c : closes) {
        out.emplace_back(c, c + 1.0, c - 1.0, c, 10.0, t, t + 59999, true);
        t += 60000;
    }
    return out;
}

}

int main() {
    using sigscan::analytics::TechnicalIndicators;

    std::cout << "[TEST] Starting TechnicalIndicators Test..." << std::endl;

    const std::vector<double> prices = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};

    // 1. SMA / EMA
    assert(near(TechnicalIndicators::calculateSMA(prices, 5).value(), 8.0));
    assert(!TechnicalIndicators::calculateSMA(prices, 11).has_value());
    assert(!TechnicalIndicators::calculateSMA(prices, 0).has_value());

    const auto sma = TechnicalIndicators::smaSeries(prices, 3);
    assert(sma.size() == prices.size());
    assert(TechnicalIndicators::leadingZeros(sma) == 2);
    assert(near(sma[2], 2.0));
    assert(near(sma.back(), 9.0));

    const auto ema = TechnicalIndicators::emaSeries(prices, 3);
    assert(near(ema[2], 2.0));
    // 선형 증가 입력에서 EMA(3)는 가격보다 1 작게 수렴
    assert(near(ema.back(), 9.0, 1e-2));
    assert(near(TechnicalIndicators::calculateEMA(prices, 3).value(), ema.back()));

    // 2. RSI
    assert(near(TechnicalIndicators::calculateRSI(prices, 5).value(), 100.0));
    const std::vector<double> flat(20, 42.0);
    assert(near(TechnicalIndicators::calculateRSI(flat, 14).value(), 50.0));
    assert(!TechnicalIndicators::calculateRSI(prices, 14).has_value());
    const std::vector<double> falling = {10, 9, 8, 7, 6, 5};
    assert(near(TechnicalIndicators::calculateRSI(falling, 5).value(), 0.0));

    const auto rsi = TechnicalIndicators::rsiSeries(prices, 5);
    assert(TechnicalIndicators::leadingZeros(rsi) == 5);

    // 3. MACD
    std::vector<double> long_prices;
    for (int i = 0; i < 60; ++i) {
        long_prices.push_back(100.0 + i);
    }
    const auto macd = TechnicalIndicators::calculateMACD(long_prices);
    assert(macd.has_value());
    assert(macd->macd > 0.0);
    assert(near(macd->histogram, macd->macd - macd->signal));
    assert(!TechnicalIndicators::calculateMACD(prices).has_value());

    const auto macd_series = TechnicalIndicators::macdSeries(long_prices);
    assert(macd_series.macd.size() == long_prices.size());
    assert(macd_series.signal.size() == long_prices.size());

    // 4. Bollinger
    const auto bb_flat = TechnicalIndicators::calculateBollingerBands(flat, 20);
    assert(bb_flat.has_value());
    assert(near(bb_flat->upper, 42.0));
    assert(near(bb_flat->lower, 42.0));
    assert(near(bb_flat->width, 0.0));

    const auto bb = TechnicalIndicators::calculateBollingerBands(long_prices, 20);
    assert(bb.has_value());
    assert(bb->upper > bb->middle);
    assert(bb->middle > bb->lower);
    assert(bb->percent_b > 0.5);

    // 5. 캔들 기반 지표
    const auto candles = makeCandles(long_prices);
    const auto atr = TechnicalIndicators::calculateATR(candles, 14);
    assert(atr.has_value());
    // high-low = 2, |high - prev close| = 2
    assert(near(atr.value(), 2.0, 1e-6));

    const auto stoch = TechnicalIndicators::calculateStochastic(candles, 14, 3);
    assert(stoch.has_value());
    assert(stoch->k > 80.0);
    assert(stoch->k <= 100.0);

    assert(near(TechnicalIndicators::calculateAvgVolume(candles, 10).value(), 10.0));
    assert(near(TechnicalIndicators::calculateHighestHigh(candles, 5).value(), 160.0));
    assert(near(TechnicalIndicators::calculateLowestLow(candles, 5).value(), 154.0));
    assert(TechnicalIndicators::calculateVWAP(candles).has_value());
    assert(!TechnicalIndicators::calculateATR(makeCandles({1, 2}), 14).has_value());

    // 6. 장악형 패턴
    std::vector<sigscan::Candle> bull;
    bull.emplace_back(10.0, 10.5, 8.5, 9.0, 1.0, 0, 59999);
    bull.emplace_back(8.8, 11.0, 8.7, 10.5, 1.0, 60000, 119999);
    assert(TechnicalIndicators::detectBullishEngulfing(bull));
    assert(!TechnicalIndicators::detectBearishEngulfing(bull));
    assert(!TechnicalIndicators::detectBullishEngulfing(makeCandles({1})));

    // 7. WMA / ROC
    const std::vector<double> five = {1, 2, 3, 4, 5};
    assert(near(TechnicalIndicators::calculateWMA(five, 3).value(), 26.0 / 6.0));
    assert(!TechnicalIndicators::calculateWMA(five, 6).has_value());
    const auto wma = TechnicalIndicators::wmaSeries(five, 3);
    assert(TechnicalIndicators::leadingZeros(wma) == 2);
    assert(near(wma[2], 14.0 / 6.0));

    assert(near(TechnicalIndicators::calculateROC({100, 110}, 1).value(), 10.0));
    assert(!TechnicalIndicators::calculateROC({100}, 1).has_value());
    assert(near(TechnicalIndicators::rocSeries({100, 110, 99}, 1)[2], -10.0));

    // 8. CCI / Williams %R
    std::vector<sigscan::Candle> tp;
    for (int i = 1; i <= 3; ++i) {
        const double x = i;
        tp.emplace_back(x, x, x, x, 1.0, i * 60000LL, i * 60000LL + 59999);
    }
    assert(near(TechnicalIndicators::calculateCCI(tp, 3).value(), 100.0));
    assert(!TechnicalIndicators::calculateCCI(tp, 4).has_value());
    const auto flat_candles = makeCandles(std::vector<double>(5, 7.0));
    assert(near(TechnicalIndicators::calculateCCI(flat_candles, 5).value(), 0.0));

    const auto rising = makeCandles(prices);
    // 최근 5봉: 고가 11, 저가 5, 종가 10
    assert(near(TechnicalIndicators::calculateWilliamsR(rising, 5).value(), -100.0 / 6.0));
    std::vector<sigscan::Candle> doji(3, sigscan::Candle(5.0, 5.0, 5.0, 5.0, 1.0, 0, 59999));
    assert(near(TechnicalIndicators::calculateWilliamsR(doji, 3).value(), -50.0));

    // 9. Keltner / Donchian
    std::vector<sigscan::Candle> steady;
    for (int i = 0; i < 30; ++i) {
        steady.emplace_back(10.0, 11.0, 9.0, 10.0, 1.0, i * 60000LL, i * 60000LL + 59999);
    }
    const auto keltner = TechnicalIndicators::calculateKeltner(steady, 20, 10, 2.0);
    assert(keltner.has_value());
    assert(near(keltner->middle, 10.0));
    assert(near(keltner->upper, 14.0));
    assert(near(keltner->lower, 6.0));
    assert(!TechnicalIndicators::calculateKeltner(makeCandles({1, 2, 3}), 20, 10, 2.0).has_value());
    const auto keltner_series = TechnicalIndicators::keltnerSeries(steady, 20, 10, 2.0);
    assert(TechnicalIndicators::leadingZeros(keltner_series.middle) == 19);

    const auto donchian = TechnicalIndicators::calculateDonchian(rising, 5);
    assert(donchian.has_value());
    assert(near(donchian->upper, 11.0));
    assert(near(donchian->lower, 5.0));
    assert(near(donchian->middle, 8.0));
    const auto donchian_series = TechnicalIndicators::donchianSeries(rising, 5);
    assert(near(donchian_series.upper.back(), donchian->upper));
    assert(near(donchian_series.upper[3], 0.0));
    assert(near(donchian_series.upper[4], 6.0));

    // 10. OBV / 거래량 변화율
    std::vector<sigscan::Candle> obv_candles;
    const double obv_closes[] = {10, 11, 10, 12};
    for (int i = 0; i < 4; ++i) {
        obv_candles.emplace_back(obv_closes[i], obv_closes[i], obv_closes[i], obv_closes[i],
                                 static_cast<double>(i + 1), i * 60000LL, i * 60000LL + 59999);
    }
    assert(near(TechnicalIndicators::calculateOBV(obv_candles).value(), 3.0));
    const auto obv = TechnicalIndicators::obvSeries(obv_candles);
    assert(near(obv[1], 2.0) && near(obv[2], -1.0));
    assert(!TechnicalIndicators::calculateOBV(makeCandles({1})).has_value());

    std::vector<sigscan::Candle> volume_candles;
    const double volumes[] = {10, 10, 10, 40};
    for (int i = 0; i < 4; ++i) {
        volume_candles.emplace_back(1.0, 1.0, 1.0, 1.0, volumes[i], i * 60000LL, i * 60000LL + 59999);
    }
    assert(near(TechnicalIndicators::calculateVolumeChange(volume_candles, 2).value(), 60.0));
    assert(near(TechnicalIndicators::volumeChangeSeries(volume_candles, 2)[2], 0.0));
    assert(!TechnicalIndicators::calculateVolumeChange(volume_candles, 4).has_value());

    // 11. ADX / Aroon
    std::vector<sigscan::Candle> uptrend;
    for (int i = 0; i < 30; ++i) {
        uptrend.emplace_back(i + 0.5, i + 1.0, static_cast<double>(i), i + 0.5, 1.0, i * 60000LL, i * 60000LL + 59999);
    }
    assert(near(TechnicalIndicators::calculateADX(uptrend, 14).value(), 100.0));
    assert(!TechnicalIndicators::calculateADX(makeCandles({1, 2, 3}), 14).has_value());
    const auto adx = TechnicalIndicators::adxSeries(uptrend, 14);
    assert(TechnicalIndicators::leadingZeros(adx) == 27);

    const auto aroon = TechnicalIndicators::calculateAroon(rising, 5);
    assert(aroon.has_value());
    assert(near(aroon->up, 100.0));
    assert(near(aroon->down, 20.0));
    // 같은 고가가 반복되면 더 오래된 봉 기준
    const auto aroon_flat = TechnicalIndicators::calculateAroon(flat_candles, 5);
    assert(near(aroon_flat->up, 20.0));
    assert(near(aroon_flat->down, 20.0));

    std::cout << "[TEST] TechnicalIndicators Test PASSED!" << std::endl;
    return 0;
}
