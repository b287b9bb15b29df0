#pragma once

#include <optional>
#include <vector>
#include "common/Types.h"

namespace sigscan {
namespace analytics {

// Technical Indicators
//
// 두 가지 형태를 제공한다:
//  - latest: 마지막 값만 반환. 데이터가 warm-up 길이보다 짧으면 std::nullopt
//  - series: 입력과 같은 길이의 벡터. warm-up 구간은 0으로 채워진다.
//    캔들과 위치를 맞추기 전에 호출자가 앞쪽 0을 잘라내야 한다.
//
// 어떤 함수도 데이터 부족으로 예외를 던지지 않는다.
class TechnicalIndicators {
public:
    struct MACDResult {
        double macd;
        double signal;
        double histogram;

        MACDResult() : macd(0), signal(0), histogram(0) {}
    };

    struct MACDSeries {
        std::vector<double> macd;
        std::vector<double> signal;
        std::vector<double> histogram;
    };

    struct BollingerBands {
        double upper;
        double middle;
        double lower;
        double width;       // (upper - lower) / middle
        double percent_b;   // 마지막 가격의 밴드 내 위치 (0~1)

        BollingerBands() : upper(0), middle(0), lower(0), width(0), percent_b(0) {}
    };

    struct BollingerSeries {
        std::vector<double> upper;
        std::vector<double> middle;
        std::vector<double> lower;
    };

    struct StochasticResult {
        double k;
        double d;

        StochasticResult() : k(0), d(0) {}
    };

    struct StochasticSeries {
        std::vector<double> k;
        std::vector<double> d;
    };

    // Keltner / Donchian 공용
    struct Channel {
        double upper;
        double middle;
        double lower;

        Channel() : upper(0), middle(0), lower(0) {}
    };

    struct ChannelSeries {
        std::vector<double> upper;
        std::vector<double> middle;
        std::vector<double> lower;
    };

    struct AroonResult {
        double up;
        double down;

        AroonResult() : up(0), down(0) {}
    };

    struct AroonSeries {
        std::vector<double> up;
        std::vector<double> down;
    };

    // ===== latest =====
    static std::optional<double> calculateSMA(const std::vector<double>& prices, int period);
    static std::optional<double> calculateEMA(const std::vector<double>& prices, int period);

    // RSI (Wilder). 70 이상 과매수, 30 이하 과매도
    static std::optional<double> calculateRSI(const std::vector<double>& prices, int period = 14);

    static std::optional<MACDResult> calculateMACD(const std::vector<double>& prices,
                                                   int fast = 12, int slow = 26, int signal_period = 9);

    static std::optional<BollingerBands> calculateBollingerBands(const std::vector<double>& prices,
                                                                 int period = 20,
                                                                 double std_dev_mult = 2.0);

    static std::optional<double> calculateATR(const std::vector<Candle>& candles, int period = 14);

    static std::optional<StochasticResult> calculateStochastic(const std::vector<Candle>& candles,
                                                               int k_period = 14,
                                                               int d_period = 3);

    static std::optional<double> calculateVWAP(const std::vector<Candle>& candles);
    static std::optional<double> calculateAvgVolume(const std::vector<Candle>& candles, int period);
    static std::optional<double> calculateHighestHigh(const std::vector<Candle>& candles, int period);
    static std::optional<double> calculateLowestLow(const std::vector<Candle>& candles, int period);

    static std::optional<double> calculateWMA(const std::vector<double>& prices, int period);
    static std::optional<double> calculateROC(const std::vector<double>& prices, int period = 10);
    static std::optional<double> calculateCCI(const std::vector<Candle>& candles, int period = 20);
    static std::optional<double> calculateWilliamsR(const std::vector<Candle>& candles, int period = 14);

    // EMA(close) 중심선 +- ATR * multiplier
    static std::optional<Channel> calculateKeltner(const std::vector<Candle>& candles,
                                                   int period = 20, int atr_period = 10,
                                                   double multiplier = 2.0);
    static std::optional<Channel> calculateDonchian(const std::vector<Candle>& candles, int period = 20);

    static std::optional<double> calculateOBV(const std::vector<Candle>& candles);

    // Wilder ADX. 25 이상이면 추세 구간
    static std::optional<double> calculateADX(const std::vector<Candle>& candles, int period = 14);
    static std::optional<AroonResult> calculateAroon(const std::vector<Candle>& candles, int period = 25);

    // 마지막 거래량과 최근 period개 평균의 차이 (%)
    static std::optional<double> calculateVolumeChange(const std::vector<Candle>& candles, int period = 20);

    // 직전 음봉을 현재 양봉이 완전히 감싸는 경우
    static bool detectBullishEngulfing(const std::vector<Candle>& candles);
    static bool detectBearishEngulfing(const std::vector<Candle>& candles);

    // ===== series =====
    static std::vector<double> smaSeries(const std::vector<double>& prices, int period);
    static std::vector<double> emaSeries(const std::vector<double>& prices, int period);
    static std::vector<double> rsiSeries(const std::vector<double>& prices, int period = 14);
    static MACDSeries macdSeries(const std::vector<double>& prices,
                                 int fast = 12, int slow = 26, int signal_period = 9);
    static BollingerSeries bollingerSeries(const std::vector<double>& prices,
                                           int period = 20, double std_dev_mult = 2.0);
    static std::vector<double> atrSeries(const std::vector<Candle>& candles, int period = 14);
    static StochasticSeries stochasticSeries(const std::vector<Candle>& candles,
                                             int k_period = 14, int d_period = 3);
    static std::vector<double> vwapSeries(const std::vector<Candle>& candles);
    static std::vector<double> avgVolumeSeries(const std::vector<Candle>& candles, int period);
    static std::vector<double> wmaSeries(const std::vector<double>& prices, int period);
    static std::vector<double> rocSeries(const std::vector<double>& prices, int period = 10);
    static std::vector<double> cciSeries(const std::vector<Candle>& candles, int period = 20);
    static std::vector<double> williamsRSeries(const std::vector<Candle>& candles, int period = 14);
    static ChannelSeries keltnerSeries(const std::vector<Candle>& candles,
                                       int period = 20, int atr_period = 10, double multiplier = 2.0);
    static ChannelSeries donchianSeries(const std::vector<Candle>& candles, int period = 20);
    static std::vector<double> obvSeries(const std::vector<Candle>& candles);
    static std::vector<double> adxSeries(const std::vector<Candle>& candles, int period = 14);
    static AroonSeries aroonSeries(const std::vector<Candle>& candles, int period = 25);
    static std::vector<double> volumeChangeSeries(const std::vector<Candle>& candles, int period = 20);

    // Helper: 가격 배열 추출
    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    static std::vector<double> extractVolumes(const std::vector<Candle>& candles);

    // Helper: 앞쪽 warm-up 0 개수
    static size_t leadingZeros(const std::vector<double>& series);

private:
    static double calculateMean(const std::vector<double>& values, size_t begin, size_t end);
    static double calculateStandardDeviation(const std::vector<double>& values,
                                             size_t begin, size_t end, double mean);
    static std::vector<double> trueRanges(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace sigscan
