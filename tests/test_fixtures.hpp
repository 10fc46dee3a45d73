#pragma once

#include "datatypes.hpp"
#include "scoring_types.hpp"
#include <chrono>
#include <functional>
#include <vector>

// Deterministic candle series and input summaries shared by the test executables
namespace fixtures {

    // 2024-01-02T14:30:00Z
    inline core::Timestamp baseTime() {
        return std::chrono::system_clock::from_time_t(1704205800);
    }

    // One candle per day; high/low sit `spread` above/below the close
    inline core::TimeSeries<core::Candle> candlesFromCloses(const std::vector<double>& closes,
                                                            double spread = 0.5,
                                                            long long volume = 1000)
    {
        core::TimeSeries<core::Candle> candles;
        candles.reserve(closes.size());
        for (size_t i = 0; i < closes.size(); ++i) {
            core::Candle c;
            c.timestamp = baseTime() + std::chrono::hours(24 * static_cast<int>(i));
            c.open = closes[i];
            c.close = closes[i];
            c.high = closes[i] + spread;
            c.low = closes[i] - spread;
            c.volume = volume;
            candles.push_back(c);
        }
        return candles;
    }

    inline std::vector<double> generate(size_t count, const std::function<double(size_t)>& f) {
        std::vector<double> values(count);
        for (size_t i = 0; i < count; ++i) {
            values[i] = f(i);
        }
        return values;
    }

    // 10-bar triangle wave: troughs of 10 at multiples of 10, peaks of 20 five bars later
    inline std::vector<double> triangleWave(size_t count) {
        return generate(count, [](size_t i) {
            const size_t phase = i % 10;
            return phase <= 5 ? 10.0 + 2.0 * phase : 20.0 - 2.0 * (phase - 5);
        });
    }

    inline std::vector<double> risingLine(size_t count, double start = 100.0, double step = 1.0) {
        return generate(count, [start, step](size_t i) { return start + step * i; });
    }

    // --- Screening inputs ---

    // Low-float runner with a fresh earnings catalyst
    struct RunnerInputs {
        core::MarketSnapshot market;
        core::FundamentalSummary fundamentals;
        scoring::TechnicalSnapshot technical;
        core::NewsSummary news;
        core::PortfolioSnapshot portfolio;
        core::Timestamp as_of = baseTime();
    };

    inline RunnerInputs lowFloatRunner() {
        RunnerInputs in;
        in.market.current_price = 3.84;
        in.market.volume = 45'000'000;
        in.market.relative_volume = 47.56;
        in.market.price_change_pct = 135.58;
        in.market.gap_pct = 50.0;

        in.fundamentals.float_shares = 1'300'000;
        in.fundamentals.shares_outstanding = 20'000'000;
        in.fundamentals.market_cap = 50'000'000;
        in.fundamentals.sector = "Technology";
        in.fundamentals.short_interest_pct = 25.0;

        in.technical.macd_line = 0.2;
        in.technical.macd_signal = 0.1;
        in.technical.macd_histogram = 0.1;
        in.technical.ema_9 = 3.5;
        in.technical.ema_20 = 3.0;
        in.technical.rsi = 65.0;
        in.technical.volatility = 0.2;
        in.technical.relative_volume = 47.56;
        in.technical.support_levels = {3.80};
        in.technical.resistance_levels = {4.50};
        in.technical.patterns_detected = {"abcd_bullish"};

        in.news.avg_sentiment = 0.675;
        in.news.sentiment_confidence = 0.8;
        in.news.catalyst_detected = true;
        in.news.catalyst_types = {"earnings_beat"};
        in.news.catalyst_score = 70.0;
        in.news.catalyst_confidence = 0.9;
        in.news.news_momentum_score = 80.0;
        in.news.latest_catalyst_time = in.as_of - std::chrono::minutes(30);
        in.news.total_articles = 10;
        in.news.negative_articles = 0;
        in.news.urgency = core::NewsUrgency::High;

        in.portfolio.account_value = 100'000.0;
        in.portfolio.available_cash = 50'000.0;
        return in;
    }

    // Mega-cap drifting on light volume with no news
    inline RunnerInputs quietMegaCap() {
        RunnerInputs in;
        in.market.current_price = 185.50;
        in.market.volume = 40'000'000;
        in.market.relative_volume = 0.8;
        in.market.price_change_pct = 1.2;
        in.market.gap_pct = 0.3;

        in.fundamentals.float_shares = 15'000'000'000.0;
        in.fundamentals.shares_outstanding = 15'500'000'000.0;
        in.fundamentals.market_cap = 2'900'000'000'000.0;
        in.fundamentals.sector = "Technology";
        in.fundamentals.short_interest_pct = 0.7;

        in.technical.macd_line = 1.0;
        in.technical.macd_signal = 1.2;
        in.technical.macd_histogram = -0.2;
        in.technical.ema_9 = 184.0;
        in.technical.ema_20 = 182.0;
        in.technical.rsi = 55.0;
        in.technical.volatility = 0.22;
        in.technical.relative_volume = 0.8;
        in.technical.support_levels = {180.0};
        in.technical.resistance_levels = {195.0};

        in.news.avg_sentiment = 0.1;
        in.news.sentiment_confidence = 0.6;
        in.news.catalyst_detected = false;
        in.news.catalyst_score = 0.0;
        in.news.catalyst_confidence = 0.5;
        in.news.news_momentum_score = 20.0;
        in.news.urgency = core::NewsUrgency::Low;

        in.portfolio.account_value = 100'000.0;
        return in;
    }

} // namespace fixtures
