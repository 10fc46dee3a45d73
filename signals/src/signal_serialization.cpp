#include "signal_serialization.hpp"
#include "utils.hpp"

namespace signals {

    namespace {

        template <typename T>
        json optionalToJson(const std::optional<T>& value) {
            return value ? json(*value) : json(nullptr);
        }

        json toJson(const core::MarketSnapshot& market) {
            return json{
                {"current_price", market.current_price},
                {"volume", market.volume},
                {"relative_volume", market.relative_volume},
                {"price_change_pct", market.price_change_pct},
                {"gap_pct", market.gap_pct},
                {"week52_high", optionalToJson(market.week52_high)},
                {"week52_low", optionalToJson(market.week52_low)}
            };
        }

        json toJson(const core::FundamentalSummary& fundamentals) {
            return json{
                {"float_shares", optionalToJson(fundamentals.float_shares)},
                {"shares_outstanding", optionalToJson(fundamentals.shares_outstanding)},
                {"market_cap", optionalToJson(fundamentals.market_cap)},
                {"sector", fundamentals.sector},
                {"industry", fundamentals.industry},
                {"short_interest_pct", fundamentals.short_interest_pct}
            };
        }

        json toJson(const core::NewsSummary& news) {
            json latest = news.latest_catalyst_time
                ? json(core::utils::timestampToString(*news.latest_catalyst_time))
                : json(nullptr);
            return json{
                {"avg_sentiment", news.avg_sentiment},
                {"sentiment_confidence", news.sentiment_confidence},
                {"catalyst_detected", news.catalyst_detected},
                {"catalyst_types", news.catalyst_types},
                {"catalyst_score", news.catalyst_score},
                {"catalyst_confidence", news.catalyst_confidence},
                {"news_momentum_score", news.news_momentum_score},
                {"latest_catalyst_time", latest},
                {"total_articles", news.total_articles},
                {"negative_articles", news.negative_articles},
                {"urgency", core::utils::toString(news.urgency)}
            };
        }

    } // end anonymous namespace

    json toJson(const scoring::ComponentScore& component) {
        return json{
            {"component", component.component},
            {"raw_score", component.raw_score},
            {"weight", component.weight},
            {"weighted_score", component.weighted_score},
            {"confidence", component.confidence},
            {"details", component.details}
        };
    }

    json toJson(const scoring::CompositeScore& composite) {
        json components = json::array();
        for (const auto& component : composite.components) {
            components.push_back(toJson(component));
        }
        return json{
            {"symbol", composite.symbol},
            {"overall_score", composite.overall_score},
            {"component_scores", components},
            {"confidence_level", composite.confidence_level},
            {"risk_level", scoring::toString(composite.risk_level)},
            {"signal_strength", scoring::toString(composite.signal_strength)},
            {"recommendation", scoring::toString(composite.recommendation)},
            {"entry_price", optionalToJson(composite.entry_price)},
            {"stop_loss", optionalToJson(composite.stop_loss)},
            {"take_profit", optionalToJson(composite.take_profit)},
            {"time_horizon", scoring::toString(composite.time_horizon)},
            {"urgency", scoring::toString(composite.urgency)},
            {"notes", composite.notes}
        };
    }

    json toJson(const scoring::RossScore& ross) {
        return json{
            {"pillar_volume", ross.volume},
            {"pillar_price_change", ross.price_change},
            {"pillar_float", ross.float_size},
            {"pillar_catalyst", ross.catalyst},
            {"pillar_price_range", ross.price_range},
            {"overall_ross_score", ross.overall},
            {"ross_grade", ross.grade}
        };
    }

    json toJson(const scoring::TechnicalSnapshot& technical) {
        return json{
            {"macd_line", technical.macd_line},
            {"macd_signal", technical.macd_signal},
            {"macd_histogram", technical.macd_histogram},
            {"ema_9", technical.ema_9},
            {"ema_20", technical.ema_20},
            {"rsi", technical.rsi},
            {"volatility", technical.volatility},
            {"relative_volume", technical.relative_volume},
            {"support_levels", technical.support_levels},
            {"resistance_levels", technical.resistance_levels},
            {"patterns_detected", technical.patterns_detected}
        };
    }

    json toJson(const TradingSignal& signal) {
        json expiry = signal.getExpiryTime()
            ? json(core::utils::timestampToString(*signal.getExpiryTime()))
            : json(nullptr);

        return json{
            {"symbol", signal.getSymbol()},
            {"signal_id", signal.getSignalId()},
            {"timestamp", core::utils::timestampToString(signal.getTimestamp())},
            {"composite_score", toJson(signal.getCompositeScore())},
            {"ross_score", toJson(signal.getRossScore())},
            {"signal_type", scoring::toString(signal.getSignalType())},
            {"signal_strength", scoring::toString(signal.getSignalStrength())},
            {"confidence", signal.getConfidence()},
            {"entry_price", optionalToJson(signal.getEntryPrice())},
            {"stop_loss", optionalToJson(signal.getStopLoss())},
            {"take_profit", optionalToJson(signal.getTakeProfit())},
            {"position_size", optionalToJson(signal.getPositionSize())},
            {"risk_reward_ratio", optionalToJson(signal.getRiskRewardRatio())},
            {"time_horizon", scoring::toString(signal.getTimeHorizon())},
            {"urgency", scoring::toString(signal.getUrgency())},
            {"expiry_time", expiry},
            {"market_data", toJson(signal.getMarket())},
            {"fundamental_analysis", toJson(signal.getFundamentals())},
            {"technical_analysis", toJson(signal.getTechnical())},
            {"news_analysis", toJson(signal.getNews())},
            {"alerts", signal.getAlerts()},
            {"risk_warnings", signal.getRiskWarnings()},
            {"notes", signal.getNotes()}
        };
    }

    json toJson(const SignalSummary& summary) {
        return json{
            {"total_signals", summary.total_signals},
            {"strong_buy_signals", summary.strong_buy_signals},
            {"buy_signals", summary.buy_signals},
            {"hold_signals", summary.hold_signals},
            {"sell_signals", summary.sell_signals},
            {"avg_score", summary.avg_score},
            {"avg_confidence", summary.avg_confidence},
            {"top_symbols", summary.top_symbols},
            {"risk_distribution", summary.risk_distribution}
        };
    }

} // namespace signals
