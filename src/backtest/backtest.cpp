#include "backtest/backtest.hpp"
#include "core/errors.hpp"
#include "indicators/rsi.hpp"
#include "strategy/signals.hpp"
#include <cmath>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace backtest {

void validate(const Params& p){
    if (!(p.initial_capital > 0.0) || !std::isfinite(p.initial_capital))
        throw InputValidationError(fmt::format("Starting capital must be positive (got {}).", p.initial_capital));
    if (!(p.fee_rate >= 0.0) || !std::isfinite(p.fee_rate))
        throw InputValidationError(fmt::format("Fee percentage cannot be negative (got {}).", p.fee_rate));
    if (p.rsi_period < 1)
        throw InputValidationError("RSI period must be at least 1.");
    if (!(p.overbought > 0.0 && p.overbought < 100.0))
        throw InputValidationError(fmt::format("RSI Overbought level must be between 0 and 100 (got {}).", p.overbought));
    if (!(p.oversold > 0.0 && p.oversold < 100.0))
        throw InputValidationError(fmt::format("RSI Oversold level must be between 0 and 100 (got {}).", p.oversold));
    if (p.oversold >= p.overbought)
        throw InputValidationError("RSI Oversold level must be less than RSI Overbought level.");
}

PriceSeries fetch_prices(data::PriceSource& source, const std::string& symbol,
                         const std::string& start, const std::string& end){
    auto prices = source.fetch(symbol, start, end);
    if (prices.empty()){
        spdlog::warn("{}: no data for {} [{}, {})", source.id(), symbol, start, end);
        throw NoDataError(symbol);
    }
    return prices;
}

Result run_backtest(const PriceSeries& prices, const Params& p){
    validate(p);
    if (prices.empty()) throw ComputationPrecondition("run_backtest: empty price series");

    const auto rsi = ind::compute_rsi(prices, p.rsi_period);
    const auto sig = strategy::generate_signals(rsi, strategy::Thresholds{p.overbought, p.oversold});

    Result res;
    res.records = sim::simulate(prices, rsi, sig, sim::SimParams{p.initial_capital, p.fee_rate});
    res.metrics = metrics::compute(res.records, p.initial_capital);
    res.buy_and_hold = metrics::buy_and_hold_values(closes_of(prices), p.initial_capital);

    spdlog::info("backtest {}..{}: {} days, {} trades, final {:.2f} (buy&hold {:.2f})",
                 prices.front().date, prices.back().date, prices.size(),
                 res.metrics.strategy.trades.value_or(0),
                 res.metrics.strategy.final_value, res.metrics.buy_and_hold.final_value);
    return res;
}

} // namespace backtest
