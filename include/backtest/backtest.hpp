#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "data/price_source.hpp"
#include "sim/simulator.hpp"
#include "metrics/performance.hpp"

namespace backtest {

struct Params {
    std::size_t rsi_period{14};
    double overbought{70.0};
    double oversold{30.0};
    double initial_capital{10000.0};
    double fee_rate{0.001};   // hányad, nem százalék
};

struct Result {
    sim::DailyRecords records;
    metrics::PerformanceMetrics metrics;
    std::vector<double> buy_and_hold;   // a records-szal párhuzamos értékgörbe
};

// InputValidationError, ha bármelyik paraméter a tartományán kívül esik:
// tőke > 0, díj >= 0, periódus >= 1, 0 < oversold < overbought < 100.
void validate(const Params& p);

// Letölti a sorozatot; üres eredmény -> NoDataError(symbol), még az RSI előtt.
PriceSeries fetch_prices(data::PriceSource& source, const std::string& symbol,
                         const std::string& start, const std::string& end);

// RSI -> jelek -> szimuláció -> metrikák. Tiszta függvény: azonos bemenetre
// bitre azonos eredményt ad, és nem tart meg állapotot a hívások között.
Result run_backtest(const PriceSeries& prices, const Params& p);

} // namespace backtest
