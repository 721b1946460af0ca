#pragma once
#include <optional>
#include <vector>
#include "sim/simulator.hpp"

namespace metrics {

constexpr double kTradingDaysPerYear = 252.0;
constexpr double kRiskFreeRate = 0.01;   // évesített, fix

// Egy értékgörbe összesítése. trades / fees_paid üres, ha a fogalom nem
// értelmezett (buy-and-hold), ami nem ugyanaz, mint a nulla.
struct SeriesMetrics {
    double final_value{0.0};
    double total_return{0.0};
    double max_drawdown{0.0};   // <= 0
    double volatility{0.0};     // évesített
    double sharpe_ratio{0.0};
    std::optional<long> trades;
    std::optional<double> fees_paid;
};

struct PerformanceMetrics {
    SeriesMetrics strategy;
    SeriesMetrics buy_and_hold;
};

// Bővülő prefix-maximum
std::vector<double> running_max(const std::vector<double>& values);
// (v[t] - max[t]) / max[t]
std::vector<double> drawdowns(const std::vector<double>& values);
double max_drawdown(const std::vector<double>& values);

double mean(const std::vector<double>& v);
// Korrigált (n-1) szórás; két elemnél kevesebbre 0
double sample_stddev(const std::vector<double>& v);
double annualized_volatility(const std::vector<double>& daily_returns);
// 0, ha a volatilitás 0
double sharpe_ratio(const std::vector<double>& daily_returns, double volatility);

// Napi százalékos változás, az első nap 0
std::vector<double> pct_change(const std::vector<double>& v);

// C0 * close[t] / close[0]
std::vector<double> buy_and_hold_values(const std::vector<double>& closes, double initial_capital);

std::vector<double> portfolio_values(const sim::DailyRecords& records);
std::vector<double> strategy_returns(const sim::DailyRecords& records);
long count_trades(const sim::DailyRecords& records);

PerformanceMetrics compute(const sim::DailyRecords& records, double initial_capital);

} // namespace metrics
