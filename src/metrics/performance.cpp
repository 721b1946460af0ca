#include "metrics/performance.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace metrics {

std::vector<double> running_max(const std::vector<double>& v){
    std::vector<double> out(v.size());
    double m = 0.0;
    for (std::size_t i=0;i<v.size();++i){
        m = (i==0 ? v[0] : std::max(m, v[i]));
        out[i] = m;
    }
    return out;
}

std::vector<double> drawdowns(const std::vector<double>& v){
    const auto peak = running_max(v);
    std::vector<double> out(v.size(), 0.0);
    for (std::size_t i=0;i<v.size();++i)
        out[i] = (peak[i] != 0.0 ? (v[i] - peak[i]) / peak[i] : 0.0);
    return out;
}

double max_drawdown(const std::vector<double>& v){
    if (v.empty()) return 0.0;
    const auto dd = drawdowns(v);
    return *std::min_element(dd.begin(), dd.end());
}

double mean(const std::vector<double>& v){
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double sample_stddev(const std::vector<double>& v){
    if (v.size() < 2) return 0.0;
    const double m = mean(v);
    double ss = 0.0;
    for (double x : v){ const double d = x - m; ss += d*d; }
    return std::sqrt(ss / static_cast<double>(v.size() - 1));
}

double annualized_volatility(const std::vector<double>& r){
    return sample_stddev(r) * std::sqrt(kTradingDaysPerYear);
}

double sharpe_ratio(const std::vector<double>& r, double vol){
    if (vol == 0.0) return 0.0;
    return (mean(r) * kTradingDaysPerYear - kRiskFreeRate) / vol;
}

std::vector<double> pct_change(const std::vector<double>& v){
    std::vector<double> out(v.size(), 0.0);
    for (std::size_t i=1;i<v.size();++i)
        out[i] = (v[i-1] != 0.0 ? v[i] / v[i-1] - 1.0 : 0.0);
    return out;
}

std::vector<double> buy_and_hold_values(const std::vector<double>& closes, double c0){
    std::vector<double> out;
    if (closes.empty()) return out;
    out.reserve(closes.size());
    const double first = closes.front();
    for (double c : closes) out.push_back(c0 * (c / first));
    return out;
}

std::vector<double> portfolio_values(const sim::DailyRecords& records){
    std::vector<double> out; out.reserve(records.size());
    for (const auto& r : records) out.push_back(r.portfolio_value);
    return out;
}

std::vector<double> strategy_returns(const sim::DailyRecords& records){
    std::vector<double> out; out.reserve(records.size());
    for (const auto& r : records) out.push_back(r.daily_return);
    return out;
}

long count_trades(const sim::DailyRecords& records){
    return static_cast<long>(std::count_if(records.begin(), records.end(),
        [](const sim::DailyRecord& r){ return r.trade != TradeAction::None; }));
}

static SeriesMetrics summarize(const std::vector<double>& values,
                               const std::vector<double>& returns,
                               double c0){
    SeriesMetrics m;
    m.final_value  = values.back();
    m.total_return = m.final_value / c0 - 1.0;
    m.max_drawdown = max_drawdown(values);
    m.volatility   = annualized_volatility(returns);
    m.sharpe_ratio = sharpe_ratio(returns, m.volatility);
    return m;
}

PerformanceMetrics compute(const sim::DailyRecords& records, double c0){
    if (records.empty()) throw ComputationPrecondition("metrics: empty record sequence");
    if (!(c0 > 0.0)) throw ComputationPrecondition("metrics: initial capital must be positive");

    PerformanceMetrics pm;
    pm.strategy = summarize(portfolio_values(records), strategy_returns(records), c0);
    pm.strategy.trades = count_trades(records);
    pm.strategy.fees_paid = records.back().cumulative_fees;

    std::vector<double> closes; closes.reserve(records.size());
    for (const auto& r : records) closes.push_back(r.close);
    pm.buy_and_hold = summarize(buy_and_hold_values(closes, c0), pct_change(closes), c0);
    return pm;
}

} // namespace metrics
