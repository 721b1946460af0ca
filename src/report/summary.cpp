#include "report/summary.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace report {

static const char* kNotApplicable = "N/A";

std::string money(double v){
    std::string digits = fmt::format("{:.2f}", std::abs(v));
    const auto dot = digits.find('.');
    std::string int_part = digits.substr(0, dot);
    std::string grouped;
    for (std::size_t i=0;i<int_part.size();++i){
        if (i>0 && (int_part.size()-i)%3==0) grouped.push_back(',');
        grouped.push_back(int_part[i]);
    }
    const bool neg = v < 0.0 && digits != "0.00";
    return fmt::format("${}{}{}", neg ? "-" : "", grouped, digits.substr(dot));
}

std::string percent(double ratio){
    return fmt::format("{:.2f}%", ratio * 100.0);
}

std::vector<SummaryRow> summary_rows(const metrics::PerformanceMetrics& m){
    const auto& s = m.strategy;
    const auto& b = m.buy_and_hold;
    auto opt_trades = [](const metrics::SeriesMetrics& x){
        return x.trades ? std::to_string(*x.trades) : std::string(kNotApplicable);
    };
    auto opt_fees = [](const metrics::SeriesMetrics& x){
        return x.fees_paid ? money(*x.fees_paid) : std::string(kNotApplicable);
    };
    return {
        {"Portfolio Value",  money(s.final_value),                 money(b.final_value)},
        {"Total Return",     percent(s.total_return),              percent(b.total_return)},
        {"Max. Drawdown",    percent(s.max_drawdown),              percent(b.max_drawdown)},
        {"Volatility",       percent(s.volatility),                percent(b.volatility)},
        {"Sharpe Ratio",     fmt::format("{:.2f}", s.sharpe_ratio), fmt::format("{:.2f}", b.sharpe_ratio)},
        {"Fees Paid",        opt_fees(s),                          opt_fees(b)},
        {"Number of Trades", opt_trades(s),                        opt_trades(b)},
    };
}

std::string render_table(const std::vector<SummaryRow>& rows){
    std::size_t w0 = 0, w1 = std::string("RSI-Strategy").size(), w2 = std::string("Buy-n-Hold").size();
    for (const auto& r : rows){
        w0 = std::max(w0, r.label.size() + 1);
        w1 = std::max(w1, r.strategy.size());
        w2 = std::max(w2, r.baseline.size());
    }
    std::string out = fmt::format("{:<{}}  {:>{}}  {:>{}}\n", "", w0, "RSI-Strategy", w1, "Buy-n-Hold", w2);
    out += std::string(w0 + w1 + w2 + 4, '-') + "\n";
    for (const auto& r : rows)
        out += fmt::format("{:<{}}  {:>{}}  {:>{}}\n", r.label + ":", w0, r.strategy, w1, r.baseline, w2);
    return out;
}

std::string trade_log(const sim::DailyRecords& records){
    std::string out;
    std::int64_t prev_shares = 0;
    for (const auto& r : records){
        if (r.trade != TradeAction::None){
            const auto qty = (r.trade == TradeAction::Buy ? r.shares : prev_shares);
            out += fmt::format("{}  {:<4}  {:>6} @ {:>10.2f}  RSI {:>6.2f}  fees {}\n",
                               r.date, to_string(r.trade), qty, r.close, r.rsi, money(r.cumulative_fees));
        }
        prev_shares = r.shares;
    }
    return out;
}

} // namespace report
