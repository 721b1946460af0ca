#include "sim/simulator.hpp"
#include "sim/account.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace sim {

DailyRecords simulate(const PriceSeries& prices,
                      const std::vector<double>& rsi,
                      const std::vector<Signal>& signals,
                      const SimParams& params){
    if (prices.empty())
        throw ComputationPrecondition("simulate: empty price series");
    if (rsi.size() != prices.size() || signals.size() != prices.size())
        throw ComputationPrecondition("simulate: indicator/signal series not aligned with prices");

    Account acct(params.initial_cash, params.fee_rate);
    DailyRecords out;
    out.reserve(prices.size());
    double prev_value = params.initial_cash;

    for (std::size_t i=0;i<prices.size();++i){
        const auto& p = prices[i];
        const Signal sig = signals[i];
        TradeAction trade = TradeAction::None;

        if (sig == Signal::Buy && acct.position() == Position::Flat){
            if (acct.buy(p.close)){
                trade = TradeAction::Buy;
                spdlog::debug("{} BUY {} @ {:.2f} fee={:.2f} cash={:.2f}",
                              p.date, acct.shares(), p.close, acct.last_fee(), acct.cash());
            }
        } else if (sig == Signal::Sell && acct.position() == Position::Long){
            const auto qty = acct.shares();
            if (acct.sell(p.close)){
                trade = TradeAction::Sell;
                spdlog::debug("{} SELL {} @ {:.2f} fee={:.2f} cash={:.2f}",
                              p.date, qty, p.close, acct.last_fee(), acct.cash());
            }
        }

        const double value = acct.value(p.close);
        const double ret = (prev_value != 0.0 ? (value - prev_value) / prev_value : 0.0);

        DailyRecord r;
        r.date = p.date;
        r.close = p.close;
        r.rsi = rsi[i];
        r.signal = sig;
        r.trade = trade;
        r.portfolio_value = value;
        r.daily_return = ret;
        r.cash = acct.cash();
        r.shares = acct.shares();
        r.cumulative_fees = acct.fees_paid();
        r.position = acct.position();
        out.push_back(std::move(r));

        prev_value = value;
    }
    return out;
}

} // namespace sim
