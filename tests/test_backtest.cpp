#include <gtest/gtest.h>
#include <cmath>
#include <cstring>
#include <string>
#include <utility>
#include <fmt/format.h>
#include "backtest/backtest.hpp"
#include "core/dates.hpp"
#include "core/errors.hpp"
#include "data/price_source.hpp"

namespace {

PriceSeries make_series(const std::vector<double>& closes){
    PriceSeries s;
    const auto d0 = *dates::parse_ymd("2021-01-04");
    for (std::size_t i=0;i<closes.size();++i)
        s.push_back({dates::format_ymd(d0 + static_cast<std::int64_t>(i)), closes[i]});
    return s;
}

PriceSeries oscillating(int n){
    std::vector<double> c;
    for (int i=0;i<n;++i) c.push_back(100.0 + 12.0 * std::sin(i / 6.0) + 4.0 * std::sin(i / 1.7) + 0.08 * i);
    return make_series(c);
}

backtest::Params params(double capital = 10000.0, double fee = 0.001){
    backtest::Params p;
    p.initial_capital = capital;
    p.fee_rate = fee;
    return p;
}

// Rögzített sorozatot ad vissza és számolja a hívásokat
class FixedSource : public data::PriceSource {
public:
    explicit FixedSource(PriceSeries s) : series(std::move(s)) {}
    std::string id() const override { return "fixed"; }
    PriceSeries fetch(const std::string& symbol, const std::string&, const std::string&) override {
        ++calls; last_symbol = symbol;
        return series;
    }
    PriceSeries series;
    int calls{0};
    std::string last_symbol;
};

bool same_bits(double a, double b){ return std::memcmp(&a, &b, sizeof(double)) == 0; }

} // namespace

TEST(Validate, AcceptsDefaults) {
    EXPECT_NO_THROW(backtest::validate(backtest::Params{}));
}

TEST(Validate, RejectsOutOfDomainParameters) {
    auto p = params();
    p.initial_capital = 0.0;   EXPECT_THROW(backtest::validate(p), InputValidationError);
    p = params(); p.initial_capital = -5.0; EXPECT_THROW(backtest::validate(p), InputValidationError);
    p = params(); p.initial_capital = std::nan(""); EXPECT_THROW(backtest::validate(p), InputValidationError);
    p = params(); p.fee_rate = -0.001; EXPECT_THROW(backtest::validate(p), InputValidationError);
    p = params(); p.rsi_period = 0;   EXPECT_THROW(backtest::validate(p), InputValidationError);
    p = params(); p.overbought = 100.0; EXPECT_THROW(backtest::validate(p), InputValidationError);
    p = params(); p.oversold = 0.0;   EXPECT_THROW(backtest::validate(p), InputValidationError);
    p = params(); p.oversold = 70.0; p.overbought = 70.0; EXPECT_THROW(backtest::validate(p), InputValidationError);
    p = params(); p.oversold = 80.0; p.overbought = 20.0; EXPECT_THROW(backtest::validate(p), InputValidationError);
}

TEST(RunBacktest, ValidationHappensBeforeComputation) {
    auto p = params(-1.0);
    EXPECT_THROW(backtest::run_backtest(PriceSeries{}, p), InputValidationError);
}

TEST(RunBacktest, EmptySeriesIsPrecondition) {
    EXPECT_THROW(backtest::run_backtest(PriceSeries{}, params()), ComputationPrecondition);
}

TEST(FetchPrices, EmptyProviderResultIsNoData) {
    FixedSource src{PriceSeries{}};
    bool reached_backtest = false;
    try {
        const auto prices = backtest::fetch_prices(src, "MSFT", "2020-01-01", "2023-12-31");
        reached_backtest = true;
        backtest::run_backtest(prices, params());
        FAIL() << "expected NoDataError";
    } catch (const NoDataError& e){
        EXPECT_EQ(e.symbol(), "MSFT");
    }
    EXPECT_FALSE(reached_backtest);
    EXPECT_EQ(src.calls, 1);
    EXPECT_EQ(src.last_symbol, "MSFT");
}

TEST(FetchPrices, NonEmptySeriesPassesThrough) {
    FixedSource src{make_series({10.0, 11.0, 12.0})};
    const auto prices = backtest::fetch_prices(src, "AAPL", "", "");
    ASSERT_EQ(prices.size(), 3u);
    EXPECT_DOUBLE_EQ(prices.back().close, 12.0);
}

TEST(RunBacktest, HandDerivedScenario) {
    backtest::Params p;
    p.rsi_period = 2; p.overbought = 70; p.oversold = 30;
    p.initial_capital = 1000; p.fee_rate = 0.0;
    const auto res = backtest::run_backtest(make_series({100, 90, 80, 95, 110}), p);

    ASSERT_EQ(res.records.size(), 5u);
    std::vector<std::size_t> buys, sells;
    for (std::size_t i=0;i<res.records.size();++i){
        if (res.records[i].trade == TradeAction::Buy) buys.push_back(i);
        if (res.records[i].trade == TradeAction::Sell) sells.push_back(i);
    }
    EXPECT_EQ(buys, std::vector<std::size_t>{3});
    EXPECT_TRUE(sells.empty());
    EXPECT_DOUBLE_EQ(res.records.back().portfolio_value, 1150.0);
    EXPECT_DOUBLE_EQ(res.records[3].rsi, 60.0);
    EXPECT_EQ(*res.metrics.strategy.trades, 1);
    EXPECT_DOUBLE_EQ(res.buy_and_hold.back(), 1000.0 * (110.0 / 100.0));
}

TEST(RunBacktest, InvariantsOnLongSeries) {
    const auto prices = oscillating(400);
    const auto p = params(25000.0, 0.0025);
    const auto res = backtest::run_backtest(prices, p);
    ASSERT_EQ(res.records.size(), prices.size());
    ASSERT_GT(*res.metrics.strategy.trades, 1);

    double expected_fees = 0.0;
    std::int64_t prev_shares = 0;
    Position prev_pos = Position::Flat;
    double prev_fees = 0.0;
    for (const auto& r : res.records){
        EXPECT_EQ(r.cash + static_cast<double>(r.shares) * r.close, r.portfolio_value);
        EXPECT_GE(r.cumulative_fees, prev_fees);
        if (r.trade == TradeAction::Buy){
            EXPECT_EQ(prev_pos, Position::Flat);
            EXPECT_EQ(prev_shares, 0);
            EXPECT_EQ(r.signal, Signal::Buy);
            expected_fees += static_cast<double>(r.shares) * r.close * p.fee_rate;
        }
        if (r.trade == TradeAction::Sell){
            EXPECT_EQ(prev_pos, Position::Long);
            EXPECT_GT(prev_shares, 0);
            EXPECT_EQ(r.signal, Signal::Sell);
            expected_fees += static_cast<double>(prev_shares) * r.close * p.fee_rate;
        }
        prev_shares = r.shares;
        prev_pos = r.position;
        prev_fees = r.cumulative_fees;
    }
    EXPECT_NEAR(res.records.back().cumulative_fees, expected_fees, 1e-6);
    EXPECT_DOUBLE_EQ(*res.metrics.strategy.fees_paid, res.records.back().cumulative_fees);
}

TEST(RunBacktest, BuyAndHoldFinalValueIdentity) {
    const auto prices = oscillating(250);
    const auto res = backtest::run_backtest(prices, params(12345.0));
    EXPECT_EQ(res.metrics.buy_and_hold.final_value,
              12345.0 * (prices.back().close / prices.front().close));
    EXPECT_EQ(res.buy_and_hold.size(), prices.size());
}

TEST(RunBacktest, DeterministicAndIndependentRuns) {
    const auto prices = oscillating(300);
    const auto a = backtest::run_backtest(prices, params());
    // közbeeső, eltérő paraméterű futás nem hat a következőre
    auto other = params(500.0, 0.01);
    other.rsi_period = 5;
    (void)backtest::run_backtest(prices, other);
    const auto b = backtest::run_backtest(prices, params());

    ASSERT_EQ(a.records.size(), b.records.size());
    for (std::size_t i=0;i<a.records.size();++i){
        const auto& x = a.records[i];
        const auto& y = b.records[i];
        EXPECT_EQ(x.date, y.date);
        EXPECT_TRUE(same_bits(x.rsi, y.rsi));
        EXPECT_EQ(x.signal, y.signal);
        EXPECT_EQ(x.trade, y.trade);
        EXPECT_TRUE(same_bits(x.portfolio_value, y.portfolio_value));
        EXPECT_TRUE(same_bits(x.daily_return, y.daily_return));
        EXPECT_TRUE(same_bits(x.cash, y.cash));
        EXPECT_EQ(x.shares, y.shares);
        EXPECT_TRUE(same_bits(x.cumulative_fees, y.cumulative_fees));
    }
    EXPECT_TRUE(same_bits(a.metrics.strategy.sharpe_ratio, b.metrics.strategy.sharpe_ratio));
    EXPECT_TRUE(same_bits(a.metrics.strategy.volatility, b.metrics.strategy.volatility));
    EXPECT_TRUE(same_bits(a.metrics.strategy.max_drawdown, b.metrics.strategy.max_drawdown));
    EXPECT_TRUE(same_bits(a.metrics.buy_and_hold.sharpe_ratio, b.metrics.buy_and_hold.sharpe_ratio));
    EXPECT_EQ(a.metrics.strategy.trades, b.metrics.strategy.trades);
}

TEST(RunBacktest, SingleDaySeries) {
    const auto res = backtest::run_backtest(make_series({42.0}), params());
    ASSERT_EQ(res.records.size(), 1u);
    EXPECT_DOUBLE_EQ(res.records[0].rsi, 50.0);
    EXPECT_EQ(res.records[0].trade, TradeAction::None);
    EXPECT_DOUBLE_EQ(res.metrics.strategy.total_return, 0.0);
    EXPECT_DOUBLE_EQ(res.metrics.strategy.sharpe_ratio, 0.0);
}
