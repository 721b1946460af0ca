#include <gtest/gtest.h>
#include "report/summary.hpp"

TEST(Report, MoneyFormatting) {
    EXPECT_EQ(report::money(0.0), "$0.00");
    EXPECT_EQ(report::money(1234.5), "$1,234.50");
    EXPECT_EQ(report::money(999.999), "$1,000.00");
    EXPECT_EQ(report::money(1234567.891), "$1,234,567.89");
    EXPECT_EQ(report::money(-1500.0), "$-1,500.00");
    EXPECT_EQ(report::money(12.0), "$12.00");
}

TEST(Report, PercentFormatting) {
    EXPECT_EQ(report::percent(0.1234), "12.34%");
    EXPECT_EQ(report::percent(-0.25), "-25.00%");
    EXPECT_EQ(report::percent(0.0), "0.00%");
}

TEST(Report, SummaryRowsMarkBaselineNotApplicable) {
    metrics::PerformanceMetrics m;
    m.strategy.final_value = 11500.0;
    m.strategy.total_return = 0.15;
    m.strategy.max_drawdown = -0.1;
    m.strategy.volatility = 0.2;
    m.strategy.sharpe_ratio = 0.7;
    m.strategy.trades = 0;
    m.strategy.fees_paid = 0.0;
    m.buy_and_hold.final_value = 12000.0;
    m.buy_and_hold.total_return = 0.2;

    const auto rows = report::summary_rows(m);
    ASSERT_EQ(rows.size(), 7u);
    EXPECT_EQ(rows[0].label, "Portfolio Value");
    EXPECT_EQ(rows[0].strategy, "$11,500.00");
    EXPECT_EQ(rows[0].baseline, "$12,000.00");
    EXPECT_EQ(rows[1].strategy, "15.00%");
    EXPECT_EQ(rows[2].label, "Max. Drawdown");
    EXPECT_EQ(rows[2].strategy, "-10.00%");
    EXPECT_EQ(rows[4].strategy, "0.70");
    EXPECT_EQ(rows[5].label, "Fees Paid");
    EXPECT_EQ(rows[5].strategy, "$0.00");
    EXPECT_EQ(rows[5].baseline, "N/A");
    EXPECT_EQ(rows[6].label, "Number of Trades");
    EXPECT_EQ(rows[6].strategy, "0");   // nulla kötés != nem értelmezett
    EXPECT_EQ(rows[6].baseline, "N/A");
}

TEST(Report, RenderTableHasHeaderAndLabels) {
    const std::vector<report::SummaryRow> rows{{"Sharpe Ratio", "1.23", "0.45"}};
    const auto t = report::render_table(rows);
    EXPECT_NE(t.find("RSI-Strategy"), std::string::npos);
    EXPECT_NE(t.find("Buy-n-Hold"), std::string::npos);
    EXPECT_NE(t.find("Sharpe Ratio:"), std::string::npos);
    EXPECT_NE(t.find("1.23"), std::string::npos);
}

TEST(Report, TradeLogListsOnlyExecutedTrades) {
    sim::DailyRecords recs(3);
    recs[0].date = "2024-01-02"; recs[0].close = 10.0;
    recs[1].date = "2024-01-03"; recs[1].close = 9.0; recs[1].trade = TradeAction::Buy; recs[1].shares = 11;
    recs[2].date = "2024-01-04"; recs[2].close = 12.0; recs[2].trade = TradeAction::Sell; recs[2].shares = 0;
    const auto log = report::trade_log(recs);
    EXPECT_EQ(log.find("2024-01-02"), std::string::npos);
    EXPECT_NE(log.find("2024-01-03  BUY"), std::string::npos);
    EXPECT_NE(log.find("2024-01-04  SELL"), std::string::npos);
    EXPECT_NE(log.find("11 @"), std::string::npos);
}
