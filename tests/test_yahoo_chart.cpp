#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "data/yahoo_chart.hpp"

namespace {

const char* kChart = R"({
  "chart": {
    "result": [{
      "meta": { "symbol": "AAPL", "gmtoffset": -18000 },
      "timestamp": [1578321000, 1577975400, 1578061800, 1578321000],
      "indicators": { "quote": [{ "close": [74.0, 75.08, null, 74.95] }] }
    }],
    "error": null
  }
})";

} // namespace

TEST(YahooChart, ParsesSortsAndDropsNullCloses) {
    const auto s = data::parse_chart_json(std::string(kChart));
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0].date, "2020-01-02");
    EXPECT_DOUBLE_EQ(s[0].close, 75.08);
    EXPECT_EQ(s[1].date, "2020-01-06");
    EXPECT_DOUBLE_EQ(s[1].close, 74.95);   // duplikált nap: az utolsó marad
}

TEST(YahooChart, ErrorObjectGivesEmptySeries) {
    const auto s = data::parse_chart_json(std::string(
        R"({"chart":{"result":null,"error":{"code":"Not Found","description":"No data found, symbol may be delisted"}}})"));
    EXPECT_TRUE(s.empty());
}

TEST(YahooChart, EmptyResultGivesEmptySeries) {
    EXPECT_TRUE(data::parse_chart_json(std::string(R"({"chart":{"result":[],"error":null}})")).empty());
    EXPECT_TRUE(data::parse_chart_json(std::string(R"({"chart":{"result":[{"meta":{}}],"error":null}})")).empty());
}

TEST(YahooChart, MalformedBodyIsDataSourceError) {
    EXPECT_THROW(data::parse_chart_json(std::string("<html>rate limited</html>")), DataSourceError);
    EXPECT_THROW(data::parse_chart_json(std::string(
        R"({"chart":{"result":[{"timestamp":[1577975400]}],"error":null}})")), DataSourceError);
    EXPECT_THROW(data::parse_chart_json(std::string("[1,2,3]")), DataSourceError);
}

TEST(YahooChart, UrlUsesUnixRange) {
    data::YahooConfig cfg;
    cfg.base_url = "https://example.test";
    const auto url = data::chart_url(cfg, "MSFT", "2020-01-01", "2023-12-31");
    EXPECT_EQ(url, "https://example.test/v8/finance/chart/MSFT?period1=1577836800&period2=1703980800&interval=1d&events=history");
}

TEST(YahooChart, BadDateIsInputValidationError) {
    data::YahooConfig cfg;
    EXPECT_THROW(data::chart_url(cfg, "MSFT", "2020-1-1", "2023-12-31"), InputValidationError);
}
