#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "data/price_source.hpp"

namespace data {

// --- Alap config
struct YahooConfig {
    std::string base_url{"https://query1.finance.yahoo.com"};
    int timeout_ms{10000};
    int retries{2};   // további próbálkozások átviteli hiba vagy 5xx esetén
    std::string user_agent{"Mozilla/5.0 (X11; Linux x86_64) rsi-backtester/1.0"};
};

// v8 chart válasz -> PriceSeries. chart.error vagy üres result -> üres sorozat,
// értelmezhetetlen JSON -> DataSourceError.
PriceSeries parse_chart_json(const nlohmann::json& j);
PriceSeries parse_chart_json(const std::string& body);

// GET {base}/v8/finance/chart/{symbol}?period1=..&period2=..&interval=1d
std::string chart_url(const YahooConfig& cfg, const std::string& symbol,
                      const std::string& start, const std::string& end);

class YahooChartSource final : public PriceSource {
public:
    explicit YahooChartSource(YahooConfig cfg);
    std::string id() const override { return "yahoo"; }

    PriceSeries fetch(const std::string& symbol,
                      const std::string& start,
                      const std::string& end) override;

private:
    std::string http_get(const std::string& url);

    YahooConfig cfg_;
};

} // namespace data
