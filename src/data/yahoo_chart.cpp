#include "data/yahoo_chart.hpp"
#include "core/dates.hpp"
#include "core/errors.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace data {

static std::int64_t unix_of(const std::string& ymd, const char* what){
    auto d = dates::parse_ymd(ymd);
    if (!d) throw InputValidationError(fmt::format("invalid {} date '{}' (expected YYYY-MM-DD)", what, ymd));
    return dates::to_unix_seconds(*d);
}

std::string chart_url(const YahooConfig& cfg, const std::string& symbol,
                      const std::string& start, const std::string& end){
    return fmt::format("{}/v8/finance/chart/{}?period1={}&period2={}&interval=1d&events=history",
                       cfg.base_url, symbol, unix_of(start, "start"), unix_of(end, "end"));
}

PriceSeries parse_chart_json(const json& j){
    PriceSeries out;
    const auto chart = j.value("chart", json::object());
    if (chart.contains("error") && !chart["error"].is_null()){
        spdlog::warn("chart error: {}", chart["error"].dump());
        return out;
    }
    if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) return out;

    const auto& r = chart["result"][0];
    if (!r.contains("timestamp") || !r["timestamp"].is_array()) return out;
    const auto& ts = r["timestamp"];

    const json* closes = nullptr;
    if (r.contains("indicators") && r["indicators"].contains("quote")
        && r["indicators"]["quote"].is_array() && !r["indicators"]["quote"].empty()){
        const auto& q = r["indicators"]["quote"][0];
        if (q.contains("close") && q["close"].is_array()) closes = &q["close"];
    }
    if (!closes) throw DataSourceError("chart response without indicators.quote[0].close");

    // a napi bar időbélyege a tőzsdenyitás (helyi idő), az UTC offsettel korrigálunk
    const std::int64_t gmtoff = (r.contains("meta") ? r["meta"].value("gmtoffset", 0LL) : 0LL);

    std::size_t bad = 0;
    const std::size_t n = std::min(ts.size(), closes->size());
    for (std::size_t i=0;i<n;++i){
        const auto& c = (*closes)[i];
        if (!c.is_number() || !ts[i].is_number()){ ++bad; continue; }
        PricePoint p;
        p.date  = dates::format_ymd(dates::days_from_unix(ts[i].get<std::int64_t>() + gmtoff));
        p.close = c.get<double>();
        out.push_back(std::move(p));
    }
    bad += normalize(out);
    if (bad) spdlog::warn("chart: dropped {} rows with missing close", bad);
    return out;
}

PriceSeries parse_chart_json(const std::string& body){
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e){
        throw DataSourceError(std::string("chart response is not valid JSON: ") + e.what());
    }
    try {
        return parse_chart_json(j);
    } catch (const json::exception& e){
        throw DataSourceError(std::string("unexpected chart response layout: ") + e.what());
    }
}

YahooChartSource::YahooChartSource(YahooConfig cfg) : cfg_(std::move(cfg)) {}

std::string YahooChartSource::http_get(const std::string& url){
    std::string last_err;
    for (int attempt=0; attempt<=cfg_.retries; ++attempt){
        cpr::Response r = cpr::Get(cpr::Url{url},
                                   cpr::Header{{"User-Agent", cfg_.user_agent}, {"Accept", "application/json"}},
                                   cpr::Timeout{cfg_.timeout_ms},
                                   cpr::VerifySsl{true});
        if (r.error){
            last_err = r.error.message;
            spdlog::warn("GET {} (attempt {}): {}", url, attempt+1, last_err);
            continue;
        }
        if (r.status_code >= 500){
            last_err = fmt::format("HTTP {}", r.status_code);
            spdlog::warn("GET {} (attempt {}): {}", url, attempt+1, last_err);
            continue;
        }
        // 404: ismeretlen szimbólum, a törzsben chart.error jön -> üres sorozat
        if (r.status_code >= 400 && r.status_code != 404)
            throw DataSourceError(fmt::format("GET {} : {} {}", url, r.status_code, r.text));
        return r.text;
    }
    throw DataSourceError(fmt::format("GET {} failed after {} attempts: {}", url, cfg_.retries+1, last_err));
}

PriceSeries YahooChartSource::fetch(const std::string& symbol, const std::string& start, const std::string& end){
    const auto url = chart_url(cfg_, symbol, start, end);
    spdlog::info("fetching {} daily closes {}..{}", symbol, start, end);
    auto s = parse_chart_json(http_get(url));
    clip_range(s, start, end);
    spdlog::info("{}: {} rows", symbol, s.size());
    return s;
}

} // namespace data
