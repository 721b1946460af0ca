#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include "backtest/backtest.hpp"
#include "data/yahoo_chart.hpp"

namespace config {

struct Ticker {
    std::string name;     // "Apple Inc. (AAPL)"
    std::string symbol;   // "AAPL"
};

// Űrlap / parancssor alapértékei
struct Defaults {
    std::string start_date{"2020-01-01"};
    std::string end_date{"2023-12-31"};
    int rsi_period{14};
    double overbought{70.0};
    double oversold{30.0};
    double initial_capital{10000.0};
    double fee_percent{0.1};   // százalékban, mint az űrlapon
};

struct AppConfig {
    std::string log_level{"info"};
    data::YahooConfig data{};
    Defaults defaults{};
    std::vector<Ticker> tickers = default_tickers();

    static std::vector<Ticker> default_tickers();
};

// Hiányzó kulcsok az alapértéket tartják. Hibás JSON / típus -> ConfigError.
AppConfig from_json(const nlohmann::json& j);
AppConfig parse(const std::string& text);
AppConfig load_file(const std::string& path);

// trace|debug|info|warn|warning|err|error|critical|off, különben nullopt
std::optional<spdlog::level::level_enum> log_level_from_name(const std::string& name);

// Pozitív egész, ami belefér egy int-be; különben nullopt
std::optional<int> period_from_number(double p);

// Defaults -> backtest::Params (fee_percent / 100)
backtest::Params to_params(const Defaults& d);

} // namespace config
