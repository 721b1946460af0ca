#include "config/app_config.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace config {

std::vector<Ticker> AppConfig::default_tickers(){
    return {
        {"Apple Inc. (AAPL)", "AAPL"},
        {"Microsoft Corporation (MSFT)", "MSFT"},
        {"Amazon.com, Inc. (AMZN)", "AMZN"},
        {"Alphabet Inc. Class A (GOOGL)", "GOOGL"},
        {"Alphabet Inc. Class C (GOOG)", "GOOG"},
        {"Meta Platforms, Inc. (META)", "META"},
        {"Tesla, Inc. (TSLA)", "TSLA"},
        {"NVIDIA Corporation (NVDA)", "NVDA"},
        {"JPMorgan Chase & Co. (JPM)", "JPM"},
    };
}

AppConfig from_json(const json& j){
    AppConfig c;
    try {
        if (!j.is_object()) throw ConfigError("config root must be a JSON object");
        c.log_level = j.value("log_level", c.log_level);

        if (j.contains("data")){
            const auto& d = j.at("data");
            c.data.base_url   = d.value("base_url", c.data.base_url);
            c.data.timeout_ms = d.value("timeout_ms", c.data.timeout_ms);
            c.data.retries    = d.value("retries", c.data.retries);
            c.data.user_agent = d.value("user_agent", c.data.user_agent);
        }
        if (j.contains("defaults")){
            const auto& d = j.at("defaults");
            c.defaults.start_date      = d.value("start_date", c.defaults.start_date);
            c.defaults.end_date        = d.value("end_date", c.defaults.end_date);
            if (d.contains("rsi_period")){
                const auto& rp = d.at("rsi_period");
                if (!rp.is_number()) throw ConfigError("defaults.rsi_period must be a number");
                const auto period = period_from_number(rp.get<double>());
                if (!period) throw ConfigError("defaults.rsi_period must be a positive integer");
                c.defaults.rsi_period = *period;
            }
            c.defaults.overbought      = d.value("overbought", c.defaults.overbought);
            c.defaults.oversold        = d.value("oversold", c.defaults.oversold);
            c.defaults.initial_capital = d.value("initial_capital", c.defaults.initial_capital);
            c.defaults.fee_percent     = d.value("fee_percent", c.defaults.fee_percent);
        }
        if (j.contains("tickers")){
            const auto& arr = j.at("tickers");
            if (!arr.is_array()) throw ConfigError("'tickers' must be an array");
            c.tickers.clear();
            for (const auto& t : arr){
                Ticker tk;
                tk.symbol = t.at("symbol").get<std::string>();
                tk.name   = t.value("name", tk.symbol);
                c.tickers.push_back(std::move(tk));
            }
        }
    } catch (const json::exception& e){
        throw ConfigError(std::string("invalid config: ") + e.what());
    }
    if (!log_level_from_name(c.log_level)) throw ConfigError("unknown log_level: " + c.log_level);
    if (c.data.retries < 0) throw ConfigError("data.retries must be >= 0");
    if (c.data.timeout_ms <= 0) throw ConfigError("data.timeout_ms must be > 0");
    return c;
}

AppConfig parse(const std::string& text){
    json j;
    try { j = json::parse(text); }
    catch (const json::parse_error& e){ throw ConfigError(std::string("config is not valid JSON: ") + e.what()); }
    return from_json(j);
}

AppConfig load_file(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw ConfigError("cannot open config file: " + path);
    std::stringstream ss; ss << f.rdbuf();
    auto c = parse(ss.str());
    spdlog::debug("config loaded from {} ({} tickers)", path, c.tickers.size());
    return c;
}

std::optional<spdlog::level::level_enum> log_level_from_name(const std::string& name){
    // from_str ismeretlen névre is off-ot ad
    const auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off") return std::nullopt;
    return lvl;
}

std::optional<int> period_from_number(double p){
    if (!std::isfinite(p) || p < 1.0 || p > static_cast<double>(std::numeric_limits<int>::max())) return std::nullopt;
    if (p != std::floor(p)) return std::nullopt;
    return static_cast<int>(p);
}

backtest::Params to_params(const Defaults& d){
    backtest::Params p;
    p.rsi_period      = d.rsi_period > 0 ? static_cast<std::size_t>(d.rsi_period) : 0;
    p.overbought      = d.overbought;
    p.oversold        = d.oversold;
    p.initial_capital = d.initial_capital;
    p.fee_rate        = d.fee_percent / 100.0;
    return p;
}

} // namespace config
