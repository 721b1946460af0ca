#include <iostream>
#include <memory>
#include <string>
#include <cstdlib>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include "core/types.hpp"
#include "core/errors.hpp"
#include "backtest/backtest.hpp"
#include "config/app_config.hpp"
#include "data/csv_loader.hpp"
#include "data/yahoo_chart.hpp"
#include "report/summary.hpp"

namespace {

const char* kUsage =
    "Hasznalat: rsi_backtester [opciok]\n"
    "  --config <file>       JSON config (alap: beepitett ertekek)\n"
    "  --symbol <SYM>        ticker, pl. AAPL (alap: az elso konfiguralt)\n"
    "  --csv <file>          Date,...,Close CSV a Yahoo letoltes helyett\n"
    "  --start <YYYY-MM-DD>  kezdo nap (zart)\n"
    "  --end <YYYY-MM-DD>    zaro nap (nyitott)\n"
    "  --period <n>          RSI periodus\n"
    "  --overbought <x>      RSI overbought szint\n"
    "  --oversold <x>        RSI oversold szint\n"
    "  --capital <x>         kezdotoke ($)\n"
    "  --fee <pct>           dij kotesenkent (%)\n"
    "  --trades              a vegrehajtott kotesek listaja\n"
    "  --log-level <lvl>     trace|debug|info|warn|error|off\n"
    "  --list-tickers        konfiguralt tickerek kiirasa\n";

struct CliOptions {
    std::string config_path;
    std::string symbol;
    std::string csv_path;
    std::string start, end;
    std::string log_level;
    std::string period, overbought, oversold, capital, fee;
    bool show_trades{false};
    bool list_tickers{false};
    bool help{false};
};

double to_number(const std::string& flag, const std::string& v){
    std::size_t pos = 0;
    double d = 0.0;
    try { d = std::stod(v, &pos); }
    catch (const std::exception&){ pos = 0; }
    if (pos == 0 || pos != v.size())
        throw InputValidationError(fmt::format("{} expects a number, got '{}'", flag, v));
    return d;
}

CliOptions parse_args(int argc, char** argv){
    CliOptions o;
    for (int i=1;i<argc;++i){
        const std::string a = argv[i];
        auto next = [&]() -> std::string {
            if (i+1 >= argc) throw InputValidationError(a + " requires a value");
            return argv[++i];
        };
        if      (a=="--config")       o.config_path = next();
        else if (a=="--symbol")       o.symbol = next();
        else if (a=="--csv")          o.csv_path = next();
        else if (a=="--start")        o.start = next();
        else if (a=="--end")          o.end = next();
        else if (a=="--period")       o.period = next();
        else if (a=="--overbought")   o.overbought = next();
        else if (a=="--oversold")     o.oversold = next();
        else if (a=="--capital")      o.capital = next();
        else if (a=="--fee")          o.fee = next();
        else if (a=="--log-level")    o.log_level = next();
        else if (a=="--trades")       o.show_trades = true;
        else if (a=="--list-tickers") o.list_tickers = true;
        else if (a=="--help" || a=="-h") o.help = true;
        else throw InputValidationError("unknown option: " + a);
    }
    return o;
}

// parancssor felülírja a config alapértékeit
void apply_overrides(const CliOptions& o, config::AppConfig& cfg){
    auto& d = cfg.defaults;
    if (!o.start.empty())      d.start_date = o.start;
    if (!o.end.empty())        d.end_date = o.end;
    if (!o.period.empty()){
        const auto p = config::period_from_number(to_number("--period", o.period));
        if (!p) throw InputValidationError("RSI period must be a positive integer.");
        d.rsi_period = *p;
    }
    if (!o.overbought.empty()) d.overbought = to_number("--overbought", o.overbought);
    if (!o.oversold.empty())   d.oversold = to_number("--oversold", o.oversold);
    if (!o.capital.empty())    d.initial_capital = to_number("--capital", o.capital);
    if (!o.fee.empty())        d.fee_percent = to_number("--fee", o.fee);
    if (!o.log_level.empty()){
        if (!config::log_level_from_name(o.log_level))
            throw InputValidationError("unknown log level: " + o.log_level);
        cfg.log_level = o.log_level;
    }
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opt;
    config::AppConfig cfg;
    backtest::Params params;
    try {
        opt = parse_args(argc, argv);
        if (opt.help){ std::cout << kUsage; return 0; }
        if (!opt.config_path.empty()) cfg = config::load_file(opt.config_path);
        apply_overrides(opt, cfg);
        spdlog::set_level(*config::log_level_from_name(cfg.log_level));

        if (opt.list_tickers){
            for (const auto& t : cfg.tickers) std::cout << fmt::format("{:<8} {}\n", t.symbol, t.name);
            return 0;
        }
        params = config::to_params(cfg.defaults);
        backtest::validate(params);
    } catch (const InputValidationError& e){
        std::cerr << "Input Error: " << e.what() << "\n\n" << kUsage;
        return 1;
    } catch (const ConfigError& e){
        std::cerr << "Config Error: " << e.what() << "\n";
        return 2;
    }

    std::string symbol = opt.symbol;
    if (symbol.empty()) symbol = cfg.tickers.empty() ? std::string("AAPL") : cfg.tickers.front().symbol;

    std::unique_ptr<data::PriceSource> source;
    if (!opt.csv_path.empty()) source = std::make_unique<data::CsvPriceSource>(opt.csv_path);
    else                       source = std::make_unique<data::YahooChartSource>(cfg.data);

    try {
        // CSV esetén csak explicit --start/--end szűr
        const bool csv = !opt.csv_path.empty();
        const std::string start = (csv && opt.start.empty()) ? std::string() : cfg.defaults.start_date;
        const std::string end   = (csv && opt.end.empty())   ? std::string() : cfg.defaults.end_date;
        const auto prices = backtest::fetch_prices(*source, symbol, start, end);

        const auto res = backtest::run_backtest(prices, params);

        std::cout << fmt::format("{} | {} .. {} | {} days | RSI({}) OB={} OS={} | capital {} | fee {}%\n\n",
                                 symbol, prices.front().date, prices.back().date, prices.size(),
                                 params.rsi_period, params.overbought, params.oversold,
                                 report::money(params.initial_capital), params.fee_rate * 100.0);
        std::cout << report::render_table(report::summary_rows(res.metrics));
        if (opt.show_trades){
            std::cout << "\nTrades:\n" << report::trade_log(res.records);
        }
    } catch (const NoDataError& e){
        std::cout << "No Data: No data available for the selected parameters (" << e.symbol() << ").\n";
        return 3;
    } catch (const InputValidationError& e){
        std::cerr << "Input Error: " << e.what() << "\n";
        return 1;
    } catch (const DataSourceError& e){
        spdlog::error("data source {}: {}", source->id(), e.what());
        return 2;
    }
    return 0;
}
