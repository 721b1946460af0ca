#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "config/app_config.hpp"
#include "core/errors.hpp"
#include "data/csv_loader.hpp"
#include "data/yahoo_chart.hpp"
#include "ui/gui_app.hpp"

// rsi_backtester_gui [config.json] [--csv file]
int main(int argc, char** argv) {
    config::AppConfig cfg;
    std::string csv_path;
    try {
        for (int i=1;i<argc;++i){
            const std::string a = argv[i];
            if (a=="--csv" && i+1<argc) csv_path = argv[++i];
            else cfg = config::load_file(a);
        }
    } catch (const ConfigError& e){
        std::cerr << "Config Error: " << e.what() << "\n";
        return 2;
    }
    spdlog::set_level(*config::log_level_from_name(cfg.log_level));

    std::unique_ptr<data::PriceSource> source;
    if (!csv_path.empty()) source = std::make_unique<data::CsvPriceSource>(csv_path);
    else                   source = std::make_unique<data::YahooChartSource>(cfg.data);

    ui::GuiApp app(std::move(cfg), std::move(source));
    app.run();
    return 0;
}
