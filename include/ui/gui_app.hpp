#pragma once
#include <memory>
#include "config/app_config.hpp"
#include "data/price_source.hpp"

namespace ui {

// Asztali felület: paraméter űrlap, három grafikon (ár + kötések, RSI +
// küszöbök, portfólió érték vs buy-and-hold) és az összesítő tábla.
class GuiApp {
public:
    GuiApp(config::AppConfig cfg, std::unique_ptr<data::PriceSource> source);
    ~GuiApp();

    void run();

private:
    struct Impl;
    std::unique_ptr<Impl> self;
};

} // namespace ui
