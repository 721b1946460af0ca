#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace sim {

// Egy nap lezárt eredménye; létrehozás után nem módosul.
struct DailyRecord {
    std::string date;
    double close{};
    double rsi{};
    Signal signal{Signal::Hold};
    TradeAction trade{TradeAction::None};
    double portfolio_value{};
    double daily_return{};
    // napvégi állapot
    double cash{};
    std::int64_t shares{};
    double cumulative_fees{};
    Position position{Position::Flat};
};

using DailyRecords = std::vector<DailyRecord>;

struct SimParams {
    double initial_cash{10000.0};
    double fee_rate{0.001};   // a kötésérték hányada, belépéskor és kilépéskor is
};

// Egyetlen, szekvenciális menet a sorozaton. A három bemenet hossza egyezik,
// és nem üres; különben ComputationPrecondition.
DailyRecords simulate(const PriceSeries& prices,
                      const std::vector<double>& rsi,
                      const std::vector<Signal>& signals,
                      const SimParams& params);

} // namespace sim
