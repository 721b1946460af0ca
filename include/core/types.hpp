#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Egy napi záróár
struct PricePoint {
    std::string date;   // YYYY-MM-DD
    double close{};
};

// Dátum szerint növekvő, napi sorozat
using PriceSeries = std::vector<PricePoint>;

// RSI keresztezésből származó jel
enum class Signal { Buy, Sell, Hold };

// Ténylegesen végrehajtott ügylet egy adott napon
enum class TradeAction { Buy, Sell, None };

// Pozíció állapot
enum class Position { Flat, Long };

inline const char* to_string(TradeAction a) {
    switch (a) {
        case TradeAction::Buy:  return "BUY";
        case TradeAction::Sell: return "SELL";
        default:                return "-";
    }
}

inline std::vector<double> closes_of(const PriceSeries& s) {
    std::vector<double> out;
    out.reserve(s.size());
    for (const auto& p : s) out.push_back(p.close);
    return out;
}
