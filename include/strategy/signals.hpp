#pragma once
#include <vector>
#include "core/types.hpp"

namespace strategy {

struct Thresholds {
    double overbought{70.0};
    double oversold{30.0};
};

// Élvezérelt jel egy napra; a legelső napnak nincs előzménye.
//  BUY : az RSI alulról átlépi az oversold szintet (tegnap <= OS, ma > OS)
//  SELL: az RSI felülről átlépi az overbought szintet (tegnap >= OB, ma < OB)
inline Signal crossing_signal(double prev, double cur, const Thresholds& t){
    if (cur > t.oversold && prev <= t.oversold)   return Signal::Buy;
    if (cur < t.overbought && prev >= t.overbought) return Signal::Sell;
    return Signal::Hold;
}

inline std::vector<Signal> generate_signals(const std::vector<double>& rsi, const Thresholds& t){
    std::vector<Signal> out(rsi.size(), Signal::Hold);
    for (size_t i=1;i<rsi.size();++i) out[i] = crossing_signal(rsi[i-1], rsi[i], t);
    return out;
}

} // namespace strategy
