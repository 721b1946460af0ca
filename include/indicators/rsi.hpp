#pragma once
#include <cstddef>
#include <vector>
#include "core/types.hpp"

namespace ind {

constexpr std::size_t kDefaultRsiPeriod = 14;
constexpr double kNeutralRsi = 50.0;

// RSI egyetlen átlagos nyereség / veszteség párból; ha a veszteség 0
// (vagy bármi nem véges), a semleges 50-et adja.
double rsi_from_averages(double avg_gain, double avg_loss);

// RSI sorozat, a bemenettel azonos hosszon; minden érték [0,100]-ban.
std::vector<double> compute_rsi(const std::vector<double>& closes, std::size_t period = kDefaultRsiPeriod);
std::vector<double> compute_rsi(const PriceSeries& prices, std::size_t period = kDefaultRsiPeriod);

} // namespace ind
