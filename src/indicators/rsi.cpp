#include "indicators/rsi.hpp"
#include "indicators/rolling.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

double rsi_from_averages(double avg_gain, double avg_loss){
    if (!(avg_loss > 0.0) || !std::isfinite(avg_gain) || !std::isfinite(avg_loss)) return kNeutralRsi;
    const double rs  = avg_gain / avg_loss;
    const double rsi = 100.0 - (100.0/(1.0+rs));
    if (!std::isfinite(rsi)) return kNeutralRsi;
    return std::clamp(rsi, 0.0, 100.0);
}

std::vector<double> compute_rsi(const std::vector<double>& c, std::size_t p){
    if (p < 1) throw ComputationPrecondition("compute_rsi: period must be >= 1");
    if (c.empty()) throw ComputationPrecondition("compute_rsi: empty price series");

    const auto delta = diff(c);
    std::vector<double> gain(delta.size()), loss(delta.size());
    for (std::size_t i=0;i<delta.size();++i){
        gain[i] = std::max(delta[i], 0.0);
        loss[i] = std::max(-delta[i], 0.0);
    }
    const auto avg_g = rolling_mean(gain, p);
    const auto avg_l = rolling_mean(loss, p);

    std::vector<double> out(c.size());
    for (std::size_t i=0;i<c.size();++i) out[i] = rsi_from_averages(avg_g[i], avg_l[i]);
    return out;
}

std::vector<double> compute_rsi(const PriceSeries& prices, std::size_t p){
    return compute_rsi(closes_of(prices), p);
}

} // namespace ind
