#include "indicators/rolling.hpp"
#include "core/errors.hpp"

namespace ind {

std::vector<double> rolling_mean(const std::vector<double>& v, std::size_t p){
    if (p == 0) throw ComputationPrecondition("rolling_mean: window must be >= 1");
    std::vector<double> out(v.size(), 0.0);
    for (std::size_t i=0;i<v.size();++i){
        // ablakonként újraösszegzünk: egy csupa nulla ablak átlaga pontosan 0 marad
        const std::size_t first = (i+1 >= p ? i+1-p : 0);
        double s = 0.0;
        for (std::size_t j=first;j<=i;++j) s += v[j];
        out[i] = s / static_cast<double>(i+1-first);
    }
    return out;
}

std::vector<double> diff(const std::vector<double>& v){
    std::vector<double> out(v.size(), 0.0);
    for (std::size_t i=1;i<v.size();++i) out[i] = v[i] - v[i-1];
    return out;
}

} // namespace ind
