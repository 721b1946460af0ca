#include "data/price_source.hpp"
#include <algorithm>
#include <cmath>

namespace data {

std::size_t normalize(PriceSeries& s){
    const std::size_t before = s.size();
    s.erase(std::remove_if(s.begin(), s.end(), [](const PricePoint& p){
        return p.date.empty() || !std::isfinite(p.close) || p.close <= 0.0;
    }), s.end());
    const std::size_t dropped = before - s.size();

    std::stable_sort(s.begin(), s.end(), [](const PricePoint& a, const PricePoint& b){ return a.date < b.date; });

    // azonos napok közül az utolsó beolvasott marad
    PriceSeries out;
    out.reserve(s.size());
    for (auto& p : s){
        if (!out.empty() && out.back().date == p.date) out.back() = std::move(p);
        else out.push_back(std::move(p));
    }
    s.swap(out);
    return dropped;
}

void clip_range(PriceSeries& s, const std::string& start, const std::string& end){
    s.erase(std::remove_if(s.begin(), s.end(), [&](const PricePoint& p){
        return (!start.empty() && p.date < start) || (!end.empty() && p.date >= end);
    }), s.end());
}

} // namespace data
