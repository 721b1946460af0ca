#include "data/csv_loader.hpp"
#include "core/dates.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace data {

static std::string trim(std::string s){
    auto not_space = [](unsigned char c){ return !std::isspace(c) && c!='"'; };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

static std::string lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::vector<std::string> split(const std::string& line){
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string x;
    while (std::getline(ss, x, ',')) out.push_back(trim(x));
    if (!line.empty() && line.back()==',') out.emplace_back();
    return out;
}

// "2020-01-02", "2020-01-02 00:00:00" vagy epoch s/ms
static std::string to_date(const std::string& f){
    if (f.size() >= 10 && dates::parse_ymd(f.substr(0,10))) return f.substr(0,10);
    if (!f.empty() && f.size() <= 15 && std::all_of(f.begin(), f.end(), [](unsigned char c){ return std::isdigit(c); })){
        long long t = std::stoll(f);
        if (t > 100000000000LL) t /= 1000;   // ms
        return dates::format_ymd(dates::days_from_unix(t));
    }
    return {};
}

static bool to_double(const std::string& f, double& out){
    if (f.empty()) return false;
    char* end = nullptr;
    out = std::strtod(f.c_str(), &end);
    return end && *end == '\0';
}

PriceSeries parse_csv(std::istream& in){
    PriceSeries out;
    std::string line;
    if (!std::getline(in, line)) return out;

    const auto header = split(line);
    int date_col = -1, close_col = -1;
    for (size_t i=0;i<header.size();++i){
        const auto h = lower(header[i]);
        if (date_col < 0 && (h=="date" || h=="datetime" || h=="timestamp" || h=="time" || h=="open_time")) date_col = static_cast<int>(i);
        if (close_col < 0 && h=="close") close_col = static_cast<int>(i);
    }
    if (date_col < 0 || close_col < 0){
        if (header.size() < 5) throw DataSourceError("CSV header has no Date/Close columns: " + line);
        date_col = 0; close_col = 4;   // kline: t,o,h,l,c,v
    }

    std::size_t bad = 0;
    while (std::getline(in, line)){
        if (!line.empty() && line.back()=='\r') line.pop_back();
        if (line.empty()) continue;
        const auto f = split(line);
        PricePoint p;
        if (static_cast<int>(f.size()) <= std::max(date_col, close_col)){ ++bad; continue; }
        p.date = to_date(f[date_col]);
        if (p.date.empty() || !to_double(f[close_col], p.close)){ ++bad; continue; }
        out.push_back(std::move(p));
    }
    bad += normalize(out);
    if (bad) spdlog::warn("CSV: dropped {} incomplete rows", bad);
    return out;
}

PriceSeries CsvPriceSource::fetch(const std::string& symbol, const std::string& start, const std::string& end){
    std::ifstream f(path_);
    if (!f.good()) throw DataSourceError("cannot open CSV file: " + path_);
    auto s = parse_csv(f);
    clip_range(s, start, end);
    spdlog::info("CSV {} ({}): {} rows in range", path_, symbol, s.size());
    return s;
}

} // namespace data
