#include "core/dates.hpp"
#include <cstdio>
#include <cctype>

namespace dates {

// Howard Hinnant: days_from_civil / civil_from_days
static std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d){
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y-399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153*(m + (m > 2 ? -3 : 9)) + 2)/5 + d-1;
    const unsigned doe = yoe * 365 + yoe/4 - yoe/100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

static bool is_leap(std::int64_t y){ return (y%4==0 && y%100!=0) || y%400==0; }

std::optional<std::int64_t> parse_ymd(const std::string& s){
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    for (size_t i=0;i<s.size();++i){
        if (i==4 || i==7) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }
    const int y = std::stoi(s.substr(0,4));
    const unsigned m = static_cast<unsigned>(std::stoi(s.substr(5,2)));
    const unsigned d = static_cast<unsigned>(std::stoi(s.substr(8,2)));
    static const unsigned mdays[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (m < 1 || m > 12 || d < 1) return std::nullopt;
    const unsigned maxd = (m==2 && is_leap(y)) ? 29 : mdays[m-1];
    if (d > maxd) return std::nullopt;
    return days_from_civil(y, m, d);
}

std::string format_ymd(std::int64_t z){
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365*yoe + yoe/4 - yoe/100);
    const unsigned mp = (5*doy + 2)/153;
    const unsigned d = doy - (153*mp+2)/5 + 1;
    const unsigned m = mp < 10 ? mp+3 : mp-9;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", static_cast<long long>(y + (m <= 2)), m, d);
    return buf;
}

} // namespace dates
