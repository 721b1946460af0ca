#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace dates {

// YYYY-MM-DD -> napok száma 1970-01-01 óta; hibás formátumra nullopt
std::optional<std::int64_t> parse_ymd(const std::string& s);

// napok 1970-01-01 óta -> YYYY-MM-DD
std::string format_ymd(std::int64_t days);

inline std::int64_t to_unix_seconds(std::int64_t days) { return days * 86400; }

// unix idő (UTC) -> nap; negatív időre is lefelé kerekít
inline std::int64_t days_from_unix(std::int64_t secs) {
    return secs >= 0 ? secs / 86400 : -((-secs + 86399) / 86400);
}

} // namespace dates
