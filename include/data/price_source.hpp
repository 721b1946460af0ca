#pragma once
#include <string>
#include "core/types.hpp"

namespace data {

// Historikus napi adatforrás. Üres sorozatot is adhat, ezt a hívó kezeli
// (NoDataError); átviteli/formátum hiba esetén DataSourceError.
class PriceSource {
public:
    virtual ~PriceSource() = default;

    // Rövid név a logokhoz (pl. "yahoo", "csv")
    virtual std::string id() const = 0;

    // [start, end) napok, YYYY-MM-DD; üres határ = nincs szűrés
    virtual PriceSeries fetch(const std::string& symbol,
                              const std::string& start,
                              const std::string& end) = 0;
};

// Nem pozitív / nem véges záróárú sorok eldobása, dátum szerinti rendezés,
// duplikált napokból az utolsó marad. Visszaadja az eldobott sorok számát.
std::size_t normalize(PriceSeries& s);

// Csak a [start, end) tartományba eső napok maradnak
void clip_range(PriceSeries& s, const std::string& start, const std::string& end);

} // namespace data
