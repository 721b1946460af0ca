#pragma once
#include <istream>
#include <string>
#include "data/price_source.hpp"

namespace data {

// CSV beolvasás fejléc sorral. A dátum oszlop neve Date / Timestamp /
// open_time, a záróáré Close (kis-nagybetű nem számít, az "Adj Close" nem az).
// Névvel nem azonosítható fejlécnél a kline elrendezés (t,o,h,l,c,v) az
// alapértelmezés. Az epoch időbélyeg (s vagy ms) napra konvertálódik.
PriceSeries parse_csv(std::istream& in);

class CsvPriceSource final : public PriceSource {
public:
    explicit CsvPriceSource(std::string path) : path_(std::move(path)) {}
    std::string id() const override { return "csv"; }

    // a symbol csak logoláshoz kell, a fájl egyetlen instrumentumot tartalmaz
    PriceSeries fetch(const std::string& symbol,
                      const std::string& start,
                      const std::string& end) override;

private:
    std::string path_;
};

} // namespace data
