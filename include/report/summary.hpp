#pragma once
#include <string>
#include <vector>
#include "metrics/performance.hpp"
#include "sim/simulator.hpp"

namespace report {

// Egy sor a kétoszlopos (stratégia / buy-and-hold) összesítő táblában
struct SummaryRow {
    std::string label;
    std::string strategy;
    std::string baseline;
};

std::string money(double v);        // $12,345.67
std::string percent(double ratio);  // 0.1234 -> 12.34%

std::vector<SummaryRow> summary_rows(const metrics::PerformanceMetrics& m);

// Fix szélességű szöveges tábla a CLI-hez
std::string render_table(const std::vector<SummaryRow>& rows);

// Végrehajtott ügyletek listája: dátum, irány, ár, darab, díj összesen
std::string trade_log(const sim::DailyRecords& records);

} // namespace report
