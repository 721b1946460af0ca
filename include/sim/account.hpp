#pragma once
#include <cstdint>
#include "core/types.hpp"

namespace sim {

// Egy futás szimulációs állapota: készpénz, egész darabszámú részvény,
// halmozott díj és pozíció jelző. Csak egész részvény, nincs short.
class Account {
public:
    Account(double initial_cash, double fee_rate);

    // Teljes készpénzből vásárol floor(cash/price) darabot.
    // false, ha már long, vagy egy darabra sem futja (ilyenkor semmi sem változik).
    // ComputationPrecondition, ha a darabszám nem fér int64-be.
    bool buy(double price);

    // A teljes pozíciót eladja; false, ha nincs nyitott pozíció.
    bool sell(double price);

    double value(double price) const { return cash_ + static_cast<double>(shares_) * price; }

    double cash() const { return cash_; }
    std::int64_t shares() const { return shares_; }
    double fees_paid() const { return fees_; }
    double last_fee() const { return last_fee_; }
    Position position() const { return position_; }

private:
    double cash_;
    double fee_rate_;
    std::int64_t shares_{0};
    double fees_{0.0};
    double last_fee_{0.0};
    Position position_{Position::Flat};
};

} // namespace sim
