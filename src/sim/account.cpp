#include "sim/account.hpp"
#include <cmath>
#include <limits>
#include "core/errors.hpp"

namespace sim {

Account::Account(double initial_cash, double fee_rate)
: cash_(initial_cash), fee_rate_(fee_rate) {}

bool Account::buy(double price){
    if (position_ == Position::Long) return false;   // nincs piramisozás
    const double qty = std::floor(cash_ / price);
    if (qty <= 0.0) return false;
    if (!(qty < static_cast<double>(std::numeric_limits<std::int64_t>::max())))
        throw ComputationPrecondition("share count does not fit into int64");

    const auto shares = static_cast<std::int64_t>(qty);
    const double notional = static_cast<double>(shares) * price;
    const double fee = notional * fee_rate_;
    cash_ -= notional + fee;
    shares_ = shares;
    fees_ += fee;
    last_fee_ = fee;
    position_ = Position::Long;
    return true;
}

bool Account::sell(double price){
    if (position_ != Position::Long || shares_ <= 0) return false;   // nincs short

    const double notional = static_cast<double>(shares_) * price;
    const double fee = notional * fee_rate_;
    cash_ += notional - fee;
    shares_ = 0;
    fees_ += fee;
    last_fee_ = fee;
    position_ = Position::Flat;
    return true;
}

} // namespace sim
