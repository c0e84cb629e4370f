#pragma once

#include "backtest/broker.hpp"

#include <variant>

namespace backtest {

// Rebalance on the last business day of each month.
struct EndOfMonth {};

// End of month, or whenever a held contract has reached its expiry.
struct EndOfMonthOrExpiry {};

using RebalancePolicy = std::variant<EndOfMonth, EndOfMonthOrExpiry>;

// Liquidate a position once it has lost more than `threshold` of its entry price.
struct StopLoss {
    double threshold = 0.1;
};

using RiskPolicy = std::variant<std::monostate, StopLoss>;

bool should_rebalance(const RebalancePolicy& policy, Date date, const Broker& broker);

// Returns the number of positions closed.
std::size_t apply_risk_policy(const RiskPolicy& policy, Broker& broker, const PriceMap& prices, Date date);

std::string describe(const RebalancePolicy& policy);
std::string describe(const RiskPolicy& policy);

} // namespace backtest
