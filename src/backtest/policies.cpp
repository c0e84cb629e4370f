#include "backtest/policies.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace backtest {
namespace {

bool holds_expired_contract(const Broker& broker, Date date) {
    for (const auto& [ticker, position] : broker.positions()) {
        if (position.expiry <= date) {
            return true;
        }
    }
    return false;
}

std::size_t apply_stop_loss(const StopLoss& rule, Broker& broker, const PriceMap& prices, Date date) {
    std::vector<std::pair<std::string, double>> triggered;
    for (const auto& [ticker, position] : broker.positions()) {
        const auto quote = prices.find(ticker);
        if (quote == prices.end() || position.entry_price <= 0.0) {
            continue;
        }
        const double loss = (quote->second - position.entry_price) / position.entry_price;
        if (loss < -rule.threshold) {
            triggered.emplace_back(ticker, quote->second);
        }
    }

    std::size_t closed = 0;
    for (const auto& [ticker, price] : triggered) {
        const int64_t quantity = broker.positions().at(ticker).quantity;
        if (broker.verbose()) {
            std::cout << "[Risk] " << date << " Stop loss hit for " << ticker << ", selling " << quantity
                      << std::endl;
        }
        if (broker.sell(ticker, quantity, price, date)) {
            ++closed;
        }
    }
    return closed;
}

} // namespace

bool should_rebalance(const RebalancePolicy& policy, Date date, const Broker& broker) {
    if (datafeed::is_last_business_day_of_month(date)) {
        return true;
    }
    return std::holds_alternative<EndOfMonthOrExpiry>(policy) && holds_expired_contract(broker, date);
}

std::size_t apply_risk_policy(const RiskPolicy& policy, Broker& broker, const PriceMap& prices, Date date) {
    if (const auto* rule = std::get_if<StopLoss>(&policy)) {
        return apply_stop_loss(*rule, broker, prices, date);
    }
    return 0;
}

std::string describe(const RebalancePolicy& policy) {
    return std::holds_alternative<EndOfMonth>(policy) ? "end-of-month" : "end-of-month-or-expiry";
}

std::string describe(const RiskPolicy& policy) {
    if (const auto* rule = std::get_if<StopLoss>(&policy)) {
        return "stop-loss(" + std::to_string(rule->threshold) + ")";
    }
    return "none";
}

} // namespace backtest
