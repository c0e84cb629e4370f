#include "backtest/broker.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace backtest {
namespace {

std::string format_decimal(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

double intrinsic_value(const OptionContract& contract, double underlying_price) {
    if (contract.type == OptionType::Call) {
        return std::max(underlying_price - contract.strike, 0.0);
    }
    return std::max(contract.strike - underlying_price, 0.0);
}

void require_positive(int64_t quantity, double price) {
    if (quantity <= 0) {
        throw InvalidParameterError("Trade quantity must be positive, got " + std::to_string(quantity));
    }
    if (!(price > 0.0) || !std::isfinite(price)) {
        throw InvalidParameterError("Trade price must be positive, got " + std::to_string(price));
    }
}

} // namespace

std::string to_string(TradeAction action) {
    switch (action) {
    case TradeAction::Buy:
        return "BUY";
    case TradeAction::Sell:
        return "SELL";
    case TradeAction::BuyOption:
        return "BUY_OPTION";
    case TradeAction::SellOption:
        return "SELL_OPTION";
    }
    return "UNKNOWN";
}

Broker::Broker(BrokerConfig config)
    : config_(config), cash_(config.initial_cash) {
    if (!(config_.initial_cash >= 0.0) || !std::isfinite(config_.initial_cash)) {
        throw InvalidParameterError("Initial cash must be a non-negative amount");
    }
}

void Broker::record(Date date, TradeAction action, const std::string& instrument, int64_t quantity, double price) {
    log_.push_back(TransactionRecord{date, action, instrument, quantity, price, cash_});
}

void Broker::execute_buy(const std::string& ticker, int64_t quantity, double price, Date date, Date expiry) {
    const double cost = static_cast<double>(quantity) * price;
    if (cash_ < cost) {
        throw InsufficientFundsError("Not enough cash to buy " + std::to_string(quantity) + " " + ticker +
                                     " at " + format_decimal(price, 2) + " (cash " +
                                     format_decimal(cash_, 2) + ")");
    }

    auto it = positions_.find(ticker);
    if (it == positions_.end()) {
        positions_.emplace(ticker, Position{ticker, quantity, price, expiry, price});
    } else {
        auto& position = it->second;
        const int64_t total = position.quantity + quantity;
        position.entry_price = (position.entry_price * static_cast<double>(position.quantity) + cost) /
                               static_cast<double>(total);
        position.quantity = total;
        position.expiry = expiry;
        position.last_price = price;
    }
    cash_ -= cost;
    record(date, TradeAction::Buy, ticker, quantity, price);
}

void Broker::execute_sell(const std::string& ticker, int64_t quantity, double price, Date date) {
    auto it = positions_.find(ticker);
    const int64_t held = it == positions_.end() ? 0 : it->second.quantity;
    if (held < quantity) {
        throw InsufficientHoldingsError("Not enough " + ticker + " to sell " + std::to_string(quantity) +
                                        " (held " + std::to_string(held) + ")");
    }

    it->second.quantity -= quantity;
    if (it->second.quantity == 0) {
        positions_.erase(it);
    }
    cash_ += static_cast<double>(quantity) * price;
    record(date, TradeAction::Sell, ticker, quantity, price);
}

bool Broker::buy(const std::string& ticker, int64_t quantity, double price, Date date, Date expiry) {
    require_positive(quantity, price);
    try {
        execute_buy(ticker, quantity, price, date, expiry);
    } catch (const InsufficientFundsError& ex) {
        std::cerr << "[Broker] " << date << " " << ex.what() << std::endl;
        return false;
    }
    if (config_.verbose) {
        std::cout << "[Broker] " << date << " Bought " << quantity << " " << ticker << " at "
                  << format_decimal(price, 4) << std::endl;
    }
    return true;
}

bool Broker::sell(const std::string& ticker, int64_t quantity, double price, Date date) {
    require_positive(quantity, price);
    try {
        execute_sell(ticker, quantity, price, date);
    } catch (const InsufficientHoldingsError& ex) {
        std::cerr << "[Broker] " << date << " " << ex.what() << std::endl;
        return false;
    }
    if (config_.verbose) {
        std::cout << "[Broker] " << date << " Sold " << quantity << " " << ticker << " at "
                  << format_decimal(price, 4) << std::endl;
    }
    return true;
}

double Broker::option_premium(const OptionPosition& position, Date date, const PriceMap& prices) const {
    double underlying_price = position.contract.underlying_price;
    if (!position.underlying.empty()) {
        const auto quote = prices.find(position.underlying);
        if (quote != prices.end() && quote->second > 0.0) {
            underlying_price = quote->second;
        }
    }
    const double remaining = position.remaining_days(date);
    if (remaining <= 0.0) {
        return intrinsic_value(position.contract, underlying_price);
    }
    PricingOverrides overrides;
    overrides.underlying_price = underlying_price;
    overrides.time_to_maturity_days = remaining;
    return price(position.contract, overrides);
}

bool Broker::buy_option(const std::string& name, const OptionContract& contract, int64_t quantity,
                        Date date, const std::string& underlying) {
    if (quantity <= 0) {
        throw InvalidParameterError("Option quantity must be positive, got " + std::to_string(quantity));
    }
    const double premium = price(contract);
    const double cost = premium * static_cast<double>(quantity);
    if (cash_ < cost) {
        std::cerr << "[Broker] " << date << " Not enough cash to buy option " << name << " (cost "
                  << format_decimal(cost, 2) << ", cash " << format_decimal(cash_, 2) << ")" << std::endl;
        return false;
    }

    auto it = option_positions_.find(name);
    if (it == option_positions_.end()) {
        option_positions_.emplace(name, OptionPosition{name, contract, underlying, quantity, premium, date});
    } else {
        auto& position = it->second;
        const int64_t total = position.quantity + quantity;
        position.entry_premium = (position.entry_premium * static_cast<double>(position.quantity) + cost) /
                                 static_cast<double>(total);
        position.quantity = total;
    }
    cash_ -= cost;
    record(date, TradeAction::BuyOption, name, quantity, premium);

    if (config_.verbose) {
        std::cout << "[Broker] " << date << " Bought " << quantity << " " << to_string(contract.type)
                  << " option " << name << " strike " << contract.strike << " premium "
                  << format_decimal(premium, 4) << std::endl;
    }
    return true;
}

bool Broker::sell_option(const std::string& name, int64_t quantity, Date date, const PriceMap& prices) {
    if (quantity <= 0) {
        throw InvalidParameterError("Option quantity must be positive, got " + std::to_string(quantity));
    }
    auto it = option_positions_.find(name);
    const int64_t held = it == option_positions_.end() ? 0 : it->second.quantity;
    if (held < quantity) {
        std::cerr << "[Broker] " << date << " Cannot sell " << quantity << " contracts of option " << name
                  << " (held " << held << ")" << std::endl;
        return false;
    }

    const double premium = option_premium(it->second, date, prices);
    cash_ += premium * static_cast<double>(quantity);
    it->second.quantity -= quantity;
    if (it->second.quantity == 0) {
        option_positions_.erase(it);
    }
    record(date, TradeAction::SellOption, name, quantity, premium);

    if (config_.verbose) {
        std::cout << "[Broker] " << date << " Sold " << quantity << " contracts of option " << name
                  << " for " << format_decimal(premium * static_cast<double>(quantity), 2) << std::endl;
    }
    return true;
}

std::size_t Broker::expire_options(Date date) {
    std::size_t removed = 0;
    for (auto it = option_positions_.begin(); it != option_positions_.end();) {
        if (it->second.is_expired(date)) {
            if (config_.verbose) {
                std::cout << "[Broker] " << date << " Option " << it->first
                          << " expired and was removed from the portfolio" << std::endl;
            }
            it = option_positions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void Broker::mark(const PriceMap& prices) {
    for (auto& [ticker, position] : positions_) {
        const auto quote = prices.find(ticker);
        if (quote != prices.end()) {
            position.last_price = quote->second;
        }
    }
}

void Broker::rebalance(const PortfolioWeights& weights, const PriceMap& prices, Date date,
                       const ExpiryMap& expiries) {
    const double total_value = value(prices);

    struct Order {
        std::string ticker;
        double price;
        int64_t quantity;
    };
    std::vector<Order> orders;
    orders.reserve(weights.size());

    for (const auto& [ticker, weight] : weights) {
        const auto quote = prices.find(ticker);
        if (quote == prices.end() || !(quote->second > 0.0)) {
            std::cerr << "[Broker] " << date << " No price for " << ticker << ", skipping rebalance leg"
                      << std::endl;
            continue;
        }
        const double price = quote->second;
        const auto held = positions_.find(ticker);
        const double current_value =
            held == positions_.end() ? 0.0 : static_cast<double>(held->second.quantity) * price;
        const double diff = total_value * weight - current_value;
        const auto quantity = static_cast<int64_t>(diff / price);
        if (quantity != 0) {
            orders.push_back(Order{ticker, price, quantity});
        }
    }

    for (const auto& order : orders) {
        if (order.quantity < 0) {
            sell(order.ticker, -order.quantity, order.price, date);
        }
    }

    for (const auto& order : orders) {
        if (order.quantity <= 0) {
            continue;
        }
        const auto expiry_it = expiries.find(order.ticker);
        const Date expiry = expiry_it == expiries.end() ? Date::never() : expiry_it->second;

        int64_t quantity = order.quantity;
        const double cost = static_cast<double>(quantity) * order.price;
        if (cost > cash_) {
            const auto affordable = static_cast<int64_t>(std::floor(cash_ / order.price));
            std::cerr << "[Broker] " << date << " Not enough cash to buy " << quantity << " " << order.ticker
                      << " (shortfall " << format_decimal(cost - cash_, 2) << "); buying " << affordable
                      << " instead" << std::endl;
            quantity = affordable;
        }
        if (quantity > 0) {
            buy(order.ticker, quantity, order.price, date, expiry);
        }
    }
}

double Broker::value(const PriceMap& prices, std::optional<Date> as_of) const {
    double total = cash_;
    for (const auto& [ticker, position] : positions_) {
        const auto quote = prices.find(ticker);
        if (quote != prices.end()) {
            total += static_cast<double>(position.quantity) * quote->second;
        }
    }
    for (const auto& [name, position] : option_positions_) {
        const double premium = as_of ? option_premium(position, *as_of, prices) : position.entry_premium;
        total += premium * static_cast<double>(position.quantity);
    }
    return total;
}

std::size_t Broker::sell_expired_contracts(Date date, const PriceMap& prices) {
    std::vector<std::pair<std::string, double>> expired;
    for (const auto& [ticker, position] : positions_) {
        if (position.expiry > date) {
            continue;
        }
        double exit_price = position.entry_price;
        const auto quote = prices.find(ticker);
        if (quote != prices.end() && quote->second > 0.0) {
            exit_price = quote->second;
        } else if (position.last_price && *position.last_price > 0.0) {
            exit_price = *position.last_price;
        }
        expired.emplace_back(ticker, exit_price);
    }

    std::size_t closed = 0;
    for (const auto& [ticker, exit_price] : expired) {
        const int64_t quantity = positions_.at(ticker).quantity;
        if (config_.verbose) {
            std::cout << "[Broker] " << date << " Contract " << ticker << " expired on "
                      << positions_.at(ticker).expiry << ", closing " << quantity << std::endl;
        }
        if (sell(ticker, quantity, exit_price, date)) {
            ++closed;
        }
    }
    return closed;
}

std::string Broker::transaction_log_csv() const {
    std::ostringstream oss;
    oss << "Date,Action,Ticker,Quantity,Price,Cash\n";
    for (const auto& entry : log_) {
        oss << entry.date << ',' << to_string(entry.action) << ',' << entry.instrument << ','
            << entry.quantity << ',' << format_decimal(entry.price, 6) << ','
            << format_decimal(entry.cash, 6) << '\n';
    }
    return oss.str();
}

void Broker::write_transaction_log(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Unable to open transaction log " + path.string());
    }
    out << transaction_log_csv();
    if (!out) {
        throw std::runtime_error("Failed to write transaction log " + path.string());
    }
}

} // namespace backtest
