#pragma once

#include "backtest/market_information.hpp"
#include "backtest/option.hpp"
#include "backtest/portfolio_optimizer.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace backtest {

class InsufficientFundsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InsufficientHoldingsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Position {
    std::string ticker;
    int64_t quantity = 0;
    double entry_price = 0.0;
    Date expiry = Date::never();
    std::optional<double> last_price;
};

struct OptionPosition {
    std::string name;
    OptionContract contract;
    std::string underlying;
    int64_t quantity = 0;
    double entry_premium = 0.0;
    Date opened;

    [[nodiscard]] double remaining_days(Date date) const {
        return contract.time_to_maturity_days - static_cast<double>(date - opened);
    }
    [[nodiscard]] bool is_expired(Date date) const { return remaining_days(date) <= 0.0; }
};

enum class TradeAction { Buy, Sell, BuyOption, SellOption };

std::string to_string(TradeAction action);

struct TransactionRecord {
    Date date;
    TradeAction action = TradeAction::Buy;
    std::string instrument;
    int64_t quantity = 0;
    double price = 0.0;
    double cash = 0.0; // balance after the trade
};

struct BrokerConfig {
    double initial_cash = 1'000'000.0;
    bool verbose = false;
};

// Cash account with share/contract positions and option positions. Trades that
// cannot be covered are logged and skipped rather than raised.
class Broker {
public:
    explicit Broker(BrokerConfig config = {});

    // Throws InvalidParameterError for non-positive quantity or price.
    bool buy(const std::string& ticker, int64_t quantity, double price, Date date,
             Date expiry = Date::never());
    bool sell(const std::string& ticker, int64_t quantity, double price, Date date);

    // Premium comes from the pricing model at the contract's own parameters.
    bool buy_option(const std::string& name, const OptionContract& contract, int64_t quantity,
                    Date date, const std::string& underlying = "");
    // Re-prices with the underlying's quote (when known) and the remaining days.
    bool sell_option(const std::string& name, int64_t quantity, Date date,
                     const PriceMap& prices = {});
    // Drops option positions whose remaining life is used up. Returns how many were removed.
    std::size_t expire_options(Date date);

    void mark(const PriceMap& prices);

    void rebalance(const PortfolioWeights& weights, const PriceMap& prices, Date date,
                   const ExpiryMap& expiries = {});

    // Positions without a quote are left out of the total. Options are carried at
    // their entry premium unless `as_of` is given, in which case they are re-priced.
    double value(const PriceMap& prices, std::optional<Date> as_of = std::nullopt) const;

    // Closes every position whose contract expired on or before `date`.
    std::size_t sell_expired_contracts(Date date, const PriceMap& prices);

    [[nodiscard]] double cash() const noexcept { return cash_; }
    [[nodiscard]] const std::map<std::string, Position>& positions() const { return positions_; }
    [[nodiscard]] const std::map<std::string, OptionPosition>& option_positions() const {
        return option_positions_;
    }
    [[nodiscard]] const std::vector<TransactionRecord>& transactions() const { return log_; }
    [[nodiscard]] bool verbose() const noexcept { return config_.verbose; }

    std::string transaction_log_csv() const;
    void write_transaction_log(const std::filesystem::path& path) const;

private:
    void execute_buy(const std::string& ticker, int64_t quantity, double price, Date date, Date expiry);
    void execute_sell(const std::string& ticker, int64_t quantity, double price, Date date);
    double option_premium(const OptionPosition& position, Date date, const PriceMap& prices) const;
    void record(Date date, TradeAction action, const std::string& instrument, int64_t quantity, double price);

    BrokerConfig config_;
    double cash_;
    std::map<std::string, Position> positions_;
    std::map<std::string, OptionPosition> option_positions_;
    std::vector<TransactionRecord> log_;
};

} // namespace backtest
