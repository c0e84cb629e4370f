#pragma once

#include "backtest/broker.hpp"
#include "backtest/ledger.hpp"
#include "backtest/market_information.hpp"
#include "backtest/policies.hpp"
#include "backtest/portfolio_optimizer.hpp"
#include "datafeed/price_source.hpp"

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace backtest {

using datafeed::AssetClass;

struct BacktestConfig {
    AssetClass asset_class = AssetClass::Equities;
    Date initial_date = Date::from_ymd(2019, 1, 1);
    Date final_date = Date::from_ymd(2020, 1, 1);
    std::vector<std::string> universe; // empty -> default universe for the asset class
    double initial_cash = 1'000'000.0;
    int window_days = kDefaultWindowDays;
    OptimizerConfig optimizer;
    RebalancePolicy rebalance_policy = EndOfMonth{};
    RiskPolicy risk_policy = StopLoss{};
    ExpiryFilter expiry_filter = ExpiryFilter::None;
    LedgerConfig ledger;
    std::filesystem::path output_dir = "backtests";
    std::string run_name; // empty -> generated
    bool verbose = true;

    static BacktestConfig equities();
    // Rolls on contract expiry and ignores rows of expired contracts.
    static BacktestConfig commodities();

    [[nodiscard]] std::vector<std::string> tickers() const;
    // Throws InvalidParameterError for an empty or reversed date range and other bad values.
    void validate() const;
};

enum class BacktestState { Initialized, Running, Completed, Failed };

std::string to_string(BacktestState state);

struct BacktestResult {
    std::string run_name;
    double initial_value = 0.0;
    double final_value = 0.0;
    std::size_t days = 0;
    std::size_t rebalances = 0;
    std::size_t transactions = 0;
    std::filesystem::path transaction_log;
    std::string block_hash;
};

class BacktestExecutionError : public std::runtime_error {
public:
    BacktestExecutionError(Date date, std::size_t step, const std::string& cause);

    [[nodiscard]] Date date() const noexcept { return date_; }
    [[nodiscard]] std::size_t step() const noexcept { return step_; }
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

private:
    Date date_;
    std::size_t step_;
    std::string cause_;
};

// Daily simulation over [initial_date, final_date]: mark, apply risk rules,
// rebalance on schedule, then record the run in the ledger.
class BacktestEngine {
public:
    BacktestEngine(BacktestConfig config, std::vector<PriceRow> rows, Ledger ledger);

    // One-shot. Throws std::logic_error unless the engine is still Initialized and
    // BacktestExecutionError (state Failed) when a step throws.
    BacktestResult run();

    [[nodiscard]] BacktestState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& run_name() const noexcept { return run_name_; }
    [[nodiscard]] const BacktestConfig& config() const noexcept { return config_; }
    [[nodiscard]] const Broker& broker() const noexcept { return broker_; }
    [[nodiscard]] const Ledger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const MarketInformation& market() const noexcept { return market_; }

private:
    void step(Date date);
    void rebalance(Date date);
    BacktestResult finish();

    BacktestConfig config_;
    MarketInformation market_;
    PortfolioOptimizer optimizer_;
    Broker broker_;
    Ledger ledger_;
    std::string run_name_;
    BacktestState state_ = BacktestState::Initialized;
    std::size_t rebalances_ = 0;
};

// Fetches closes for the configured universe from `initial_date - window_days`
// through `final_date` and attaches contract expiries for the asset class.
std::vector<PriceRow> load_price_history(datafeed::PriceSource& source, const BacktestConfig& config);

} // namespace backtest
