#include "backtest/backtest_engine.hpp"

#include "backtest/run_name.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>

namespace backtest {
namespace {

std::string format_money(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

BacktestConfig validated(BacktestConfig config) {
    config.validate();
    return config;
}

} // namespace

BacktestConfig BacktestConfig::equities() {
    BacktestConfig config;
    config.asset_class = AssetClass::Equities;
    config.rebalance_policy = EndOfMonth{};
    config.risk_policy = StopLoss{};
    config.expiry_filter = ExpiryFilter::None;
    return config;
}

BacktestConfig BacktestConfig::commodities() {
    BacktestConfig config;
    config.asset_class = AssetClass::Commodities;
    config.rebalance_policy = EndOfMonthOrExpiry{};
    config.risk_policy = StopLoss{};
    config.expiry_filter = ExpiryFilter::DropExpired;
    config.ledger.name = "commodities";
    return config;
}

std::vector<std::string> BacktestConfig::tickers() const {
    if (!universe.empty()) {
        return universe;
    }
    return datafeed::default_universe(asset_class);
}

void BacktestConfig::validate() const {
    if (final_date < initial_date) {
        throw InvalidParameterError("Backtest final date " + final_date.to_string() +
                                    " precedes initial date " + initial_date.to_string());
    }
    if (!(initial_cash > 0.0) || !std::isfinite(initial_cash)) {
        throw InvalidParameterError("Initial cash must be positive");
    }
    if (window_days <= 0) {
        throw InvalidParameterError("Estimation window must be at least one day");
    }
    if (const auto* rule = std::get_if<StopLoss>(&risk_policy)) {
        if (!(rule->threshold > 0.0)) {
            throw InvalidParameterError("Stop loss threshold must be positive");
        }
    }
}

std::string to_string(BacktestState state) {
    switch (state) {
    case BacktestState::Initialized:
        return "INITIALIZED";
    case BacktestState::Running:
        return "RUNNING";
    case BacktestState::Completed:
        return "COMPLETED";
    case BacktestState::Failed:
        return "FAILED";
    }
    return "UNKNOWN";
}

BacktestExecutionError::BacktestExecutionError(Date date, std::size_t step, const std::string& cause)
    : std::runtime_error("Backtest failed on " + date.to_string() + " (step " + std::to_string(step) +
                         "): " + cause),
      date_(date),
      step_(step),
      cause_(cause) {}

BacktestEngine::BacktestEngine(BacktestConfig config, std::vector<PriceRow> rows, Ledger ledger)
    : config_(validated(std::move(config))),
      market_(std::move(rows), config_.window_days, config_.expiry_filter),
      optimizer_(config_.optimizer),
      broker_(BrokerConfig{config_.initial_cash, config_.verbose}),
      ledger_(std::move(ledger)),
      run_name_(config_.run_name.empty() ? generate_run_name() : config_.run_name) {}

BacktestResult BacktestEngine::run() {
    if (state_ != BacktestState::Initialized) {
        throw std::logic_error("Backtest " + run_name_ + " cannot be run from state " + to_string(state_));
    }
    state_ = BacktestState::Running;

    if (config_.verbose) {
        std::cout << "[Backtest] Running " << run_name_ << " (" << datafeed::to_string(config_.asset_class)
                  << ") from " << config_.initial_date << " to " << config_.final_date
                  << ", rebalance=" << describe(config_.rebalance_policy)
                  << ", risk=" << describe(config_.risk_policy) << std::endl;
    }

    std::size_t step_index = 0;
    Date date = config_.initial_date;
    try {
        for (; date <= config_.final_date; date = date.add_days(1), ++step_index) {
            step(date);
        }
        date = config_.final_date;
        return finish();
    } catch (const std::exception& ex) {
        state_ = BacktestState::Failed;
        std::cerr << "[Backtest] " << run_name_ << " failed on " << date << ": " << ex.what() << std::endl;
        throw BacktestExecutionError(date, step_index, ex.what());
    }
}

void BacktestEngine::step(Date date) {
    const PriceMap prices = market_.prices(date);
    broker_.mark(prices);
    broker_.expire_options(date);

    apply_risk_policy(config_.risk_policy, broker_, prices, date);

    if (should_rebalance(config_.rebalance_policy, date, broker_)) {
        rebalance(date);
    }
}

void BacktestEngine::rebalance(Date date) {
    const MarketEstimate estimate = market_.estimate(date);
    const PortfolioWeights weights = optimizer_.optimize(estimate);
    const PriceMap prices = market_.prices(date);

    broker_.sell_expired_contracts(date, prices);
    broker_.rebalance(weights, prices, date, market_.expiries(date));
    ++rebalances_;

    if (config_.verbose) {
        std::cout << "[Backtest] " << date << " Rebalanced " << weights.size() << " instruments, value "
                  << format_money(broker_.value(prices, date)) << std::endl;
    }
}

BacktestResult BacktestEngine::finish() {
    const PriceMap final_prices = market_.prices(config_.final_date);

    BacktestResult result;
    result.run_name = run_name_;
    result.initial_value = config_.initial_cash;
    result.final_value = broker_.value(final_prices, config_.final_date);
    result.days = static_cast<std::size_t>(config_.final_date - config_.initial_date) + 1;
    result.rebalances = rebalances_;
    result.transactions = broker_.transactions().size();
    result.transaction_log = config_.output_dir / (run_name_ + ".csv");

    broker_.write_transaction_log(result.transaction_log);
    result.block_hash = ledger_.append(run_name_, broker_.transaction_log_csv()).hash;

    state_ = BacktestState::Completed;
    std::cout << "[Backtest] " << run_name_ << " completed: final value " << format_money(result.final_value)
              << " (" << result.transactions << " trades, " << result.rebalances << " rebalances), log "
              << result.transaction_log.string() << std::endl;
    return result;
}

std::vector<PriceRow> load_price_history(datafeed::PriceSource& source, const BacktestConfig& config) {
    config.validate();
    const auto tickers = config.tickers();
    const std::set<std::string> requested(tickers.begin(), tickers.end());
    const Date start = config.initial_date.add_days(-config.window_days);

    auto rows = source.fetch(requested, start, config.final_date);
    datafeed::annotate_expiries(rows, config.asset_class);

    if (config.verbose) {
        std::cout << "[Data] Loaded " << rows.size() << " rows for " << requested.size() << " tickers from "
                  << start << " to " << config.final_date << std::endl;
    }
    return rows;
}

} // namespace backtest
