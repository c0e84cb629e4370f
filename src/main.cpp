#include "backtest/backtest_engine.hpp"
#include "datafeed/chart_client.hpp"
#include "datafeed/csv_price_source.hpp"
#include "datafeed/util.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace {

std::optional<std::string> env_value(const char* key) {
    const char* value = std::getenv(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    auto trimmed = datafeed::trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

double env_double(const char* key, double fallback) {
    const auto value = env_value(key);
    if (!value) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(*value, &consumed);
        if (consumed != value->size()) {
            throw std::invalid_argument(*value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(key) + " is not a number: '" + *value + "'");
    }
}

int env_int(const char* key, int fallback) {
    const auto value = env_value(key);
    if (!value) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(*value, &consumed);
        if (consumed != value->size()) {
            throw std::invalid_argument(*value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(key) + " is not an integer: '" + *value + "'");
    }
}

bool env_flag(const char* key, bool fallback) {
    const auto value = env_value(key);
    if (!value) {
        return fallback;
    }
    const auto upper = datafeed::to_upper_copy(*value);
    return upper == "1" || upper == "TRUE" || upper == "YES" || upper == "ON";
}

backtest::BacktestConfig load_config_from_env() {
    const auto asset_class = env_value("CHAINBT_ASSET_CLASS")
                                 ? datafeed::parse_asset_class(*env_value("CHAINBT_ASSET_CLASS"))
                                 : datafeed::AssetClass::Equities;

    auto config = asset_class == datafeed::AssetClass::Commodities ? backtest::BacktestConfig::commodities()
                                                                   : backtest::BacktestConfig::equities();

    if (const auto universe = env_value("CHAINBT_UNIVERSE")) {
        config.universe = datafeed::split_list(*universe, ',');
    }
    if (const auto start = env_value("CHAINBT_START")) {
        config.initial_date = datafeed::Date::parse(*start);
    }
    if (const auto end = env_value("CHAINBT_END")) {
        config.final_date = datafeed::Date::parse(*end);
    }
    config.initial_cash = env_double("CHAINBT_INITIAL_CASH", config.initial_cash);
    config.window_days = env_int("CHAINBT_WINDOW_DAYS", config.window_days);
    config.optimizer.risk_aversion = env_double("CHAINBT_RISK_AVERSION", config.optimizer.risk_aversion);

    const double stop_loss = env_double("CHAINBT_STOP_LOSS", 0.1);
    if (stop_loss > 0.0) {
        config.risk_policy = backtest::StopLoss{stop_loss};
    } else {
        config.risk_policy = std::monostate{};
    }

    if (const auto dir = env_value("CHAINBT_LEDGER_DIR")) {
        config.ledger.directory = *dir;
    }
    if (const auto name = env_value("CHAINBT_LEDGER_NAME")) {
        config.ledger.name = *name;
    }
    if (const auto dir = env_value("CHAINBT_OUTPUT_DIR")) {
        config.output_dir = *dir;
    }
    if (const auto name = env_value("CHAINBT_RUN_NAME")) {
        config.run_name = *name;
    }
    config.verbose = env_flag("CHAINBT_VERBOSE", config.verbose);

    config.validate();
    return config;
}

datafeed::ChartClientConfig chart_config() {
    datafeed::ChartClientConfig chart;
    if (const auto url = env_value("CHAINBT_CHART_URL")) {
        chart.base_url = *url;
    }
    return chart;
}

std::unique_ptr<datafeed::PriceSource> make_price_source() {
    if (const auto path = env_value("CHAINBT_DATA_CSV")) {
        std::cout << "[Config] Reading prices from " << *path << std::endl;
        datafeed::CsvPriceSourceConfig csv;
        csv.path = *path;
        return std::make_unique<datafeed::CsvPriceSource>(csv);
    }
    const auto chart = chart_config();
    std::cout << "[Config] Downloading prices from " << chart.base_url << std::endl;
    return std::make_unique<datafeed::ChartClient>(chart);
}

// Lists the dated contracts of `root` quoted between the configured start and end.
int discover_contracts(const std::string& root, const backtest::BacktestConfig& config) {
    datafeed::ChartClient client(chart_config());
    const auto contracts = client.available_contracts(root, config.initial_date.year(),
                                                      config.final_date.year() + 1, config.initial_date,
                                                      config.final_date);
    std::cout << "[Data] " << contracts.size() << " " << root << " contracts quoted from " << config.initial_date
              << " to " << config.final_date << std::endl;
    for (const auto& contract : contracts) {
        std::cout << contract << std::endl;
    }
    return 0;
}

} // namespace

int main() {
    const int loaded = datafeed::load_env_file(".env");
    if (loaded > 0) {
        std::cout << "[Config] Loaded " << loaded << " settings from .env" << std::endl;
    }

    backtest::BacktestConfig config;
    try {
        config = load_config_from_env();
    } catch (const std::exception& ex) {
        std::cerr << "[Config] Invalid configuration: " << ex.what() << std::endl;
        return 2;
    }

    if (const auto root = env_value("CHAINBT_DISCOVER_FUTURES")) {
        try {
            return discover_contracts(*root, config);
        } catch (const std::exception& ex) {
            std::cerr << "[Data] Contract discovery failed: " << ex.what() << std::endl;
            return 1;
        }
    }

    try {
        auto source = make_price_source();
        auto rows = backtest::load_price_history(*source, config);
        auto ledger = backtest::Ledger::create(config.ledger, true);

        backtest::BacktestEngine engine{config, std::move(rows), std::move(ledger)};
        const auto result = engine.run();

        std::cout << "[Backtest] " << result.run_name << ": " << result.initial_value << " -> "
                  << result.final_value << std::endl;
        std::cout << "[Ledger] " << engine.ledger().describe() << std::endl;
        if (!engine.ledger().verify()) {
            std::cerr << "[Ledger] Chain " << engine.ledger().name() << " failed verification" << std::endl;
            return 1;
        }
    } catch (const backtest::BacktestExecutionError& ex) {
        std::cerr << "[Backtest] " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "[Backtest] Setup failed: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
