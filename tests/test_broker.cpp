#include "backtest/broker.hpp"
#include "backtest/policies.hpp"

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <fstream>
#include <sstream>

using backtest::Broker;
using backtest::BrokerConfig;
using backtest::TradeAction;
using Catch::Detail::Approx;
using testing::ymd;

namespace {

Broker broker_with(double cash) {
    return Broker(BrokerConfig{cash, false});
}

} // namespace

TEST_CASE("Buying and selling moves cash and positions") {
    auto broker = broker_with(1000.0);
    const auto day = ymd(2024, 1, 2);

    REQUIRE(broker.buy("X", 10, 50.0, day));
    CHECK(broker.cash() == 500.0);
    REQUIRE(broker.positions().count("X") == 1);
    CHECK(broker.positions().at("X").quantity == 10);
    CHECK(broker.positions().at("X").entry_price == 50.0);

    REQUIRE(broker.sell("X", 5, 60.0, day));
    CHECK(broker.cash() == 800.0);
    CHECK(broker.positions().at("X").quantity == 5);

    REQUIRE(broker.sell("X", 5, 60.0, day));
    CHECK(broker.positions().count("X") == 0);
    CHECK(broker.transactions().size() == 3);
}

TEST_CASE("Buy followed by sell at the same price restores cash exactly") {
    auto broker = broker_with(1000.0);
    const auto day = ymd(2024, 1, 2);
    REQUIRE(broker.buy("X", 37, 12.25, day));
    REQUIRE(broker.sell("X", 37, 12.25, day));
    CHECK(broker.cash() == 1000.0);
}

TEST_CASE("Entry price is the weighted average of fills") {
    auto broker = broker_with(10000.0);
    const auto day = ymd(2024, 1, 2);
    broker.buy("X", 10, 100.0, day);
    broker.buy("X", 30, 60.0, day);
    CHECK(broker.positions().at("X").quantity == 40);
    CHECK(broker.positions().at("X").entry_price == Approx(70.0));
}

TEST_CASE("Uncovered trades are skipped") {
    auto broker = broker_with(100.0);
    const auto day = ymd(2024, 1, 2);

    CHECK_FALSE(broker.buy("X", 3, 50.0, day));
    CHECK(broker.cash() == 100.0);
    CHECK(broker.positions().empty());

    REQUIRE(broker.buy("X", 1, 50.0, day));
    CHECK_FALSE(broker.sell("X", 2, 50.0, day));
    CHECK_FALSE(broker.sell("Y", 1, 50.0, day));
    CHECK(broker.positions().at("X").quantity == 1);
    CHECK(broker.transactions().size() == 1);
}

TEST_CASE("Invalid trade arguments throw") {
    auto broker = broker_with(100.0);
    const auto day = ymd(2024, 1, 2);
    CHECK_THROWS_AS(broker.buy("X", 0, 10.0, day), backtest::InvalidParameterError);
    CHECK_THROWS_AS(broker.buy("X", 1, 0.0, day), backtest::InvalidParameterError);
    CHECK_THROWS_AS(broker.sell("X", -1, 10.0, day), backtest::InvalidParameterError);
    CHECK_THROWS_AS(Broker(BrokerConfig{-1.0, false}), backtest::InvalidParameterError);
}

TEST_CASE("value leaves out positions without a quote") {
    auto broker = broker_with(1000.0);
    broker.buy("X", 10, 50.0, ymd(2024, 1, 2));

    CHECK(broker.value({{"X", 55.0}}) == Approx(1050.0));
    // Unpriced holdings are excluded, not carried at cost or at their last mark.
    broker.mark({{"X", 55.0}});
    CHECK(broker.value({}) == Approx(500.0));
    CHECK(broker.value({{"Y", 1.0}}) == Approx(500.0));
}

TEST_CASE("mark records the latest quote") {
    auto broker = broker_with(1000.0);
    broker.buy("X", 1, 50.0, ymd(2024, 1, 2));
    broker.mark({{"X", 52.5}, {"Y", 1.0}});
    REQUIRE(broker.positions().at("X").last_price.has_value());
    CHECK(*broker.positions().at("X").last_price == 52.5);
    CHECK(broker.positions().count("Y") == 0);
}

TEST_CASE("rebalance sells before buying and partially fills on a cash shortfall") {
    auto broker = broker_with(10000.0);
    const backtest::PortfolioWeights weights{{"A", 0.5}, {"B", 0.5}};

    broker.rebalance(weights, {{"A", 100.0}, {"B", 50.0}}, ymd(2024, 1, 31));
    CHECK(broker.positions().at("A").quantity == 50);
    CHECK(broker.positions().at("B").quantity == 100);
    CHECK(broker.cash() == Approx(0.0));

    // A doubled: total 15000, sell 12 A (trunc of 12.5), want 50 B but afford 48.
    broker.rebalance(weights, {{"A", 200.0}, {"B", 50.0}}, ymd(2024, 2, 29));
    CHECK(broker.positions().at("A").quantity == 38);
    CHECK(broker.positions().at("B").quantity == 148);
    CHECK(broker.cash() == Approx(0.0));

    const auto& log = broker.transactions();
    REQUIRE(log.size() == 4);
    CHECK(log[2].action == TradeAction::Sell);
    CHECK(log[3].action == TradeAction::Buy);
    CHECK(log[3].quantity == 48);
}

TEST_CASE("rebalance skips instruments without a price and applies expiries") {
    auto broker = broker_with(1000.0);
    const backtest::PortfolioWeights weights{{"CL=F", 0.5}, {"NG=F", 0.5}};
    broker.rebalance(weights, {{"CL=F", 80.0}}, ymd(2024, 3, 1), {{"CL=F", ymd(2024, 3, 20)}});

    REQUIRE(broker.positions().size() == 1);
    CHECK(broker.positions().at("CL=F").quantity == 6);
    CHECK(broker.positions().at("CL=F").expiry == ymd(2024, 3, 20));
}

TEST_CASE("Expired contracts are closed at the best available price") {
    auto broker = broker_with(1000.0);
    broker.buy("CL=F", 5, 80.0, ymd(2024, 3, 1), ymd(2024, 3, 20));
    broker.buy("AAPL", 1, 100.0, ymd(2024, 3, 1));

    CHECK(broker.sell_expired_contracts(ymd(2024, 3, 19), {{"CL=F", 81.0}}) == 0);

    SECTION("quoted price") {
        CHECK(broker.sell_expired_contracts(ymd(2024, 3, 20), {{"CL=F", 82.0}}) == 1);
        CHECK(broker.cash() == Approx(1000.0 - 400.0 - 100.0 + 410.0));
    }

    SECTION("last mark when unquoted") {
        broker.mark({{"CL=F", 85.0}});
        CHECK(broker.sell_expired_contracts(ymd(2024, 3, 21), {}) == 1);
        CHECK(broker.cash() == Approx(1000.0 - 400.0 - 100.0 + 425.0));
    }

    CHECK(broker.positions().count("CL=F") == 0);
    CHECK(broker.positions().count("AAPL") == 1);
}

TEST_CASE("Options are bought at the model premium and expire") {
    auto broker = broker_with(10000.0);
    const auto opened = ymd(2024, 1, 2);
    const auto contract = backtest::make_option(backtest::OptionType::Call, 100.0, 100.0, 0.05, 0.0, 30.0, 0.2);
    const double premium = backtest::price(contract);

    REQUIRE(broker.buy_option("AAPL_C100", contract, 2, opened, "AAPL"));
    CHECK(broker.cash() == Approx(10000.0 - 2.0 * premium));
    CHECK(broker.value({}) == Approx(10000.0));
    CHECK(broker.transactions().back().action == TradeAction::BuyOption);

    // Repriced ten days on with the underlying up.
    const auto later = opened.add_days(10);
    CHECK(broker.value({{"AAPL", 110.0}}, later) > broker.value({}, opened));

    REQUIRE(broker.sell_option("AAPL_C100", 1, later, {{"AAPL", 110.0}}));
    CHECK(broker.option_positions().at("AAPL_C100").quantity == 1);
    CHECK_FALSE(broker.sell_option("AAPL_C100", 5, later));
    CHECK_FALSE(broker.sell_option("MISSING", 1, later));

    CHECK(broker.expire_options(opened.add_days(29)) == 0);
    CHECK(broker.expire_options(opened.add_days(30)) == 1);
    CHECK(broker.option_positions().empty());
}

TEST_CASE("Options that cannot be paid for are skipped") {
    auto broker = broker_with(1.0);
    const auto contract = backtest::make_option(backtest::OptionType::Put, 100.0, 120.0, 0.0, 0.0, 90.0, 0.3);
    CHECK_FALSE(broker.buy_option("P120", contract, 1, ymd(2024, 1, 2)));
    CHECK(broker.option_positions().empty());
    CHECK(broker.cash() == 1.0);
}

TEST_CASE("Transaction log CSV") {
    testing::ScopedTempDir dir("chainbt-broker");
    auto broker = broker_with(1000.0);
    broker.buy("X", 10, 50.0, ymd(2024, 1, 2));
    broker.sell("X", 4, 55.0, ymd(2024, 1, 3));

    const auto csv = broker.transaction_log_csv();
    std::istringstream lines(csv);
    std::string line;
    std::getline(lines, line);
    CHECK(line == "Date,Action,Ticker,Quantity,Price,Cash");
    std::getline(lines, line);
    CHECK(line == "2024-01-02,BUY,X,10,50.000000,500.000000");
    std::getline(lines, line);
    CHECK(line == "2024-01-03,SELL,X,4,55.000000,720.000000");

    const auto path = dir.path() / "out" / "run.csv";
    broker.write_transaction_log(path);
    std::ifstream written(path);
    std::stringstream contents;
    contents << written.rdbuf();
    CHECK(contents.str() == csv);
}

TEST_CASE("Stop loss liquidates losing positions") {
    auto broker = broker_with(10000.0);
    const auto day = ymd(2024, 1, 2);
    broker.buy("LOSER", 10, 100.0, day);
    broker.buy("HOLDER", 10, 100.0, day);

    const backtest::PriceMap prices{{"LOSER", 89.0}, {"HOLDER", 91.0}};
    CHECK(backtest::apply_risk_policy(backtest::RiskPolicy{}, broker, prices, day) == 0);
    CHECK(backtest::apply_risk_policy(backtest::StopLoss{0.1}, broker, prices, day) == 1);
    CHECK(broker.positions().count("LOSER") == 0);
    CHECK(broker.positions().count("HOLDER") == 1);
}

TEST_CASE("Rebalance schedule") {
    auto broker = broker_with(1000.0);
    const backtest::RebalancePolicy monthly = backtest::EndOfMonth{};
    const backtest::RebalancePolicy rolling = backtest::EndOfMonthOrExpiry{};

    CHECK(backtest::should_rebalance(monthly, ymd(2024, 11, 29), broker));
    CHECK_FALSE(backtest::should_rebalance(monthly, ymd(2024, 11, 28), broker));
    CHECK_FALSE(backtest::should_rebalance(rolling, ymd(2024, 3, 20), broker));

    broker.buy("CL=F", 1, 80.0, ymd(2024, 3, 1), ymd(2024, 3, 20));
    CHECK_FALSE(backtest::should_rebalance(rolling, ymd(2024, 3, 19), broker));
    CHECK(backtest::should_rebalance(rolling, ymd(2024, 3, 20), broker));
    CHECK_FALSE(backtest::should_rebalance(monthly, ymd(2024, 3, 20), broker));
}
