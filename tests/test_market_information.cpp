#include "backtest/market_information.hpp"

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>

using backtest::MarketInformation;
using Catch::Detail::Approx;
using testing::ymd;

namespace {

std::vector<datafeed::PriceRow> two_asset_history() {
    auto rows = testing::linear_series("AAA", ymd(2024, 1, 1), ymd(2024, 3, 31), 100.0, 1.0);
    int index = 0;
    for (auto date = ymd(2024, 1, 1); date <= ymd(2024, 3, 31); date = date.add_days(1), ++index) {
        datafeed::PriceRow row;
        row.date = date;
        row.ticker = "BBB";
        row.close = 50.0 + static_cast<double>(index % 3);
        rows.push_back(row);
    }
    return rows;
}

} // namespace

TEST_CASE("slice keeps rows inside the trailing window") {
    const MarketInformation market(two_asset_history(), 10);
    const auto t = ymd(2024, 2, 15);

    const auto rows = market.slice(t);
    REQUIRE(rows.size() == 20);
    for (const auto& row : rows) {
        CHECK(row.date >= t.add_days(-10));
        CHECK(row.date < t);
    }
    CHECK(market.slice(ymd(2024, 1, 1)).empty());
}

TEST_CASE("prices returns the last close strictly before t") {
    const MarketInformation market(two_asset_history(), 30);
    const auto prices = market.prices(ymd(2024, 1, 11));

    REQUIRE(prices.size() == 2);
    CHECK(prices.at("AAA") == Approx(109.0)); // 2024-01-10 is day index 9
    CHECK(prices.at("BBB") == Approx(50.0));
    CHECK(market.prices(ymd(2023, 12, 1)).empty());
}

TEST_CASE("Input order does not matter") {
    auto rows = two_asset_history();
    std::reverse(rows.begin(), rows.end());
    const MarketInformation market(rows, 30);
    CHECK(market.prices(ymd(2024, 1, 11)).at("AAA") == Approx(109.0));
    CHECK(market.row_count() == rows.size());
}

TEST_CASE("Expired contracts can be filtered out") {
    std::vector<datafeed::PriceRow> rows;
    for (auto date = ymd(2024, 3, 1); date <= ymd(2024, 3, 28); date = date.add_days(1)) {
        datafeed::PriceRow row;
        row.date = date;
        row.ticker = "CL=F";
        row.close = 80.0;
        row.expiry = date <= ymd(2024, 3, 20) ? ymd(2024, 3, 20) : ymd(2024, 4, 22);
        rows.push_back(row);
    }

    const MarketInformation unfiltered(rows, 30, backtest::ExpiryFilter::None);
    const MarketInformation filtered(rows, 30, backtest::ExpiryFilter::DropExpired);

    CHECK(unfiltered.expiries(ymd(2024, 3, 22)).at("CL=F") == ymd(2024, 4, 22));
    CHECK(filtered.expiries(ymd(2024, 3, 22)).at("CL=F") == ymd(2024, 4, 22));

    // On 2024-03-21 only rows of the March contract exist, and it expired the day before.
    CHECK(unfiltered.prices(ymd(2024, 3, 21)).count("CL=F") == 1);
    CHECK(filtered.prices(ymd(2024, 3, 21)).count("CL=F") == 0);
    CHECK(filtered.prices(ymd(2024, 3, 20)).count("CL=F") == 1);
}

TEST_CASE("estimate computes mean returns and a symmetric covariance") {
    const MarketInformation market(two_asset_history(), 30);
    const auto estimate = market.estimate(ymd(2024, 3, 1));

    REQUIRE(estimate.instruments.size() == 2);
    CHECK(estimate.instruments[0] == "AAA");
    CHECK(estimate.instruments[1] == "BBB");
    REQUIRE(estimate.expected_returns.size() == 2);
    CHECK(estimate.expected_returns(0) > 0.0);
    REQUIRE(estimate.covariance.rows() == 2);
    REQUIRE(estimate.covariance.cols() == 2);
    CHECK(estimate.covariance.allFinite());
    CHECK(estimate.covariance(0, 1) == Approx(estimate.covariance(1, 0)));
    CHECK(estimate.covariance(0, 0) > 0.0);
    CHECK(estimate.covariance(1, 1) > 0.0);
}

TEST_CASE("estimate with too little history") {
    auto rows = testing::linear_series("AAA", ymd(2024, 1, 1), ymd(2024, 1, 1), 100.0, 0.0);
    auto other = testing::linear_series("BBB", ymd(2024, 1, 1), ymd(2024, 1, 1), 50.0, 0.0);
    rows.insert(rows.end(), other.begin(), other.end());
    const MarketInformation market(rows, 30);

    const auto estimate = market.estimate(ymd(2024, 1, 2));
    REQUIRE(estimate.instruments.size() == 2);
    CHECK(estimate.expected_returns(0) == 0.0);
    CHECK(std::isnan(estimate.covariance(0, 0)));

    const auto empty = market.estimate(ymd(2023, 6, 1));
    CHECK(empty.instruments.empty());
    CHECK(empty.covariance.size() == 0);
}

TEST_CASE("Window length must be positive") {
    CHECK_THROWS_AS(MarketInformation({}, 0), std::invalid_argument);
}
