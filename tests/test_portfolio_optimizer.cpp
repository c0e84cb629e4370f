#include "backtest/portfolio_optimizer.hpp"

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <random>

using backtest::MarketEstimate;
using backtest::PortfolioOptimizer;
using Catch::Detail::Approx;

namespace {

MarketEstimate make_estimate(std::vector<std::string> instruments, Eigen::VectorXd mu, Eigen::MatrixXd sigma) {
    MarketEstimate estimate;
    estimate.instruments = std::move(instruments);
    estimate.expected_returns = std::move(mu);
    estimate.covariance = std::move(sigma);
    return estimate;
}

double total_weight(const backtest::PortfolioWeights& weights) {
    double sum = 0.0;
    for (const auto& [name, weight] : weights) {
        (void)name;
        sum += weight;
    }
    return sum;
}

// Geometric random walks, one row per calendar day from `first`, 2% daily volatility.
std::vector<datafeed::PriceRow> random_walks(unsigned seed, int instruments, datafeed::Date first, int days) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> start_price(35.0, 900.0);
    std::normal_distribution<double> shock(0.0, 0.02);

    std::vector<datafeed::PriceRow> rows;
    for (int k = 0; k < instruments; ++k) {
        const std::string ticker = "S" + std::to_string(10 + k);
        double close = start_price(rng);
        for (int day = 0; day < days; ++day) {
            datafeed::PriceRow row;
            row.date = first.add_days(day);
            row.ticker = ticker;
            row.close = close;
            rows.push_back(row);
            close *= std::exp(shock(rng));
        }
    }
    return rows;
}

double objective(const Eigen::VectorXd& mu, const Eigen::MatrixXd& sigma, const Eigen::VectorXd& w) {
    return -mu.dot(w) + 0.5 * w.dot(sigma * w);
}

} // namespace

TEST_CASE("Weights are long-only and fully invested") {
    Eigen::VectorXd mu(3);
    mu << 0.02, 0.01, -0.01;
    Eigen::MatrixXd sigma(3, 3);
    sigma << 0.10, 0.02, 0.01,
             0.02, 0.08, 0.00,
             0.01, 0.00, 0.05;

    const PortfolioOptimizer optimizer;
    const auto weights = optimizer.optimize(make_estimate({"A", "B", "C"}, mu, sigma));

    REQUIRE(weights.size() == 3);
    CHECK(total_weight(weights) == Approx(1.0).margin(1e-9));
    for (const auto& [name, weight] : weights) {
        INFO(name);
        CHECK(weight >= 0.0);
        CHECK(weight <= 1.0 + 1e-12);
    }
}

TEST_CASE("Symmetric inputs give equal weights") {
    const Eigen::VectorXd mu = Eigen::VectorXd::Constant(3, 0.01);
    const Eigen::MatrixXd sigma = Eigen::MatrixXd::Identity(3, 3) * 0.04;

    const auto weights = PortfolioOptimizer().optimize(make_estimate({"A", "B", "C"}, mu, sigma));
    for (const auto& [name, weight] : weights) {
        INFO(name);
        CHECK(weight == Approx(1.0 / 3.0).margin(1e-9));
    }
}

TEST_CASE("Solution satisfies the optimality conditions") {
    // Unconstrained optimum of -mu'w + 0.5 w'Sw with S = I is w = mu; with
    // mu = (0.7, 0.3) that is already on the simplex.
    Eigen::VectorXd mu(2);
    mu << 0.7, 0.3;
    const Eigen::MatrixXd sigma = Eigen::MatrixXd::Identity(2, 2);

    const auto w = PortfolioOptimizer().solve(mu, sigma);
    CHECK(w(0) == Approx(0.7).margin(1e-8));
    CHECK(w(1) == Approx(0.3).margin(1e-8));
}

TEST_CASE("A dominated asset gets no weight") {
    Eigen::VectorXd mu(2);
    mu << 5.0, -5.0;
    const Eigen::MatrixXd sigma = Eigen::MatrixXd::Identity(2, 2);

    const auto w = PortfolioOptimizer().solve(mu, sigma);
    CHECK(w(0) == Approx(1.0).margin(1e-9));
    CHECK(w(1) == Approx(0.0).margin(1e-9));
}

TEST_CASE("Singular covariance falls back to equal weights") {
    const Eigen::VectorXd mu = Eigen::VectorXd::Constant(2, 0.01);
    Eigen::MatrixXd sigma(2, 2);
    sigma << 1.0, 1.0,
             1.0, 1.0;

    const PortfolioOptimizer optimizer;
    CHECK_THROWS_AS(optimizer.solve(mu, sigma), backtest::OptimizationFailure);

    const auto weights = optimizer.optimize(make_estimate({"A", "B"}, mu, sigma));
    REQUIRE(weights.size() == 2);
    CHECK(weights.at("A") == 0.5);
    CHECK(weights.at("B") == 0.5);
}

TEST_CASE("Undetermined covariance falls back to equal weights") {
    const Eigen::VectorXd mu = Eigen::VectorXd::Zero(4);
    const Eigen::MatrixXd sigma =
        Eigen::MatrixXd::Constant(4, 4, std::numeric_limits<double>::quiet_NaN());

    const auto weights = PortfolioOptimizer().optimize(make_estimate({"A", "B", "C", "D"}, mu, sigma));
    REQUIRE(weights.size() == 4);
    for (const auto& [name, weight] : weights) {
        INFO(name);
        CHECK(weight == 0.25);
    }
}

TEST_CASE("Shape mismatch and empty input") {
    const PortfolioOptimizer optimizer;
    CHECK_THROWS_AS(optimizer.solve(Eigen::VectorXd::Zero(2), Eigen::MatrixXd::Identity(3, 3)),
                    backtest::OptimizationFailure);
    CHECK_THROWS_AS(optimizer.solve(Eigen::VectorXd(), Eigen::MatrixXd()), backtest::OptimizationFailure);
    CHECK(optimizer.optimize(MarketEstimate{}).empty());
}

TEST_CASE("Simplex projection") {
    Eigen::VectorXd v(3);
    v << 0.2, 0.3, 0.5;
    const auto unchanged = backtest::project_to_simplex(v);
    CHECK(unchanged(0) == Approx(0.2));
    CHECK(unchanged(2) == Approx(0.5));

    v << 3.0, 0.0, -1.0;
    const auto clipped = backtest::project_to_simplex(v);
    CHECK(clipped(0) == Approx(1.0));
    CHECK(clipped(1) == Approx(0.0).margin(1e-12));
    CHECK(clipped(2) == Approx(0.0).margin(1e-12));
}

TEST_CASE("Optimizer configuration is validated") {
    backtest::OptimizerConfig config;
    config.risk_aversion = 0.0;
    CHECK_THROWS_AS(PortfolioOptimizer(config), std::invalid_argument);
}

TEST_CASE("Price covariance of random walks is solved exactly") {
    const auto first = testing::ymd(2023, 1, 1);
    const int days = backtest::kDefaultWindowDays;

    for (unsigned seed = 1; seed <= 10; ++seed) {
        INFO("seed " << seed);
        const backtest::MarketInformation market(random_walks(seed, 10, first, days));
        const auto estimate = market.estimate(first.add_days(days));
        REQUIRE(estimate.instruments.size() == 10);
        const auto& mu = estimate.expected_returns;
        const auto& sigma = estimate.covariance;

        const PortfolioOptimizer optimizer;
        Eigen::VectorXd w;
        REQUIRE_NOTHROW(w = optimizer.solve(mu, sigma));

        CHECK(w.sum() == Approx(1.0).margin(1e-9));
        CHECK(w.minCoeff() >= 0.0);

        const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen(sigma, Eigen::EigenvaluesOnly);
        const double lambda_max = eigen.eigenvalues().maxCoeff();
        const Eigen::VectorXd gradient = sigma * w - mu;
        CHECK(backtest::stationarity_residual(w, gradient, 1.0 / lambda_max) < 1e-9);

        // Invested weights share one marginal cost; the rest cost at least as much.
        Eigen::Index largest = 0;
        w.maxCoeff(&largest);
        const double budget = gradient(largest);
        const double slack = 1e-8 * lambda_max;
        for (Eigen::Index i = 0; i < w.size(); ++i) {
            if (w(i) > 0.0) {
                CHECK(std::abs(gradient(i) - budget) <= slack);
            } else {
                CHECK(gradient(i) >= budget - slack);
            }
        }

        const double best = objective(mu, sigma, w);
        CHECK(best <= objective(mu, sigma, Eigen::VectorXd::Constant(10, 0.1)) + 1e-9);
        for (Eigen::Index j = 0; j < 10; ++j) {
            CHECK(best <= objective(mu, sigma, Eigen::VectorXd::Unit(10, j)) + 1e-9);
        }

        // optimize() keeps the solved weights instead of falling back.
        const auto weights = optimizer.optimize(estimate);
        for (std::size_t i = 0; i < estimate.instruments.size(); ++i) {
            CHECK(weights.at(estimate.instruments[i]) == Approx(w(static_cast<Eigen::Index>(i))).margin(1e-12));
        }
    }
}

TEST_CASE("Stationarity residual is zero at the optimum and positive elsewhere") {
    Eigen::VectorXd mu(2);
    mu << 0.7, 0.3;
    const Eigen::MatrixXd sigma = Eigen::MatrixXd::Identity(2, 2);

    Eigen::VectorXd optimum(2);
    optimum << 0.7, 0.3;
    CHECK(backtest::stationarity_residual(optimum, sigma * optimum - mu, 1.0) == Approx(0.0).margin(1e-15));

    const Eigen::VectorXd equal = Eigen::VectorXd::Constant(2, 0.5);
    CHECK(backtest::stationarity_residual(equal, sigma * equal - mu, 1.0) == Approx(0.2));
}
