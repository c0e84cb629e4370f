#pragma once

#include "backtest/market_information.hpp"

#include <Eigen/Dense>

#include <map>
#include <stdexcept>
#include <string>

namespace backtest {

using PortfolioWeights = std::map<std::string, double>;

class OptimizationFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct OptimizerConfig {
    double risk_aversion = 1.0;
    int max_iterations = 50000;
    double tolerance = 1e-9; // on the projected-gradient stationarity residual
    double min_eigenvalue_ratio = 1e-12;
};

// Long-only, fully invested mean-variance allocation:
//   minimize -mu'w + (gamma / 2) w'Sigma w  s.t.  sum(w) = 1, 0 <= w <= 1
class PortfolioOptimizer {
public:
    explicit PortfolioOptimizer(OptimizerConfig config = {});

    // Never throws on numerical trouble: falls back to equal weights and logs a warning.
    PortfolioWeights optimize(const MarketEstimate& estimate) const;

    // Exact active-set solve. Throws OptimizationFailure on bad input, a covariance
    // that is not positive definite, or a result that fails the stationarity check.
    Eigen::VectorXd solve(const Eigen::VectorXd& expected_returns,
                          const Eigen::MatrixXd& covariance) const;

    [[nodiscard]] const OptimizerConfig& config() const noexcept { return config_; }

private:
    OptimizerConfig config_;
};

// Euclidean projection onto {w : w >= 0, sum(w) = 1}.
Eigen::VectorXd project_to_simplex(const Eigen::VectorXd& v);

// max |w - P(w - step * gradient)|; zero exactly at a constrained optimum.
double stationarity_residual(const Eigen::VectorXd& w, const Eigen::VectorXd& gradient, double step);

PortfolioWeights equal_weights(const std::vector<std::string>& instruments);

} // namespace backtest
