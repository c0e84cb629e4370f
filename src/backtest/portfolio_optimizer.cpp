#include "backtest/portfolio_optimizer.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <vector>

namespace backtest {

PortfolioOptimizer::PortfolioOptimizer(OptimizerConfig config)
    : config_(config) {
    if (config_.risk_aversion <= 0.0 || config_.max_iterations <= 0 || config_.tolerance <= 0.0) {
        throw std::invalid_argument("Optimizer risk aversion, iteration limit and tolerance must be positive");
    }
}

Eigen::VectorXd project_to_simplex(const Eigen::VectorXd& v) {
    const auto n = v.size();
    std::vector<double> sorted(v.data(), v.data() + n);
    std::sort(sorted.begin(), sorted.end(), std::greater<double>());

    double cumulative = 0.0;
    double theta = 0.0;
    for (Eigen::Index k = 0; k < n; ++k) {
        cumulative += sorted[static_cast<std::size_t>(k)];
        const double candidate = (cumulative - 1.0) / static_cast<double>(k + 1);
        if (sorted[static_cast<std::size_t>(k)] - candidate > 0.0) {
            theta = candidate;
        }
    }
    return (v.array() - theta).max(0.0).matrix();
}

double stationarity_residual(const Eigen::VectorXd& w, const Eigen::VectorXd& gradient, double step) {
    return (w - project_to_simplex(w - step * gradient)).cwiseAbs().maxCoeff();
}

PortfolioWeights equal_weights(const std::vector<std::string>& instruments) {
    PortfolioWeights weights;
    if (instruments.empty()) {
        return weights;
    }
    const double w = 1.0 / static_cast<double>(instruments.size());
    for (const auto& instrument : instruments) {
        weights[instrument] = w;
    }
    return weights;
}

namespace {

// Minimizer of -mu'w + 0.5 w'Hw over {sum(w) = 1, w_i = 0 for i outside `free`}.
Eigen::VectorXd face_minimizer(const Eigen::MatrixXd& hessian,
                               const Eigen::VectorXd& mu,
                               const std::vector<Eigen::Index>& free) {
    const auto m = static_cast<Eigen::Index>(free.size());
    Eigen::MatrixXd kkt = Eigen::MatrixXd::Zero(m + 1, m + 1);
    Eigen::VectorXd rhs(m + 1);
    for (Eigen::Index r = 0; r < m; ++r) {
        for (Eigen::Index c = 0; c < m; ++c) {
            kkt(r, c) = hessian(free[static_cast<std::size_t>(r)], free[static_cast<std::size_t>(c)]);
        }
        kkt(r, m) = 1.0;
        kkt(m, r) = 1.0;
        rhs(r) = mu(free[static_cast<std::size_t>(r)]);
    }
    rhs(m) = 1.0;

    const Eigen::FullPivLU<Eigen::MatrixXd> lu(kkt);
    if (!lu.isInvertible()) {
        throw OptimizationFailure("Singular optimality system on the active face");
    }
    const Eigen::VectorXd solution = lu.solve(rhs);

    Eigen::VectorXd w = Eigen::VectorXd::Zero(mu.size());
    for (Eigen::Index r = 0; r < m; ++r) {
        w(free[static_cast<std::size_t>(r)]) = solution(r);
    }
    return w;
}

} // namespace

Eigen::VectorXd PortfolioOptimizer::solve(const Eigen::VectorXd& mu, const Eigen::MatrixXd& sigma) const {
    const auto n = mu.size();
    if (n == 0) {
        throw OptimizationFailure("No instruments to allocate");
    }
    if (sigma.rows() != n || sigma.cols() != n) {
        throw OptimizationFailure("Covariance shape does not match expected returns");
    }
    if (!mu.allFinite() || !sigma.allFinite()) {
        throw OptimizationFailure("Non-finite expected returns or covariance");
    }

    const Eigen::MatrixXd symmetric = 0.5 * (sigma + sigma.transpose());
    const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen(symmetric, Eigen::EigenvaluesOnly);
    if (eigen.info() != Eigen::Success) {
        throw OptimizationFailure("Eigen decomposition of covariance failed");
    }
    const double lambda_min = eigen.eigenvalues().minCoeff();
    const double lambda_max = eigen.eigenvalues().maxCoeff();
    if (lambda_min <= config_.min_eigenvalue_ratio * std::max(1.0, lambda_max)) {
        throw OptimizationFailure("Covariance matrix is singular or not positive definite");
    }

    const Eigen::MatrixXd hessian = config_.risk_aversion * symmetric;
    const double curvature = config_.risk_aversion * lambda_max;

    // Primal active-set method started from the equal-weight portfolio.
    // pinned[i] marks a weight held at its lower bound of zero.
    std::vector<bool> pinned(static_cast<std::size_t>(n), false);
    Eigen::VectorXd w = Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));

    for (int iteration = 0; iteration < config_.max_iterations; ++iteration) {
        std::vector<Eigen::Index> free;
        for (Eigen::Index i = 0; i < n; ++i) {
            if (!pinned[static_cast<std::size_t>(i)]) {
                free.push_back(i);
            }
        }

        const Eigen::VectorXd target = face_minimizer(hessian, mu, free);
        if (!target.allFinite()) {
            throw OptimizationFailure("Optimization produced non-finite weights");
        }

        // Walk towards the face minimizer, stopping at the first weight that hits zero.
        const Eigen::VectorXd direction = target - w;
        double alpha = 1.0;
        Eigen::Index blocking = -1;
        if (free.size() > 1) {
            for (const auto i : free) {
                if (direction(i) < 0.0) {
                    const double ratio = w(i) / -direction(i);
                    if (ratio < alpha) {
                        alpha = ratio;
                        blocking = i;
                    }
                }
            }
        }
        if (blocking >= 0) {
            w = (w + alpha * direction).cwiseMax(0.0);
            w(blocking) = 0.0;
            pinned[static_cast<std::size_t>(blocking)] = true;
            continue;
        }
        w = target.cwiseMax(0.0);

        // On the face minimizer every free gradient entry equals the budget multiplier.
        const Eigen::VectorXd gradient = hessian * w - mu;
        double multiplier = 0.0;
        for (const auto i : free) {
            multiplier += gradient(i);
        }
        multiplier /= static_cast<double>(free.size());

        Eigen::Index release = -1;
        double most_negative = -config_.tolerance * curvature;
        for (Eigen::Index i = 0; i < n; ++i) {
            if (!pinned[static_cast<std::size_t>(i)]) {
                continue;
            }
            const double bound_multiplier = gradient(i) - multiplier;
            if (bound_multiplier < most_negative) {
                most_negative = bound_multiplier;
                release = i;
            }
        }
        if (release < 0) {
            const double residual = stationarity_residual(w, gradient, 1.0 / curvature);
            if (!(residual <= config_.tolerance)) {
                throw OptimizationFailure("Optimization stopped with stationarity residual " +
                                          std::to_string(residual));
            }
            return w;
        }
        pinned[static_cast<std::size_t>(release)] = false;
    }
    throw OptimizationFailure("Optimization did not converge within " +
                              std::to_string(config_.max_iterations) + " iterations");
}

PortfolioWeights PortfolioOptimizer::optimize(const MarketEstimate& estimate) const {
    if (estimate.instruments.empty()) {
        return {};
    }
    try {
        const Eigen::VectorXd w = solve(estimate.expected_returns, estimate.covariance);
        PortfolioWeights weights;
        for (std::size_t i = 0; i < estimate.instruments.size(); ++i) {
            weights[estimate.instruments[i]] = w(static_cast<Eigen::Index>(i));
        }
        return weights;
    } catch (const OptimizationFailure& ex) {
        std::cerr << "[Optimizer] Error computing portfolio, returning equal weight portfolio: "
                  << ex.what() << std::endl;
        return equal_weights(estimate.instruments);
    }
}

} // namespace backtest
