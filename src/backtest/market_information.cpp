#include "backtest/market_information.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace backtest {

MarketInformation::MarketInformation(std::vector<PriceRow> rows, int window_days, ExpiryFilter expiry_filter)
    : rows_(std::move(rows)),
      window_days_(window_days),
      expiry_filter_(expiry_filter) {
    if (window_days_ <= 0) {
        throw std::invalid_argument("Market information window must be positive");
    }
    datafeed::normalize_rows(rows_);
    std::stable_sort(rows_.begin(), rows_.end(), [](const PriceRow& a, const PriceRow& b) {
        return a.date < b.date;
    });
}

std::pair<std::vector<PriceRow>::const_iterator, std::vector<PriceRow>::const_iterator>
MarketInformation::window(Date t) const {
    const Date from = t.add_days(-window_days_);
    const auto by_date = [](const PriceRow& row, Date date) { return row.date < date; };
    const auto first = std::lower_bound(rows_.begin(), rows_.end(), from, by_date);
    const auto last = std::lower_bound(first, rows_.end(), t, by_date);
    return {first, last};
}

std::vector<PriceRow> MarketInformation::slice(Date t) const {
    const auto [first, last] = window(t);
    return std::vector<PriceRow>(first, last);
}

PriceMap MarketInformation::prices(Date t) const {
    PriceMap latest;
    const auto [first, last] = window(t);
    for (auto it = first; it != last; ++it) {
        if (expiry_filter_ == ExpiryFilter::DropExpired && it->expiry < t) {
            continue;
        }
        latest[it->ticker] = it->close;
    }
    return latest;
}

ExpiryMap MarketInformation::expiries(Date t) const {
    ExpiryMap latest;
    const auto [first, last] = window(t);
    for (auto it = first; it != last; ++it) {
        if (expiry_filter_ == ExpiryFilter::DropExpired && it->expiry < t) {
            continue;
        }
        latest[it->ticker] = it->expiry;
    }
    return latest;
}

MarketEstimate MarketInformation::estimate(Date t) const {
    const auto [first, last] = window(t);

    // Rows arrive in date order, so each series is already chronological.
    std::map<std::string, std::vector<double>> series;
    std::map<Date, std::map<std::string, double>> by_date;
    for (auto it = first; it != last; ++it) {
        series[it->ticker].push_back(it->close);
        by_date[it->date][it->ticker] = it->close;
    }

    MarketEstimate estimate;
    const auto n = static_cast<Eigen::Index>(series.size());
    estimate.expected_returns = Eigen::VectorXd::Zero(n);
    estimate.covariance = Eigen::MatrixXd::Zero(n, n);

    Eigen::Index i = 0;
    for (const auto& [ticker, closes] : series) {
        estimate.instruments.push_back(ticker);
        if (closes.size() >= 2) {
            double sum = 0.0;
            for (std::size_t k = 1; k < closes.size(); ++k) {
                sum += closes[k] / closes[k - 1] - 1.0;
            }
            estimate.expected_returns(i) = sum / static_cast<double>(closes.size() - 1);
        }
        ++i;
    }
    if (n == 0) {
        return estimate;
    }

    std::vector<Eigen::VectorXd> joined;
    for (const auto& [date, quotes] : by_date) {
        if (static_cast<Eigen::Index>(quotes.size()) != n) {
            continue;
        }
        Eigen::VectorXd observation(n);
        Eigen::Index col = 0;
        for (const auto& [ticker, close] : quotes) {
            (void)ticker;
            observation(col++) = close;
        }
        joined.push_back(std::move(observation));
    }

    if (joined.size() < 2) {
        estimate.covariance.setConstant(std::numeric_limits<double>::quiet_NaN());
        return estimate;
    }

    Eigen::MatrixXd observations(static_cast<Eigen::Index>(joined.size()), n);
    for (std::size_t row = 0; row < joined.size(); ++row) {
        observations.row(static_cast<Eigen::Index>(row)) = joined[row].transpose();
    }
    const Eigen::RowVectorXd mean = observations.colwise().mean();
    const Eigen::MatrixXd centered = observations.rowwise() - mean;
    estimate.covariance = (centered.transpose() * centered) / static_cast<double>(observations.rows() - 1);
    return estimate;
}

} // namespace backtest
