#pragma once

#include "datafeed/date.hpp"
#include "datafeed/price_source.hpp"

#include <Eigen/Dense>

#include <map>
#include <string>
#include <vector>

namespace backtest {

using datafeed::Date;
using datafeed::PriceRow;

using PriceMap = std::map<std::string, double>;
using ExpiryMap = std::map<std::string, Date>;

enum class ExpiryFilter { None, DropExpired };

struct MarketEstimate {
    std::vector<std::string> instruments;   // sorted
    Eigen::VectorXd expected_returns;       // mean simple return per instrument
    Eigen::MatrixXd covariance;             // sample covariance of prices, NaN if undetermined
};

constexpr int kDefaultWindowDays = 360;

// Read-only, windowed view over historical rows. Every query looks at
// rows dated in [t - window, t) only.
class MarketInformation {
public:
    MarketInformation(std::vector<PriceRow> rows,
                      int window_days = kDefaultWindowDays,
                      ExpiryFilter expiry_filter = ExpiryFilter::None);

    std::vector<PriceRow> slice(Date t) const;

    // Last close per instrument strictly before t. With DropExpired, rows whose
    // expiry precedes t are ignored.
    PriceMap prices(Date t) const;

    // Expiry attached to the row prices(t) picks for each instrument.
    ExpiryMap expiries(Date t) const;

    MarketEstimate estimate(Date t) const;

    [[nodiscard]] int window_days() const noexcept { return window_days_; }
    [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

private:
    std::pair<std::vector<PriceRow>::const_iterator, std::vector<PriceRow>::const_iterator>
    window(Date t) const;

    std::vector<PriceRow> rows_; // ordered by (date, ticker)
    int window_days_;
    ExpiryFilter expiry_filter_;
};

} // namespace backtest
