#pragma once

#include "datafeed/date.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace datafeed {

enum class AssetClass { Equities, Commodities };

std::string to_string(AssetClass asset_class);
AssetClass parse_asset_class(const std::string& value);

struct PriceRow {
    Date date;
    std::string ticker;
    double close = 0.0;
    Date expiry = Date::never();
};

class PriceSourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// External data collaborator: daily closes for a ticker set over [start, end).
// A ticker without data yields no rows; it is not an error.
class PriceSource {
public:
    virtual ~PriceSource() = default;

    virtual std::vector<PriceRow> fetch(const std::set<std::string>& tickers,
                                        Date start,
                                        Date end) = 0;
};

// Orders rows by (ticker, date) and drops repeated (ticker, date) pairs, keeping the first.
void normalize_rows(std::vector<PriceRow>& rows);

// Attaches the expiry each row's front-month contract carries. Equities get Date::never();
// commodities use futures_expiry and throw UnsupportedInstrumentError for unknown tickers.
void annotate_expiries(std::vector<PriceRow>& rows, AssetClass asset_class);

const std::vector<std::string>& default_universe(AssetClass asset_class);

} // namespace datafeed
