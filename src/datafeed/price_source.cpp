#include "datafeed/price_source.hpp"
#include "datafeed/futures_calendar.hpp"
#include "datafeed/util.hpp"

#include <algorithm>

namespace datafeed {

std::string to_string(AssetClass asset_class) {
    switch (asset_class) {
    case AssetClass::Equities:
        return "equities";
    case AssetClass::Commodities:
        return "commodities";
    }
    return "unknown";
}

AssetClass parse_asset_class(const std::string& value) {
    const auto upper = to_upper_copy(trim(value));
    if (upper == "EQUITIES" || upper == "STOCKS") {
        return AssetClass::Equities;
    }
    if (upper == "COMMODITIES" || upper == "FUTURES") {
        return AssetClass::Commodities;
    }
    throw std::invalid_argument("Unsupported asset class: " + value);
}

void normalize_rows(std::vector<PriceRow>& rows) {
    std::stable_sort(rows.begin(), rows.end(), [](const PriceRow& a, const PriceRow& b) {
        if (a.ticker != b.ticker) {
            return a.ticker < b.ticker;
        }
        return a.date < b.date;
    });
    rows.erase(std::unique(rows.begin(), rows.end(),
                           [](const PriceRow& a, const PriceRow& b) {
                               return a.ticker == b.ticker && a.date == b.date;
                           }),
               rows.end());
}

void annotate_expiries(std::vector<PriceRow>& rows, AssetClass asset_class) {
    for (auto& row : rows) {
        row.expiry = asset_class == AssetClass::Commodities
                         ? futures_expiry(row.date, row.ticker)
                         : Date::never();
    }
}

const std::vector<std::string>& default_universe(AssetClass asset_class) {
    static const std::vector<std::string> equities = {
        "AAPL", "MSFT", "GOOGL", "AMZN", "META", "TSLA", "NVDA", "INTC", "CSCO", "NFLX"};
    if (asset_class == AssetClass::Commodities) {
        return supported_futures();
    }
    return equities;
}

} // namespace datafeed
