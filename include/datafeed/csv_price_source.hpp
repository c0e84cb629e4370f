#pragma once

#include "datafeed/price_source.hpp"

#include <filesystem>
#include <string>

namespace datafeed {

struct CsvPriceSourceConfig {
    std::filesystem::path path;
    std::string date_column = "Date";
    std::string ticker_column = "ticker";
    std::string close_column = "Close";
    std::string expiry_column = "futures expiry"; // optional in the file
};

// Reads a long-format price table: one row per (date, ticker).
class CsvPriceSource : public PriceSource {
public:
    explicit CsvPriceSource(CsvPriceSourceConfig config);

    std::vector<PriceRow> fetch(const std::set<std::string>& tickers,
                                Date start,
                                Date end) override;

private:
    CsvPriceSourceConfig config_;
};

} // namespace datafeed
