#pragma once

#include "datafeed/date.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace datafeed {

class UnsupportedInstrumentError : public std::invalid_argument {
public:
    explicit UnsupportedInstrumentError(const std::string& ticker)
        : std::invalid_argument("Unsupported futures ticker: " + ticker), ticker_(ticker) {}

    [[nodiscard]] const std::string& ticker() const noexcept { return ticker_; }

private:
    std::string ticker_;
};

enum class FuturesGroup { Cbot, Energy };

constexpr int kCbotExpiryDay = 15;
constexpr int kCbotRolloverBusinessDays = 20;

// Continuous front-month tickers with a known roll calendar.
const std::vector<std::string>& supported_futures();

bool is_supported_future(const std::string& ticker);

FuturesGroup futures_group(const std::string& ticker);

// Listed contract months for a CBOT ticker, ascending.
const std::vector<unsigned>& cbot_contract_months(const std::string& ticker);

// Expiry of the front-month contract bought on `purchase_date`. Throws
// UnsupportedInstrumentError for tickers outside supported_futures().
Date futures_expiry(Date purchase_date, const std::string& ticker);

// Exchange month letter (F = January ... Z = December).
char futures_month_code(unsigned month);

// Dated contract symbol, e.g. ("CL", 6, 2024) -> "CLM24".
std::string futures_contract_code(const std::string& base_ticker, unsigned month, int year);

} // namespace datafeed
