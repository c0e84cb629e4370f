#include "datafeed/futures_calendar.hpp"

#include <algorithm>
#include <cstdio>
#include <map>

namespace datafeed {
namespace {

const std::map<std::string, std::vector<unsigned>>& cbot_table() {
    static const std::map<std::string, std::vector<unsigned>> table = {
        {"ZS=F", {1, 3, 5, 7, 8, 9, 11}}, // soybeans
        {"ZW=F", {3, 5, 7, 9, 12}},       // wheat
        {"ZC=F", {3, 5, 7, 9, 12}},       // corn
        {"CC=F", {3, 5, 7, 9, 12}},       // cocoa
    };
    return table;
}

const std::vector<std::string>& energy_tickers() {
    static const std::vector<std::string> tickers = {"CL=F", "BZ=F", "NG=F", "HO=F"};
    return tickers;
}

Date cbot_contract_expiry(int year, unsigned contract_month) {
    return subtract_business_days(Date::from_ymd(year, contract_month, kCbotExpiryDay), 1);
}

Date cbot_expiry(Date purchase_date, const std::vector<unsigned>& months) {
    int year = purchase_date.year();
    const unsigned month = purchase_date.month();

    auto it = std::find_if(months.begin(), months.end(), [month](unsigned m) { return m >= month; });
    std::size_t index = 0;
    if (it == months.end()) {
        ++year;
    } else {
        index = static_cast<std::size_t>(std::distance(months.begin(), it));
    }

    Date expiry = cbot_contract_expiry(year, months[index]);
    const Date rollover = subtract_business_days(expiry, kCbotRolloverBusinessDays);
    if (purchase_date >= rollover) {
        ++index;
        if (index >= months.size()) {
            index = 0;
            ++year;
        }
        expiry = cbot_contract_expiry(year, months[index]);
    }
    return expiry;
}

// Expiry for the contract delivering in (year, delivery_month).
Date energy_contract_expiry(const std::string& ticker, int year, unsigned delivery_month) {
    const int prior_year = delivery_month > 1 ? year : year - 1;
    const unsigned prior_month = delivery_month > 1 ? delivery_month - 1 : 12;

    if (ticker == "CL=F") {
        return subtract_business_days(Date::from_ymd(prior_year, prior_month, 25), 3);
    }
    if (ticker == "BZ=F") {
        return subtract_business_days(Date::from_ymd(year, delivery_month, 1), 2);
    }
    if (ticker == "NG=F") {
        return subtract_business_days(Date::from_ymd(year, delivery_month, 1), 3);
    }
    if (ticker == "HO=F") {
        return subtract_business_days(Date::from_ymd(prior_year, prior_month, 1), 1);
    }
    throw UnsupportedInstrumentError(ticker);
}

Date energy_expiry(Date purchase_date, const std::string& ticker) {
    unsigned delivery_month = (purchase_date.month() % 12) + 1;
    int year = purchase_date.year() + (delivery_month == 1 ? 1 : 0);

    Date expiry = energy_contract_expiry(ticker, year, delivery_month);
    if (expiry < purchase_date) {
        delivery_month = (delivery_month % 12) + 1;
        year += (delivery_month == 1 ? 1 : 0);
        expiry = energy_contract_expiry(ticker, year, delivery_month);
    }
    return expiry;
}

} // namespace

const std::vector<std::string>& supported_futures() {
    static const std::vector<std::string> tickers = [] {
        std::vector<std::string> all = energy_tickers();
        for (const auto& [ticker, months] : cbot_table()) {
            (void)months;
            all.push_back(ticker);
        }
        return all;
    }();
    return tickers;
}

bool is_supported_future(const std::string& ticker) {
    const auto& all = supported_futures();
    return std::find(all.begin(), all.end(), ticker) != all.end();
}

FuturesGroup futures_group(const std::string& ticker) {
    if (cbot_table().count(ticker) != 0) {
        return FuturesGroup::Cbot;
    }
    const auto& energy = energy_tickers();
    if (std::find(energy.begin(), energy.end(), ticker) != energy.end()) {
        return FuturesGroup::Energy;
    }
    throw UnsupportedInstrumentError(ticker);
}

const std::vector<unsigned>& cbot_contract_months(const std::string& ticker) {
    const auto it = cbot_table().find(ticker);
    if (it == cbot_table().end()) {
        throw UnsupportedInstrumentError(ticker);
    }
    return it->second;
}

Date futures_expiry(Date purchase_date, const std::string& ticker) {
    switch (futures_group(ticker)) {
    case FuturesGroup::Cbot:
        return cbot_expiry(purchase_date, cbot_contract_months(ticker));
    case FuturesGroup::Energy:
        return energy_expiry(purchase_date, ticker);
    }
    throw UnsupportedInstrumentError(ticker);
}

char futures_month_code(unsigned month) {
    static constexpr char kCodes[] = {'F', 'G', 'H', 'J', 'K', 'M', 'N', 'Q', 'U', 'V', 'X', 'Z'};
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Contract month out of range: " + std::to_string(month));
    }
    return kCodes[month - 1];
}

std::string futures_contract_code(const std::string& base_ticker, unsigned month, int year) {
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "%c%02d", futures_month_code(month), ((year % 100) + 100) % 100);
    return base_ticker + suffix;
}

} // namespace datafeed
