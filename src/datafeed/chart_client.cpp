#include "datafeed/chart_client.hpp"

#include "datafeed/futures_calendar.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace datafeed {
namespace {

constexpr int64_t kSecondsPerDay = 86400;

int64_t to_unix_seconds(Date date) {
    return static_cast<int64_t>(date.days_since_epoch()) * kSecondsPerDay;
}

} // namespace

ChartClient::ChartClient(ChartClientConfig config)
    : config_(std::move(config)),
      http_client_(config_.http) {}

HttpResponse ChartClient::public_request(const std::string& path, const QueryParams& params) const {
    std::string url = config_.base_url + path;
    const auto query = build_query_string(params);
    if (!query.empty()) {
        url += '?' + query;
    }

    const HttpHeaders headers = {{"Accept", "application/json"}};
    auto response = http_client_.get(url, headers);
    last_request_ms_ = response.total_ms;
    return response;
}

std::string ChartClient::chart(const std::string& ticker, Date start, Date end) const {
    const QueryParams params = {
        {"period1", std::to_string(to_unix_seconds(start))},
        {"period2", std::to_string(to_unix_seconds(end))},
        {"interval", "1d"},
    };
    return public_request("/v8/finance/chart/" + url_encode(to_upper_copy(ticker)), params).body;
}

std::vector<PriceRow> ChartClient::parse_chart(const std::string& ticker, const std::string& body) {
    const auto json = nlohmann::json::parse(body);
    const auto& chart = json.at("chart");
    if (chart.contains("error") && !chart["error"].is_null()) {
        return {};
    }
    const auto& results = chart.at("result");
    if (!results.is_array() || results.empty()) {
        return {};
    }
    const auto& result = results.at(0);
    if (!result.contains("timestamp")) {
        return {};
    }

    int64_t gmt_offset = 0;
    if (result.contains("meta") && result["meta"].contains("gmtoffset")) {
        gmt_offset = result["meta"]["gmtoffset"].get<int64_t>();
    }

    const auto& timestamps = result.at("timestamp");
    const auto& closes = result.at("indicators").at("quote").at(0).at("close");

    std::vector<PriceRow> rows;
    rows.reserve(timestamps.size());
    for (std::size_t i = 0; i < timestamps.size() && i < closes.size(); ++i) {
        if (!closes[i].is_number()) {
            continue;
        }
        const double close = closes[i].get<double>();
        if (!std::isfinite(close) || close <= 0.0) {
            continue;
        }
        PriceRow row;
        row.date = Date::from_unix_seconds(timestamps[i].get<int64_t>() + gmt_offset);
        row.ticker = ticker;
        row.close = close;
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<PriceRow> ChartClient::fetch(const std::set<std::string>& tickers, Date start, Date end) {
    std::vector<PriceRow> rows;
    for (const auto& ticker : tickers) {
        try {
            auto ticker_rows = parse_chart(ticker, chart(ticker, start, end));
            if (ticker_rows.empty()) {
                std::cerr << "[Data] No data for ticker " << ticker << std::endl;
                continue;
            }
            std::cout << "[Data] " << ticker << ": " << ticker_rows.size() << " rows ("
                      << last_request_ms_ << " ms)" << std::endl;
            rows.insert(rows.end(), ticker_rows.begin(), ticker_rows.end());
        } catch (const HttpError& ex) {
            std::cerr << "[Data] No data for ticker " << ticker << ": " << ex.what()
                      << " (status " << ex.status_code() << ")" << std::endl;
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "[Data] No data for ticker " << ticker << ": malformed chart response ("
                      << ex.what() << ")" << std::endl;
        }
    }

    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [&](const PriceRow& r) { return r.date < start || r.date >= end; }),
               rows.end());
    normalize_rows(rows);
    return rows;
}

std::vector<std::string> ChartClient::available_contracts(const std::string& root,
                                                          int first_year,
                                                          int last_year,
                                                          Date start,
                                                          Date end) {
    if (first_year > last_year) {
        throw std::invalid_argument("Contract year range is reversed: " + std::to_string(first_year) + " > " +
                                    std::to_string(last_year));
    }
    std::string base = to_upper_copy(root);
    if (base.size() >= 2 && base.compare(base.size() - 2, 2, "=F") == 0) {
        base.resize(base.size() - 2);
    }
    if (base.empty()) {
        throw std::invalid_argument("Futures root must not be empty");
    }

    std::vector<std::string> available;
    for (int year = first_year; year <= last_year; ++year) {
        for (unsigned month = 1; month <= 12; ++month) {
            const auto contract = futures_contract_code(base, month, year);
            try {
                if (parse_chart(contract, chart(contract, start, end)).empty()) {
                    continue;
                }
                std::cout << "[Data] Available: " << contract << " (" << year << "-" << (month < 10 ? "0" : "")
                          << month << ")" << std::endl;
                available.push_back(contract);
            } catch (const HttpError& ex) {
                std::cerr << "[Data] Error with " << contract << ": " << ex.what() << std::endl;
            } catch (const nlohmann::json::exception& ex) {
                std::cerr << "[Data] Error with " << contract << ": malformed chart response (" << ex.what()
                          << ")" << std::endl;
            }
        }
    }
    return available;
}

} // namespace datafeed
