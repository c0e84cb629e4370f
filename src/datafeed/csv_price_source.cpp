#include "datafeed/csv_price_source.hpp"
#include "datafeed/util.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>

namespace datafeed {
namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (char ch : line) {
        if (ch == '"') {
            quoted = !quoted;
        } else if (ch == ',' && !quoted) {
            fields.push_back(trim(field));
            field.clear();
        } else if (ch != '\r') {
            field.push_back(ch);
        }
    }
    fields.push_back(trim(field));
    return fields;
}

std::optional<std::size_t> column_index(const std::vector<std::string>& header, const std::string& name) {
    const auto wanted = to_upper_copy(name);
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (to_upper_copy(header[i]) == wanted) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<double> parse_close(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

CsvPriceSource::CsvPriceSource(CsvPriceSourceConfig config)
    : config_(std::move(config)) {
    if (config_.path.empty()) {
        throw std::invalid_argument("CsvPriceSource path not set");
    }
}

std::vector<PriceRow> CsvPriceSource::fetch(const std::set<std::string>& tickers, Date start, Date end) {
    std::ifstream input(config_.path);
    if (!input.good()) {
        throw PriceSourceError("Failed to open price file " + config_.path.string());
    }

    std::string line;
    if (!std::getline(input, line)) {
        throw PriceSourceError("Price file " + config_.path.string() + " is empty");
    }
    const auto header = split_csv_line(line);
    const auto date_idx = column_index(header, config_.date_column);
    const auto ticker_idx = column_index(header, config_.ticker_column);
    const auto close_idx = column_index(header, config_.close_column);
    const auto expiry_idx = column_index(header, config_.expiry_column);
    if (!date_idx || !ticker_idx || !close_idx) {
        throw PriceSourceError("Price file " + config_.path.string() + " must have columns '" +
                               config_.date_column + "', '" + config_.ticker_column + "' and '" +
                               config_.close_column + "'");
    }

    std::vector<PriceRow> rows;
    std::size_t skipped = 0;
    std::size_t line_number = 1;
    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }
        const auto fields = split_csv_line(line);
        if (fields.size() < header.size()) {
            ++skipped;
            continue;
        }
        const auto& ticker = fields[*ticker_idx];
        if (tickers.count(ticker) == 0) {
            continue;
        }

        PriceRow row;
        try {
            row.date = Date::parse(fields[*date_idx]);
            if (expiry_idx && !fields[*expiry_idx].empty()) {
                row.expiry = Date::parse(fields[*expiry_idx]);
            }
        } catch (const std::invalid_argument& ex) {
            throw PriceSourceError(config_.path.string() + ":" + std::to_string(line_number) + ": " + ex.what());
        }
        if (row.date < start || row.date >= end) {
            continue;
        }
        const auto close = parse_close(fields[*close_idx]);
        if (!close) {
            ++skipped;
            continue;
        }
        row.ticker = ticker;
        row.close = *close;
        rows.push_back(std::move(row));
    }

    if (skipped > 0) {
        std::cerr << "[Data] Skipped " << skipped << " malformed rows in " << config_.path.string() << std::endl;
    }
    for (const auto& ticker : tickers) {
        const bool found = std::any_of(rows.begin(), rows.end(), [&](const PriceRow& r) { return r.ticker == ticker; });
        if (!found) {
            std::cerr << "[Data] No data for ticker " << ticker << " between " << start << " and " << end << std::endl;
        }
    }

    normalize_rows(rows);
    return rows;
}

} // namespace datafeed
