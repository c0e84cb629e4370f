#pragma once

#include "datafeed/http_client.hpp"
#include "datafeed/price_source.hpp"
#include "datafeed/util.hpp"

#include <string>
#include <vector>

namespace datafeed {

struct ChartClientConfig {
    std::string base_url = "https://query1.finance.yahoo.com";
    HttpOptions http;
};

// Daily closes from a Yahoo-style /v8/finance/chart/{ticker} endpoint.
class ChartClient : public PriceSource {
public:
    explicit ChartClient(ChartClientConfig config = {});

    // Raw chart JSON for one ticker over [start, end).
    std::string chart(const std::string& ticker, Date start, Date end) const;

    // Per-ticker HTTP and JSON failures are logged and produce no rows for that ticker.
    std::vector<PriceRow> fetch(const std::set<std::string>& tickers,
                                Date start,
                                Date end) override;

    // Dated contracts of a futures root ("CL" or "CL=F") for every month of
    // [first_year, last_year] that quote at least one close in [start, end).
    // Contracts that fail to download are logged and left out.
    std::vector<std::string> available_contracts(const std::string& root,
                                                 int first_year,
                                                 int last_year,
                                                 Date start,
                                                 Date end);

    // Throws nlohmann::json::exception when the body is not a chart document.
    static std::vector<PriceRow> parse_chart(const std::string& ticker, const std::string& body);

    [[nodiscard]] double last_request_ms() const noexcept { return last_request_ms_; }

private:
    HttpResponse public_request(const std::string& path, const QueryParams& params = {}) const;

    ChartClientConfig config_;
    HttpClient http_client_;
    mutable double last_request_ms_ = 0.0;
};

} // namespace datafeed
