#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace backtest {

class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class InvalidParameterError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

enum class OptionType { Call, Put };

std::string to_string(OptionType type);

// Accepts exactly "Call" or "Put".
OptionType parse_option_type(const std::string& value);

constexpr double kDaysInYear = 365.0;

struct OptionContract {
    OptionType type = OptionType::Call;
    double underlying_price = 0.0;
    double strike = 0.0;
    double risk_free_rate = 0.0;
    double dividend_yield = 0.0;
    double time_to_maturity_days = 0.0;
    double implied_volatility = 0.0;
};

// Throws InvalidParameterError unless price, strike, maturity and volatility are positive.
OptionContract make_option(OptionType type,
                           double underlying_price,
                           double strike,
                           double risk_free_rate,
                           double dividend_yield,
                           double time_to_maturity_days,
                           double implied_volatility);

// Scenario overrides; unset fields fall back to the contract's own values.
struct PricingOverrides {
    std::optional<double> underlying_price;
    std::optional<double> time_to_maturity_days;
    std::optional<double> implied_volatility;
};

// Black-Scholes with continuous dividend yield. Time is in calendar days (T = days / 365).
double price(const OptionContract& contract, const PricingOverrides& overrides = {});
double delta(const OptionContract& contract, const PricingOverrides& overrides = {});
double gamma(const OptionContract& contract, const PricingOverrides& overrides = {});
// Per 1 volatility point (0.01).
double vega(const OptionContract& contract, const PricingOverrides& overrides = {});
// Per calendar day.
double theta(const OptionContract& contract, const PricingOverrides& overrides = {});

} // namespace backtest
