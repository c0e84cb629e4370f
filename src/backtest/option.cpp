#include "backtest/option.hpp"

#include <cmath>

namespace backtest {
namespace {

auto normal_pdf(double x) -> double {
    static constexpr double inv_sqrt_2pi = 0.3989422804014327;
    return inv_sqrt_2pi * std::exp(-0.5 * x * x);
}

auto normal_cdf(double x) -> double {
    static const double inv_sqrt_2 = 0.70710678118654752440;
    return 0.5 * std::erfc(-x * inv_sqrt_2);
}

// Inputs after overrides, validated, with T in years.
struct Inputs {
    OptionType type;
    double s;
    double k;
    double r;
    double q;
    double t;
    double sigma;
    double d1;
    double d2;
};

void validate(OptionType type, double s, double k, double days, double sigma) {
    if (type != OptionType::Call && type != OptionType::Put) {
        throw InvalidParameterError("Option type must be Call or Put");
    }
    if (!(s > 0.0) || !(k > 0.0) || !(days > 0.0) || !(sigma > 0.0)) {
        throw InvalidParameterError(
            "Underlying price, strike, implied volatility and time to maturity must be positive");
    }
}

Inputs resolve(const OptionContract& c, const PricingOverrides& o) {
    const double s = o.underlying_price.value_or(c.underlying_price);
    const double days = o.time_to_maturity_days.value_or(c.time_to_maturity_days);
    const double sigma = o.implied_volatility.value_or(c.implied_volatility);
    validate(c.type, s, c.strike, days, sigma);

    Inputs in{c.type, s, c.strike, c.risk_free_rate, c.dividend_yield, days / kDaysInYear, sigma, 0.0, 0.0};
    const double sqrt_t = std::sqrt(in.t);
    in.d1 = (std::log(in.s * std::exp(-in.q * in.t) / (in.k * std::exp(-in.r * in.t))) +
             0.5 * in.sigma * in.sigma * in.t) /
            (in.sigma * sqrt_t);
    in.d2 = in.d1 - in.sigma * sqrt_t;
    return in;
}

} // namespace

std::string to_string(OptionType type) {
    return type == OptionType::Call ? "Call" : "Put";
}

OptionType parse_option_type(const std::string& value) {
    if (value == "Call") {
        return OptionType::Call;
    }
    if (value == "Put") {
        return OptionType::Put;
    }
    throw InvalidParameterError("option_type must be 'Call' or 'Put', got '" + value + "'");
}

OptionContract make_option(OptionType type,
                           double underlying_price,
                           double strike,
                           double risk_free_rate,
                           double dividend_yield,
                           double time_to_maturity_days,
                           double implied_volatility) {
    validate(type, underlying_price, strike, time_to_maturity_days, implied_volatility);
    return OptionContract{type, underlying_price, strike, risk_free_rate, dividend_yield,
                          time_to_maturity_days, implied_volatility};
}

double price(const OptionContract& contract, const PricingOverrides& overrides) {
    const auto in = resolve(contract, overrides);
    const double spot_df = in.s * std::exp(-in.q * in.t);
    const double strike_df = in.k * std::exp(-in.r * in.t);
    if (in.type == OptionType::Call) {
        return spot_df * normal_cdf(in.d1) - strike_df * normal_cdf(in.d2);
    }
    return strike_df * normal_cdf(-in.d2) - spot_df * normal_cdf(-in.d1);
}

double delta(const OptionContract& contract, const PricingOverrides& overrides) {
    const auto in = resolve(contract, overrides);
    const double carry = std::exp(-in.q * in.t);
    if (in.type == OptionType::Call) {
        return carry * normal_cdf(in.d1);
    }
    return carry * (normal_cdf(in.d1) - 1.0);
}

double gamma(const OptionContract& contract, const PricingOverrides& overrides) {
    const auto in = resolve(contract, overrides);
    return normal_pdf(in.d1) * std::exp(-in.q * in.t) / (in.s * in.sigma * std::sqrt(in.t));
}

double vega(const OptionContract& contract, const PricingOverrides& overrides) {
    const auto in = resolve(contract, overrides);
    return in.s * std::exp(-in.q * in.t) * normal_pdf(in.d1) * std::sqrt(in.t) * 0.01;
}

double theta(const OptionContract& contract, const PricingOverrides& overrides) {
    const auto in = resolve(contract, overrides);
    const double carry = std::exp(-in.q * in.t);
    const double discount = std::exp(-in.r * in.t);
    const double decay = -in.s * normal_pdf(in.d1) * in.sigma * carry / (2.0 * std::sqrt(in.t));
    if (in.type == OptionType::Call) {
        return (decay + in.q * in.s * normal_cdf(in.d1) * carry -
                in.r * in.k * discount * normal_cdf(in.d2)) /
               kDaysInYear;
    }
    return (decay - in.q * in.s * normal_cdf(-in.d1) * carry +
            in.r * in.k * discount * normal_cdf(-in.d2)) /
           kDaysInYear;
}

} // namespace backtest
