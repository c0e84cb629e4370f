#pragma once

#include <random>
#include <string>

namespace backtest {

// <Color><Animal><Profession>, e.g. "TealFalconChef".
std::string generate_run_name(std::mt19937& rng);
std::string generate_run_name();

} // namespace backtest
