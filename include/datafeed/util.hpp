#pragma once

#include <string>
#include <utility>
#include <vector>

namespace datafeed {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

std::string url_encode(const std::string& value);

QueryParams filter_empty(const QueryParams& params);

std::string build_query_string(const QueryParams& params);

std::string to_upper_copy(std::string value);

std::string trim(std::string value);

// Splits on `delimiter`, trimming each item and dropping empty ones.
std::vector<std::string> split_list(const std::string& value, char delimiter = ',');

// Loads KEY=VALUE lines into the process environment (existing variables are overwritten).
// Missing file is not an error. Returns the number of variables set.
int load_env_file(const std::string& path);

} // namespace datafeed
