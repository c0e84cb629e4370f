#include "datafeed/util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace datafeed {

std::string url_encode(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped.push_back(static_cast<char>(c));
        } else {
            escaped.push_back('%');
            constexpr char hex_chars[] = "0123456789ABCDEF";
            escaped.push_back(hex_chars[(c >> 4) & 0x0F]);
            escaped.push_back(hex_chars[c & 0x0F]);
        }
    }
    return escaped;
}

QueryParams filter_empty(const QueryParams& params) {
    QueryParams filtered;
    filtered.reserve(params.size());
    for (const auto& [key, value] : params) {
        if (!value.empty()) {
            filtered.emplace_back(key, value);
        }
    }
    return filtered;
}

std::string build_query_string(const QueryParams& params) {
    const auto filtered = filter_empty(params);
    std::ostringstream oss;
    for (std::size_t i = 0; i < filtered.size(); ++i) {
        if (i != 0) {
            oss << '&';
        }
        oss << url_encode(filtered[i].first) << '=' << url_encode(filtered[i].second);
    }
    return oss.str();
}

std::string to_upper_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::vector<std::string> split_list(const std::string& value, char delimiter) {
    std::vector<std::string> items;
    std::istringstream input(value);
    std::string item;
    while (std::getline(input, item, delimiter)) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

int load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return 0;
    }

    int loaded = 0;
    std::string line;
    while (std::getline(env_file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, pos));
        auto value = trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty() && setenv(key.c_str(), value.c_str(), 1) == 0) {
            ++loaded;
        }
    }
    return loaded;
}

} // namespace datafeed
