#include "util/parse.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ds::util {

std::string url_decode(const std::string& value) {
    std::ostringstream result;
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%') {
            if (i + 2 >= value.length()) throw std::invalid_argument("Truncated percent-encoding in URL");
            const auto hi = static_cast<unsigned char>(value[i + 1]);
            const auto lo = static_cast<unsigned char>(value[i + 2]);
            if (!std::isxdigit(hi) || !std::isxdigit(lo)) throw std::invalid_argument("Invalid percent-encoding in URL");
            result << static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        }
        else if (value[i] == '+') result << ' ';
        else result << value[i];
    }
    return result.str();
}

std::unordered_map<std::string, std::string> parse_query_params(const std::string& target) {
    std::unordered_map<std::string, std::string> params;

    const auto pos = target.find('?');
    if (pos == std::string::npos) return params;

    const std::string query = target.substr(pos + 1);
    std::istringstream stream(query);
    std::string pair;

    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        const auto eq = pair.find('=');
        if (eq != std::string::npos) {
            const auto key = url_decode(pair.substr(0, eq));
            const auto value = url_decode(pair.substr(eq + 1));
            params[key] = value;
        } else params[url_decode(pair)] = "";
    }

    return params;
}

std::string target_path(const std::string& target) {
    const auto pos = target.find('?');
    return pos == std::string::npos ? target : target.substr(0, pos);
}

}
