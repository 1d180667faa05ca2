#pragma once

#include <string>
#include <unordered_map>

namespace ds::util {

std::unordered_map<std::string, std::string> parse_query_params(const std::string& target);

std::string url_decode(const std::string& value);

// Target with its query string stripped, e.g. "/status?id=a" -> "/status"
std::string target_path(const std::string& target);

}
