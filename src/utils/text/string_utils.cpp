#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace OfficePdf {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool is_integer(const std::string& str) {
    if (str.empty())
        return false;
    size_t start = (str[0] == '-' || str[0] == '+') ? 1 : 0;
    if (start == str.size())
        return false;
    return std::all_of(
        str.begin() + start, str.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            joined += separator;
        joined += parts[i];
    }
    return joined;
}

}  // namespace Text
}  // namespace Utils
}  // namespace OfficePdf
