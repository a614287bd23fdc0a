#pragma once

#include <string>
#include <vector>

namespace OfficePdf {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        is_integer(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

}  // namespace Text
}  // namespace Utils
}  // namespace OfficePdf
