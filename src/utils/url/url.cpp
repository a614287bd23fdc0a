#include "url.hpp"
#include <cctype>
#include <filesystem>

#include "../text/string_utils.hpp"

namespace OfficePdf {
namespace Utils {

namespace {

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/';
}

bool has_drive_letter(const std::string& path) {
    return path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':';
}

}  // namespace

std::string Url::encode(const std::string& text) {
    static const char* hex = "0123456789ABCDEF";
    std::string        encoded;
    encoded.reserve(text.size());
    for (unsigned char c : text) {
        if (is_unreserved(c)) {
            encoded += static_cast<char>(c);
        }
        else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }
    return encoded;
}

std::string Url::from_path(const std::string& path) {
    if (is_file_url(path))
        return path;

    std::filesystem::path absolute = std::filesystem::absolute(path).lexically_normal();
    return from_absolute(absolute.generic_string());
}

std::string Url::from_absolute(const std::string& generic_path) {
    // C:/dir -> file:///C:/dir, the drive colon stays literal
    if (has_drive_letter(generic_path))
        return "file:///" + generic_path.substr(0, 2) + encode(generic_path.substr(2));
    return "file://" + encode(generic_path);
}

bool Url::is_file_url(const std::string& url) {
    return Text::starts_with(Text::to_lower(url), "file://");
}

}  // namespace Utils
}  // namespace OfficePdf
