#pragma once
#include <string>

namespace OfficePdf {
namespace Utils {

class Url {
public:
    // Absolute file:// URL for a filesystem path, percent-encoding bytes
    // outside the unreserved set and '/'.
    static std::string from_path(const std::string& path);
    // Same for a path already made absolute, with '/' separators. Windows
    // drive paths get the third slash: file:///C:/...
    static std::string from_absolute(const std::string& generic_path);
    static bool        is_file_url(const std::string& url);
    static std::string encode(const std::string& text);
};

}  // namespace Utils
}  // namespace OfficePdf
