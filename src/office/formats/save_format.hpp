#pragma once
#include <optional>
#include <string>
#include <vector>

namespace OfficePdf {
namespace Office {
namespace Formats {

// A word-processor save-as code and the LibreOffice export filter behind it.
struct SaveFormat {
    int         code;
    std::string name;
    std::string extension;
    std::string filter;
};

const std::vector<SaveFormat>& get_save_formats();

std::optional<SaveFormat> find_save_format(int code);

// Accepts a format name ("pdf", "docx") or a numeric code ("17").
std::optional<SaveFormat> find_save_format(const std::string& name_or_code);

// input with its extension replaced by the format's extension.
std::string default_output_path(const std::string& input_path, const SaveFormat& format);

}  // namespace Formats
}  // namespace Office
}  // namespace OfficePdf
