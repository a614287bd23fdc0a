#include "save_format.hpp"
#include <filesystem>
#include <stdexcept>

#include "../../utils/text/string_utils.hpp"

namespace OfficePdf {
namespace Office {
namespace Formats {

using namespace OfficePdf::Utils;

const std::vector<SaveFormat>& get_save_formats() {
    static const std::vector<SaveFormat> formats = {
        {0, "doc", "doc", "MS Word 97"},
        {2, "text", "txt", "Text"},
        {6, "rtf", "rtf", "Rich Text Format"},
        {8, "html", "html", "HTML (StarWriter)"},
        {12, "docx", "docx", "MS Word 2007 XML"},
        {16, "docx", "docx", "MS Word 2007 XML"},
        {17, "pdf", "pdf", "writer_pdf_Export"},
        {23, "odt", "odt", "writer8"}};
    return formats;
}

std::optional<SaveFormat> find_save_format(int code) {
    for (const auto& format : get_save_formats()) {
        if (format.code == code)
            return format;
    }
    return std::nullopt;
}

std::optional<SaveFormat> find_save_format(const std::string& name_or_code) {
    std::string key = Text::to_lower(Text::trim(name_or_code));
    if (key.empty())
        return std::nullopt;

    if (Text::is_integer(key)) {
        try {
            return find_save_format(std::stoi(key));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    for (const auto& format : get_save_formats()) {
        if (format.name == key)
            return format;
    }
    return std::nullopt;
}

std::string default_output_path(const std::string& input_path, const SaveFormat& format) {
    std::filesystem::path path(input_path);
    path.replace_extension(format.extension);
    return path.string();
}

}  // namespace Formats
}  // namespace Office
}  // namespace OfficePdf
