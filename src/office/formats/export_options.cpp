#include "export_options.hpp"
#include <nlohmann/json.hpp>

namespace OfficePdf {
namespace Office {
namespace Formats {

namespace {

nlohmann::json property(const std::string& type, const std::string& value) {
    return {{"type", type}, {"value", value}};
}

}  // namespace

bool PdfExportOptions::empty() const {
    return page_range.empty() && pdf_version == 0 && !tagged && !bookmarks && !quality;
}

std::string PdfExportOptions::to_filter_options() const {
    if (empty())
        return "";

    nlohmann::json options = nlohmann::json::object();
    if (!page_range.empty())
        options["PageRange"] = property("string", page_range);
    if (pdf_version != 0)
        options["SelectPdfVersion"] = property("long", std::to_string(pdf_version));
    if (tagged)
        options["UseTaggedPDF"] = property("boolean", *tagged ? "true" : "false");
    if (bookmarks)
        options["ExportBookmarks"] = property("boolean", *bookmarks ? "true" : "false");
    if (quality)
        options["Quality"] = property("long", std::to_string(*quality));

    return options.dump();
}

}  // namespace Formats
}  // namespace Office
}  // namespace OfficePdf
