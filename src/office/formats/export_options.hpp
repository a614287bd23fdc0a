#pragma once
#include <optional>
#include <string>

namespace OfficePdf {
namespace Office {
namespace Formats {

// Settings handed to writer_pdf_Export. Unset fields keep the application's
// defaults.
struct PdfExportOptions {
    std::string         page_range;
    int                 pdf_version = 0;
    std::optional<bool> tagged;
    std::optional<bool> bookmarks;
    std::optional<int>  quality;

    bool empty() const;

    // LibreOffice JSON filter options, e.g.
    // {"PageRange":{"type":"string","value":"1-2"}}. Empty when nothing is set.
    std::string to_filter_options() const;
};

}  // namespace Formats
}  // namespace Office
}  // namespace OfficePdf
