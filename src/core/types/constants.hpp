#pragma once

namespace OfficePdf {
namespace Core {

struct Constants {
    static constexpr const char* BACKEND_SOFFICE = "soffice";
    static constexpr const char* BACKEND_LOK     = "lok";
    static constexpr const char* DEFAULT_BACKEND = BACKEND_SOFFICE;

    static constexpr int DEFAULT_FORMAT_CODE = 17;  // PDF

    static constexpr const char* PROFILE_PREFIX = "officepdf_profile_";
    static constexpr const char* STAGING_PREFIX = "staging_";

    // PDF export versions understood by writer_pdf_Export's SelectPdfVersion.
    static constexpr int PDF_VERSION_DEFAULT = 0;
    static constexpr int PDF_VERSION_A1B     = 1;
    static constexpr int PDF_VERSION_A2B     = 2;
    static constexpr int PDF_VERSION_A3B     = 3;
    static constexpr int PDF_VERSION_1_5     = 15;
    static constexpr int PDF_VERSION_1_6     = 16;
    static constexpr int PDF_VERSION_1_7     = 17;
};

}  // namespace Core
}  // namespace OfficePdf
