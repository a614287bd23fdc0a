#pragma once
#include <string>

#include "officepdf/application.hpp"
#include "officepdf/errors.hpp"

namespace OfficePdf {

// Save-as code the word processor uses for PDF export.
constexpr int kPdfFormatCode = 17;

// Launch, open, save-as, close, quit. The document and the application are
// released on every path, each exactly once.
void convert(Application&       app,
             const std::string& input_path,
             const std::string& output_path,
             int                format_code);

void convert_to_pdf(Application&       app,
                    const std::string& input_path,
                    const std::string& output_path);

}  // namespace OfficePdf
