#include "officepdf/converter.hpp"

#include "../../core/logger/logger.hpp"
#include "../../office/session/session.hpp"

namespace OfficePdf {

using namespace OfficePdf::Core;

void convert(Application&       app,
             const std::string& input_path,
             const std::string& output_path,
             int                format_code) {
    Office::ApplicationSession session(app);
    {
        Office::OpenDocument document(session.application(), input_path);
        document.save_as(output_path, format_code);
        document.close();
    }
    session.quit();

    Logger::debug("Converted " + input_path + " -> " + output_path);
}

void convert_to_pdf(Application&       app,
                    const std::string& input_path,
                    const std::string& output_path) {
    convert(app, input_path, output_path, kPdfFormatCode);
}

}  // namespace OfficePdf
