#pragma once
#include <string>

#include "../../office/formats/export_options.hpp"
#include "../logger/logger.hpp"
#include "../types/constants.hpp"

namespace OfficePdf {
namespace Core {

struct Config {
    std::string                       input;
    std::string                       output;  // empty: input with the format's extension
    std::string                       backend = Constants::DEFAULT_BACKEND;
    std::string                       office_path;
    std::string                       profile_dir;
    std::string                       format      = "pdf";
    int                               format_code = Constants::DEFAULT_FORMAT_CODE;
    Office::Formats::PdfExportOptions pdf;
    int                               log_level = LOG_DEFAULT;
    std::string                       config_path;

    static Config parse(int argc, char* argv[]);
};

int parse_log_level(const std::string& name);

}  // namespace Core
}  // namespace OfficePdf
