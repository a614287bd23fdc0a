#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "../../office/formats/save_format.hpp"
#include "../../utils/text/string_utils.hpp"

namespace OfficePdf {
namespace Core {

using namespace OfficePdf::Utils;

int parse_log_level(const std::string& name) {
    std::string level = Text::to_lower(Text::trim(name));
    if (level == "none" || level == "quiet")
        return LOG_NONE;
    if (level == "error")
        return LOG_ERROR;
    if (level == "warn" || level == "warning")
        return LOG_ERROR | LOG_WARN;
    if (level == "info")
        return LOG_DEFAULT;
    if (level == "debug" || level == "verbose" || level == "all")
        return LOG_ALL;
    throw std::runtime_error("Unknown log level: " + name);
}

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["input"])
            config.input = yaml["input"].as<std::string>();
        if (yaml["output"])
            config.output = yaml["output"].as<std::string>();
        if (yaml["backend"])
            config.backend = yaml["backend"].as<std::string>();
        if (yaml["office_path"])
            config.office_path = yaml["office_path"].as<std::string>();
        if (yaml["office"])
            config.office_path = yaml["office"].as<std::string>();
        if (yaml["profile_dir"])
            config.profile_dir = yaml["profile_dir"].as<std::string>();
        if (yaml["format"])
            config.format = yaml["format"].as<std::string>();
        if (yaml["log_level"])
            config.log_level = parse_log_level(yaml["log_level"].as<std::string>());

        YAML::Node pdf = yaml["pdf"];
        if (pdf && pdf.IsMap()) {
            if (pdf["page_range"])
                config.pdf.page_range = pdf["page_range"].as<std::string>();
            if (pdf["version"])
                config.pdf.pdf_version = pdf["version"].as<int>();
            if (pdf["tagged"])
                config.pdf.tagged = pdf["tagged"].as<bool>();
            if (pdf["bookmarks"])
                config.pdf.bookmarks = pdf["bookmarks"].as<bool>();
            if (pdf["quality"])
                config.pdf.quality = pdf["quality"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"officepdf - Export documents to PDF through a local word processor"};

    app.add_option("input", config.input, "Document to convert");
    app.add_option(
        "output", config.output, "Destination file (default: input with new extension)");
    app.add_option("-b,--backend", config.backend, "Automation backend: soffice or lok")
        ->check(CLI::IsMember(
            std::vector<std::string>{Constants::BACKEND_SOFFICE, Constants::BACKEND_LOK}));
    app.add_option(
        "--office", config.office_path, "Path to soffice (or the LibreOffice program dir)");
    app.add_option(
        "--profile-dir", config.profile_dir, "Where private office profiles are created");
    app.add_option(
        "-f,--format", config.format, "Output format name or save-as code (default: pdf)");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_option("--page-range", config.pdf.page_range, "Pages to export, e.g. 1-3,5");
    app.add_option("--pdf-version", config.pdf.pdf_version, "PDF version (0, 1-3 for PDF/A, 15-17)")
        ->check(CLI::IsMember({Constants::PDF_VERSION_DEFAULT,
                               Constants::PDF_VERSION_A1B,
                               Constants::PDF_VERSION_A2B,
                               Constants::PDF_VERSION_A3B,
                               Constants::PDF_VERSION_1_5,
                               Constants::PDF_VERSION_1_6,
                               Constants::PDF_VERSION_1_7}));
    app.add_option_function<int>(
           "--quality",
           [&](const int& quality) { config.pdf.quality = quality; },
           "JPEG quality for images (1-100)")
        ->check(CLI::Range(1, 100));
    app.add_flag(
        "--tagged",
        [&](size_t count) {
            if (count > 0)
                config.pdf.tagged = true;
        },
        "Write a tagged (accessible) PDF");
    app.add_flag(
        "--bookmarks",
        [&](size_t count) {
            if (count > 0)
                config.pdf.bookmarks = true;
        },
        "Export headings as PDF bookmarks");

    app.add_flag(
        "-v,--verbose",
        [&](size_t count) {
            if (count > 0)
                config.log_level = LOG_ALL;
        },
        "Log every automation step");
    app.add_flag(
        "-q,--quiet",
        [&](size_t count) {
            if (count > 0)
                config.log_level = LOG_ERROR;
        },
        "Only log errors");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    auto format = Office::Formats::find_save_format(config.format);
    if (!format)
        throw std::runtime_error("Unknown output format: " + config.format);
    config.format_code = format->code;

    if (config.output.empty() && !config.input.empty())
        config.output = Office::Formats::default_output_path(config.input, *format);

    return config;
}

}  // namespace Core
}  // namespace OfficePdf
