#include <exception>

#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "office/factory.hpp"
#include "officepdf/converter.hpp"

namespace {

using namespace OfficePdf;
using namespace OfficePdf::Core;

int exit_code(Status status) {
    return static_cast<int>(status);
}

int run_conversion(const Config& config) {
    try {
        auto app = Office::create_application(config);
        Logger::info("Converting " + config.input + " with " + app->name() + "...");

        convert(*app, config.input, config.output, config.format_code);

        Logger::success("Saved: " + config.output);
        return exit_code(Status::Ok);
    } catch (const ConversionError& e) {
        Logger::error(std::string(status_name(e.status())) + ": " + e.what());
        return exit_code(e.status());
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return exit_code(Status::Error);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parse(argc, argv);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return exit_code(Status::UsageError);
    }

    Logger::set_level(config.log_level);

    if (config.input.empty()) {
        Logger::error("No input document provided. Run with --help for usage.");
        return exit_code(Status::UsageError);
    }

    return run_conversion(config);
}
