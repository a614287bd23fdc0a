#include "session.hpp"
#include <exception>

#include "../../core/logger/logger.hpp"
#include "officepdf/errors.hpp"

namespace OfficePdf {
namespace Office {

using namespace OfficePdf::Core;

ApplicationSession::ApplicationSession(Application& app) : app_(app) {
    Logger::debug("Launching " + app_.name());
    try {
        app_.launch();
    } catch (const ConversionError&) {
        throw;
    } catch (const std::exception& e) {
        throw ApplicationUnavailable("Failed to launch " + app_.name() + ": " + e.what());
    }
    active_ = true;
}

ApplicationSession::~ApplicationSession() {
    if (!active_)
        return;

    try {
        quit();
    } catch (const std::exception& e) {
        Logger::error(e.what());
    }
}

void ApplicationSession::quit() {
    if (!active_)
        return;

    active_ = false;
    Logger::debug("Quitting " + app_.name());
    try {
        app_.quit();
    } catch (const ResourceCleanupFailed&) {
        throw;
    } catch (const std::exception& e) {
        throw ResourceCleanupFailed("Failed to quit " + app_.name() + ": " + e.what());
    }
}

OpenDocument::OpenDocument(Application& app, const std::string& path) : app_(app), path_(path) {
    Logger::debug("Opening " + path_);
    try {
        id_ = app_.open(path_);
    } catch (const ConversionError&) {
        throw;
    } catch (const std::exception& e) {
        throw DocumentOpenFailed("Failed to open " + path_ + ": " + e.what());
    }
    open_ = true;
}

OpenDocument::~OpenDocument() {
    if (!open_)
        return;

    try {
        close();
    } catch (const std::exception& e) {
        Logger::error(e.what());
    }
}

void OpenDocument::save_as(const std::string& path, int format_code) {
    if (!open_)
        throw ExportFailed("Document " + path_ + " is already closed");

    Logger::debug("Saving " + path_ + " as " + path + " (format " + std::to_string(format_code)
                  + ")");
    try {
        app_.save_as(id_, path, format_code);
    } catch (const ConversionError&) {
        throw;
    } catch (const std::exception& e) {
        throw ExportFailed("Failed to save " + path + ": " + e.what());
    }
}

void OpenDocument::close() {
    if (!open_)
        return;

    open_ = false;
    Logger::debug("Closing " + path_);
    try {
        app_.close(id_);
    } catch (const ResourceCleanupFailed&) {
        throw;
    } catch (const std::exception& e) {
        throw ResourceCleanupFailed("Failed to close " + path_ + ": " + e.what());
    }
}

}  // namespace Office
}  // namespace OfficePdf
