#include "officepdf/errors.hpp"

namespace OfficePdf {

const char* status_name(Status status) {
    switch (status) {
        case Status::Ok:
            return "ok";
        case Status::Error:
            return "error";
        case Status::UsageError:
            return "usage error";
        case Status::ApplicationUnavailable:
            return "application unavailable";
        case Status::DocumentOpenFailed:
            return "document open failed";
        case Status::ExportFailed:
            return "export failed";
        case Status::ResourceCleanupFailed:
            return "resource cleanup failed";
    }
    return "unknown";
}

ConversionError::ConversionError(const std::string& message, Status status)
    : std::runtime_error(message), status_(status) {
}

ApplicationUnavailable::ApplicationUnavailable(const std::string& message)
    : ConversionError(message, Status::ApplicationUnavailable) {
}

DocumentOpenFailed::DocumentOpenFailed(const std::string& message)
    : ConversionError(message, Status::DocumentOpenFailed) {
}

ExportFailed::ExportFailed(const std::string& message)
    : ConversionError(message, Status::ExportFailed) {
}

ResourceCleanupFailed::ResourceCleanupFailed(const std::string& message)
    : ConversionError(message, Status::ResourceCleanupFailed) {
}

}  // namespace OfficePdf
