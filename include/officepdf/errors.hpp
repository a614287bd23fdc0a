#pragma once
#include <stdexcept>
#include <string>

#include "officepdf/statuses.hpp"

namespace OfficePdf {

class ConversionError : public std::runtime_error {
public:
    explicit ConversionError(const std::string& message, Status status = Status::Error);

    Status status() const noexcept {
        return status_;
    }

private:
    Status status_;
};

// The word processor could not be located, started or initialised.
class ApplicationUnavailable : public ConversionError {
public:
    explicit ApplicationUnavailable(const std::string& message);
};

// The input could not be loaded: missing, unreadable or rejected.
class DocumentOpenFailed : public ConversionError {
public:
    explicit DocumentOpenFailed(const std::string& message);
};

// Save-as failed or produced no file.
class ExportFailed : public ConversionError {
public:
    explicit ExportFailed(const std::string& message);
};

// Closing the document or quitting the application failed.
class ResourceCleanupFailed : public ConversionError {
public:
    explicit ResourceCleanupFailed(const std::string& message);
};

}  // namespace OfficePdf
