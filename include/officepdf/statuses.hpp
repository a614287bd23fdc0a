#pragma once

namespace OfficePdf {

// Values double as the exit code of the officepdf tool.
enum class Status {
    Ok                     = 0,
    Error                  = 1,
    UsageError             = 2,
    ApplicationUnavailable = 3,
    DocumentOpenFailed     = 4,
    ExportFailed           = 5,
    ResourceCleanupFailed  = 6
};

const char* status_name(Status status);

}  // namespace OfficePdf
