#pragma once
#include <string>

namespace OfficePdf {

using DocumentId = int;

/**
 * Automation interface of an external word-processing application.
 *
 * Calls block until the application has finished the request. One caller at
 * a time; an instance is launched once and quit once. Failures are reported
 * with the exceptions from officepdf/errors.hpp.
 */
class Application {
public:
    virtual ~Application() = default;

    virtual std::string name() const = 0;

    virtual void       launch()                                                       = 0;
    virtual DocumentId open(const std::string& path)                                  = 0;
    virtual void       save_as(DocumentId document, const std::string& path, int code) = 0;
    virtual void       close(DocumentId document)                                     = 0;
    virtual void       quit()                                                         = 0;
};

}  // namespace OfficePdf
