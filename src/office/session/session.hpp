#pragma once
#include <string>

#include "officepdf/application.hpp"

namespace OfficePdf {
namespace Office {

/**
 * Owns a launched application for the duration of a scope.
 *
 * The constructor launches; the destructor quits unless quit() already ran.
 * quit() reports failure with ResourceCleanupFailed, the destructor only logs
 * it. Either way the application is asked to quit exactly once.
 */
class ApplicationSession {
public:
    explicit ApplicationSession(Application& app);
    ~ApplicationSession();

    ApplicationSession(const ApplicationSession&)            = delete;
    ApplicationSession& operator=(const ApplicationSession&) = delete;

    Application& application() {
        return app_;
    }
    bool active() const {
        return active_;
    }

    void quit();

private:
    Application& app_;
    bool         active_ = false;
};

// A document opened in an application, closed exactly once.
class OpenDocument {
public:
    OpenDocument(Application& app, const std::string& path);
    ~OpenDocument();

    OpenDocument(const OpenDocument&)            = delete;
    OpenDocument& operator=(const OpenDocument&) = delete;

    DocumentId id() const {
        return id_;
    }
    bool is_open() const {
        return open_;
    }

    void save_as(const std::string& path, int format_code);
    void close();

private:
    Application& app_;
    std::string  path_;
    DocumentId   id_   = 0;
    bool         open_ = false;
};

}  // namespace Office
}  // namespace OfficePdf
