#pragma once
#include <filesystem>
#include <map>
#include <string>

#include "../formats/export_options.hpp"
#include "../formats/save_format.hpp"
#include "../launcher/office_launcher.hpp"
#include "officepdf/application.hpp"

namespace OfficePdf {
namespace Office {
namespace Soffice {

/**
 * Drives a headless `soffice` binary. Every save-as runs one soffice process
 * against a private user profile, so a desktop instance of the same user is
 * never disturbed.
 */
class SofficeApplication : public Application {
public:
    struct Options {
        std::string               office_path;   // empty: auto-detect
        std::string               profile_base;  // empty: system temp directory
        Formats::PdfExportOptions pdf;
    };

    explicit SofficeApplication(Options options);
    ~SofficeApplication() override;

    std::string name() const override;

    void       launch() override;
    DocumentId open(const std::string& path) override;
    void       save_as(DocumentId document, const std::string& path, int code) override;
    void       close(DocumentId document) override;
    void       quit() override;

    const std::string& office_path() const {
        return office_path_;
    }
    const std::filesystem::path& profile_dir() const {
        return profile_dir_;
    }

private:
    std::string convert_target(const Formats::SaveFormat& format) const;
    void        publish(const std::filesystem::path& staged, const std::string& destination);

    Options                           options_;
    Launcher::OfficeLauncher          launcher_;
    std::string                       office_path_;
    std::filesystem::path             profile_dir_;
    std::map<DocumentId, std::string> documents_;
    DocumentId                        next_document_ = 1;
    int                               next_staging_  = 1;
    bool                              launched_      = false;
};

}  // namespace Soffice
}  // namespace Office
}  // namespace OfficePdf
