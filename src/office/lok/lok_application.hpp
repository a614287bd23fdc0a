#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include "../formats/export_options.hpp"
#include "officepdf/application.hpp"

namespace lok {
class Office;
class Document;
}  // namespace lok

namespace OfficePdf {
namespace Office {
namespace Lok {

/**
 * Runs LibreOffice inside this process through LibreOfficeKit.
 *
 * LibreOfficeKit can be initialised once per process: after quit() a new
 * LokApplication cannot be launched again in the same process.
 */
class LokApplication : public Application {
public:
    struct Options {
        std::string               office_path;   // binary or program dir; empty: auto-detect
        std::string               profile_base;  // empty: system temp directory
        Formats::PdfExportOptions pdf;
    };

    explicit LokApplication(Options options);
    ~LokApplication() override;

    std::string name() const override;

    void       launch() override;
    DocumentId open(const std::string& path) override;
    void       save_as(DocumentId document, const std::string& path, int code) override;
    void       close(DocumentId document) override;
    void       quit() override;

private:
    std::string office_error() const;

    Options                                              options_;
    std::filesystem::path                                profile_dir_;
    std::unique_ptr<lok::Office>                         office_;
    std::map<DocumentId, std::unique_ptr<lok::Document>> documents_;
    DocumentId                                           next_document_ = 1;
};

}  // namespace Lok
}  // namespace Office
}  // namespace OfficePdf
