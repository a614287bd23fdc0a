#include "lok_application.hpp"
#include <LibreOfficeKit/LibreOfficeKit.hxx>
#include <system_error>
#include <utility>
#include <unistd.h>

#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"
#include "../formats/save_format.hpp"
#include "../launcher/office_launcher.hpp"
#include "officepdf/errors.hpp"

namespace OfficePdf {
namespace Office {
namespace Lok {

using namespace OfficePdf::Core;
namespace fs = std::filesystem;

LokApplication::LokApplication(Options options) : options_(std::move(options)) {
}

LokApplication::~LokApplication() {
    documents_.clear();
    office_.reset();
    if (!profile_dir_.empty()) {
        std::error_code ec;
        fs::remove_all(profile_dir_, ec);
    }
}

std::string LokApplication::name() const {
    return Constants::BACKEND_LOK;
}

std::string LokApplication::office_error() const {
    if (!office_)
        return "LibreOfficeKit not initialised";

    char* error = office_->getError();
    if (error == nullptr)
        return "unknown LibreOfficeKit error";
    std::string message(error);
    office_->freeError(error);
    return message;
}

void LokApplication::launch() {
    if (office_)
        return;

    std::string program_dir = Launcher::OfficeLauncher::program_dir(options_.office_path);
    if (program_dir.empty())
        throw ApplicationUnavailable(
            "LibreOffice program directory not found. Use --office to specify it.");

    fs::path root = options_.profile_base.empty() ? fs::temp_directory_path()
                                                  : fs::path(options_.profile_base);
    fs::path profile =
        root / (std::string(Constants::PROFILE_PREFIX) + "lok_" + std::to_string(getpid()));

    std::error_code ec;
    fs::create_directories(profile, ec);
    if (ec)
        throw ApplicationUnavailable("Cannot create office profile " + profile.string() + ": "
                                     + ec.message());

    std::string profile_url = Utils::Url::from_path(profile.string());
    office_.reset(lok::lok_cpp_init(program_dir.c_str(), profile_url.c_str()));
    if (!office_) {
        fs::remove_all(profile, ec);
        throw ApplicationUnavailable("Failed to initialise LibreOfficeKit from " + program_dir);
    }

    profile_dir_ = profile;
    Logger::debug("LibreOfficeKit initialised from " + program_dir);
}

DocumentId LokApplication::open(const std::string& path) {
    if (!office_)
        throw ApplicationUnavailable("Office application is not running");

    std::error_code ec;
    if (!fs::exists(path, ec))
        throw DocumentOpenFailed("Input document not found: " + path);

    std::string url = Utils::Url::from_path(path);
    std::unique_ptr<lok::Document> document(office_->documentLoad(url.c_str()));
    if (!document)
        throw DocumentOpenFailed("Failed to load " + path + ": " + office_error());

    DocumentId id = next_document_++;
    documents_.emplace(id, std::move(document));
    return id;
}

void LokApplication::save_as(DocumentId document, const std::string& path, int code) {
    auto it = documents_.find(document);
    if (it == documents_.end())
        throw ExportFailed("Document " + std::to_string(document) + " is not open");

    auto format = Formats::find_save_format(code);
    if (!format)
        throw ExportFailed("Unsupported save format code: " + std::to_string(code));

    std::string filter_options;
    if (format->code == Constants::DEFAULT_FORMAT_CODE)
        filter_options = options_.pdf.to_filter_options();

    std::string url = Utils::Url::from_path(path);
    if (!it->second->saveAs(url.c_str(),
                            format->extension.c_str(),
                            filter_options.empty() ? nullptr : filter_options.c_str()))
        throw ExportFailed("Failed to save " + path + ": " + office_error());
}

void LokApplication::close(DocumentId document) {
    if (documents_.erase(document) == 0)
        throw ResourceCleanupFailed("Document " + std::to_string(document) + " is not open");
}

void LokApplication::quit() {
    if (!office_)
        return;

    documents_.clear();
    office_.reset();

    std::error_code ec;
    fs::remove_all(profile_dir_, ec);
    fs::path profile = profile_dir_;
    profile_dir_.clear();
    if (ec)
        throw ResourceCleanupFailed("Cannot remove office profile " + profile.string() + ": "
                                    + ec.message());
}

}  // namespace Lok
}  // namespace Office
}  // namespace OfficePdf
