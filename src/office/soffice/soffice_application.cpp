#include "soffice_application.hpp"
#include <system_error>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"
#include "officepdf/errors.hpp"

namespace OfficePdf {
namespace Office {
namespace Soffice {

using namespace OfficePdf::Core;
namespace fs = std::filesystem;

namespace {

long current_pid() {
#ifdef _WIN32
    return static_cast<long>(GetCurrentProcessId());
#else
    return static_cast<long>(getpid());
#endif
}

fs::path unique_profile_dir(const std::string& base) {
    static int counter = 0;
    fs::path   root    = base.empty() ? fs::temp_directory_path() : fs::path(base);
    return root / (std::string(Constants::PROFILE_PREFIX) + std::to_string(current_pid()) + "_"
                   + std::to_string(++counter));
}

}  // namespace

SofficeApplication::SofficeApplication(Options options) : options_(std::move(options)) {
}

SofficeApplication::~SofficeApplication() {
    launcher_.terminate();
    if (launched_) {
        std::error_code ec;
        fs::remove_all(profile_dir_, ec);
        if (ec)
            Logger::warn("Could not remove office profile " + profile_dir_.string() + ": "
                         + ec.message());
    }
}

std::string SofficeApplication::name() const {
    return Constants::BACKEND_SOFFICE;
}

void SofficeApplication::launch() {
    if (launched_)
        return;

    office_path_ = Launcher::OfficeLauncher::resolve_office(options_.office_path);
    if (office_path_.empty())
        throw ApplicationUnavailable(
            "LibreOffice (soffice) not found. Use --office to specify its path.");

    std::error_code ec;
    if (!fs::exists(office_path_, ec))
        throw ApplicationUnavailable("Office path does not exist: " + office_path_);
    if (!Launcher::OfficeLauncher::is_executable(office_path_))
        throw ApplicationUnavailable("Office path is not an executable file: " + office_path_);

    fs::path profile = unique_profile_dir(options_.profile_base);
    fs::create_directories(profile, ec);
    if (ec)
        throw ApplicationUnavailable("Cannot create office profile " + profile.string() + ": "
                                     + ec.message());

    profile_dir_ = profile;
    launched_    = true;
    Logger::debug("Using " + office_path_ + " with profile " + profile_dir_.string());
}

DocumentId SofficeApplication::open(const std::string& path) {
    if (!launched_)
        throw ApplicationUnavailable("Office application is not running");

    std::error_code ec;
    if (!fs::exists(path, ec))
        throw DocumentOpenFailed("Input document not found: " + path);
    if (!fs::is_regular_file(path, ec))
        throw DocumentOpenFailed("Input is not a regular file: " + path);

    DocumentId id = next_document_++;
    documents_[id] = fs::absolute(path).lexically_normal().string();
    return id;
}

std::string SofficeApplication::convert_target(const Formats::SaveFormat& format) const {
    std::string target = format.extension + ":" + format.filter;
    if (format.code == Constants::DEFAULT_FORMAT_CODE) {
        std::string filter_options = options_.pdf.to_filter_options();
        if (!filter_options.empty())
            target += ":" + filter_options;
    }
    return target;
}

void SofficeApplication::save_as(DocumentId document, const std::string& path, int code) {
    auto it = documents_.find(document);
    if (it == documents_.end())
        throw ExportFailed("Document " + std::to_string(document) + " is not open");

    auto format = Formats::find_save_format(code);
    if (!format)
        throw ExportFailed("Unsupported save format code: " + std::to_string(code));

    const std::string& input = it->second;
    fs::path staging =
        profile_dir_ / (std::string(Constants::STAGING_PREFIX) + std::to_string(next_staging_++));

    std::error_code ec;
    fs::create_directories(staging, ec);
    if (ec)
        throw ExportFailed("Cannot create staging directory " + staging.string() + ": "
                           + ec.message());

    std::vector<std::string> args = {
        "--headless",
        "--invisible",
        "--nologo",
        "--norestore",
        "--nolockcheck",
        "-env:UserInstallation=" + Utils::Url::from_path((profile_dir_ / "user").string()),
        "--convert-to",
        convert_target(*format),
        "--outdir",
        staging.string(),
        input};

    int status = launcher_.run(office_path_, args);
    try {
        if (status == Launcher::OfficeLauncher::NOT_STARTED)
            throw ApplicationUnavailable("Could not start " + office_path_);
        if (status != 0)
            throw ExportFailed("soffice exited with status " + std::to_string(status)
                               + " while exporting " + input);

        fs::path staged = staging / (fs::path(input).stem().string() + "." + format->extension);
        if (!fs::exists(staged, ec))
            throw ExportFailed("soffice produced no output for " + input);

        publish(staged, path);
    } catch (...) {
        fs::remove_all(staging, ec);
        throw;
    }

    fs::remove_all(staging, ec);
    if (ec)
        Logger::warn("Could not remove staging directory " + staging.string() + ": "
                     + ec.message());
}

void SofficeApplication::publish(const fs::path& staged, const std::string& destination) {
    std::error_code ec;
    fs::rename(staged, destination, ec);
    if (!ec)
        return;

    // rename fails across filesystems
    std::error_code copy_ec;
    fs::copy_file(staged, destination, fs::copy_options::overwrite_existing, copy_ec);
    if (copy_ec)
        throw ExportFailed("Cannot write " + destination + ": " + copy_ec.message());
}

void SofficeApplication::close(DocumentId document) {
    if (documents_.erase(document) == 0)
        throw ResourceCleanupFailed("Document " + std::to_string(document) + " is not open");
}

void SofficeApplication::quit() {
    if (!launched_)
        return;

    launcher_.terminate();
    documents_.clear();
    launched_ = false;

    std::error_code ec;
    fs::remove_all(profile_dir_, ec);
    if (ec)
        throw ResourceCleanupFailed("Cannot remove office profile " + profile_dir_.string()
                                    + ": " + ec.message());
}

}  // namespace Soffice
}  // namespace Office
}  // namespace OfficePdf
