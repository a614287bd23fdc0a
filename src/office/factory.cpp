#include "factory.hpp"

#include "officepdf/errors.hpp"
#include "soffice/soffice_application.hpp"
#ifdef OFFICEPDF_WITH_LOK
#include "lok/lok_application.hpp"
#endif

namespace OfficePdf {
namespace Office {

using namespace OfficePdf::Core;

std::vector<std::string> available_backends() {
    std::vector<std::string> backends = {Constants::BACKEND_SOFFICE};
#ifdef OFFICEPDF_WITH_LOK
    backends.push_back(Constants::BACKEND_LOK);
#endif
    return backends;
}

std::unique_ptr<Application> create_application(const Config& config) {
    if (config.backend == Constants::BACKEND_SOFFICE) {
        Soffice::SofficeApplication::Options options;
        options.office_path  = config.office_path;
        options.profile_base = config.profile_dir;
        options.pdf          = config.pdf;
        return std::make_unique<Soffice::SofficeApplication>(options);
    }

    if (config.backend == Constants::BACKEND_LOK) {
#ifdef OFFICEPDF_WITH_LOK
        Lok::LokApplication::Options options;
        options.office_path  = config.office_path;
        options.profile_base = config.profile_dir;
        options.pdf          = config.pdf;
        return std::make_unique<Lok::LokApplication>(options);
#else
        throw ApplicationUnavailable("This build has no LibreOfficeKit support");
#endif
    }

    throw ApplicationUnavailable("Unknown backend: " + config.backend);
}

}  // namespace Office
}  // namespace OfficePdf
