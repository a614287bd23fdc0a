#pragma once
#include <memory>
#include <string>
#include <vector>

#include "../core/config/config.hpp"
#include "officepdf/application.hpp"

namespace OfficePdf {
namespace Office {

std::vector<std::string> available_backends();

// Throws ApplicationUnavailable for a backend that is unknown or not built in.
std::unique_ptr<Application> create_application(const Core::Config& config);

}  // namespace Office
}  // namespace OfficePdf
