#pragma once

#include <string>
#include <vector>

#include <boost/json.hpp>

#include "redactor/detect/detector_set.hpp"
#include "redactor/result.hpp"

namespace redactor {

// Report as a JSON object; counts and names only
boost::json::object report_to_object(const RedactionReport& report);
std::string report_to_json(const RedactionReport& report);

std::string error_to_json(const PipelineError& error);

// Detector availability, one entry per detector
std::string status_to_json(const std::vector<DetectorStatusEntry>& status);

} // namespace redactor
