#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "internal/routing/routing_decision.hpp"

namespace proposal::settings {

// hour(s)=1, day(s)=8, week(s)=40, month(s)=160; nullopt otherwise.
std::optional<double> HoursPerUnit(std::string_view unit);

// Unknown or empty units are taken as already hourly.
double NormalizeRate(double value, std::string_view unit);

// Hourly rate per role. Rates without a numeric value are skipped.
std::map<std::string, double> NormalizeRates(const std::map<std::string, routing::ExtractedRate>& rates);

} // namespace proposal::settings
