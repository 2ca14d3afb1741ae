#include "rate_normalizer.hpp"

#include <array>
#include <cctype>
#include <utility>

#include "internal/observability/logging.hpp"

namespace proposal::settings {

namespace {

constexpr std::array<std::pair<std::string_view, double>, 8> kHoursPerUnit = {{
    {"hour", 1.0},
    {"hours", 1.0},
    {"day", 8.0},
    {"days", 8.0},
    {"week", 40.0},
    {"weeks", 40.0},
    {"month", 160.0},
    {"months", 160.0},
}};

std::string CanonicalUnit(std::string_view unit) {
  std::string out;
  for (char c : unit) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  // "/day", "per day"
  if (out.rfind("per", 0) == 0) out.erase(0, 3);
  if (!out.empty() && out.front() == '/') out.erase(0, 1);
  return out;
}

} // namespace

std::optional<double> HoursPerUnit(std::string_view unit) {
  const auto canonical = CanonicalUnit(unit);
  for (const auto& [name, hours] : kHoursPerUnit) {
    if (name == canonical) return hours;
  }
  return std::nullopt;
}

double NormalizeRate(double value, std::string_view unit) {
  if (auto hours = HoursPerUnit(unit)) return value / *hours;
  return value;
}

std::map<std::string, double> NormalizeRates(const std::map<std::string, routing::ExtractedRate>& rates) {
  std::map<std::string, double> hourly;
  for (const auto& [role, rate] : rates) {
    if (!rate.value) {
      PROPOSAL_LOG_WARN("skipping non-numeric rate",
                        {observability::StringField("role", role), observability::StringField("value", rate.raw)});
      continue;
    }
    if (!rate.unit.empty() && !HoursPerUnit(rate.unit)) {
      PROPOSAL_LOG_DEBUG("unknown rate unit, treating as hourly",
                         {observability::StringField("role", role), observability::StringField("unit", rate.unit)});
    }
    hourly[role] = NormalizeRate(*rate.value, rate.unit);
  }
  return hourly;
}

} // namespace proposal::settings
