#include <railtriage/core/category.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace railtriage::core {

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

std::string_view to_string(Category c) noexcept {
  switch (c) {
    case Category::Cleanliness: return "Cleanliness";
    case Category::Maintenance: return "Maintenance";
    case Category::Safety: return "Safety";
    case Category::Staff: return "Staff";
    case Category::Other: return "Other";
  }
  return "Unknown";
}

std::string_view to_string(Department d) noexcept {
  switch (d) {
    case Department::Housekeeping: return "Housekeeping";
    case Department::Maintenance: return "Maintenance";
    case Department::Safety: return "Safety";
    case Department::ServiceQuality: return "ServiceQuality";
    case Department::GeneralAdministration: return "GeneralAdministration";
  }
  return "Unknown";
}

std::optional<Category> parse_category(std::string_view s) {
  const std::string key = lower(s);
  for (Category c : kAllCategories) {
    if (key == lower(to_string(c))) return c;
  }
  return std::nullopt;
}

std::optional<Department> parse_department(std::string_view s) {
  const std::string key = lower(s);
  if (key == "housekeeping") return Department::Housekeeping;
  if (key == "maintenance") return Department::Maintenance;
  if (key == "safety") return Department::Safety;
  if (key == "servicequality" || key == "service_quality") return Department::ServiceQuality;
  if (key == "generaladministration" || key == "general_administration") {
    return Department::GeneralAdministration;
  }
  return std::nullopt;
}

}  // namespace railtriage::core
