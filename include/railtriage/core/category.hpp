#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace railtriage::core {

/// Complaint category assigned by the classifier.
enum class Category : std::uint8_t {
  Cleanliness,
  Maintenance,
  Safety,
  Staff,
  Other,
};

inline constexpr std::size_t kCategoryCount = 5;

inline constexpr std::array<Category, kCategoryCount> kAllCategories = {
    Category::Cleanliness, Category::Maintenance, Category::Safety,
    Category::Staff,       Category::Other,
};

/// Operational unit that resolves a category of complaint.
enum class Department : std::uint8_t {
  Housekeeping,
  Maintenance,
  Safety,
  ServiceQuality,
  GeneralAdministration,
};

[[nodiscard]] constexpr std::size_t index_of(Category c) noexcept {
  return static_cast<std::size_t>(c);
}

[[nodiscard]] std::string_view to_string(Category c) noexcept;
[[nodiscard]] std::string_view to_string(Department d) noexcept;

/// Case-insensitive; accepts the enum names ("Maintenance") and lowercase keys ("staff").
[[nodiscard]] std::optional<Category> parse_category(std::string_view s);
[[nodiscard]] std::optional<Department> parse_department(std::string_view s);

}  // namespace railtriage::core
