#pragma once

#include <set>
#include <string>

namespace hemovita {

// Reader-facing name of a marker or supplement key; unknown names are returned as given.
[[nodiscard]] std::string display_name(const std::string& key);

// Like display_name, but unknown keys are title-cased with underscores as spaces.
[[nodiscard]] std::string pretty_nutrient(const std::string& key);

// "a", "a and b", "a, b, and c" over the sorted slot names.
[[nodiscard]] std::string slots_phrase(const std::set<std::string>& slots);

}  // namespace hemovita
