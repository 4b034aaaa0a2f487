#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace hemovita {

[[nodiscard]] std::string trim(std::string_view text);

[[nodiscard]] std::string to_lower(std::string_view text);

[[nodiscard]] bool contains_ignore_case(std::string_view haystack, std::string_view needle);

// Parses a whole cell as a double; empty, "nan" or trailing garbage yield nullopt.
[[nodiscard]] std::optional<double> parse_number(std::string_view text);

}  // namespace hemovita
