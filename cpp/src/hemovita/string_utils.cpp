#include "hemovita/string_utils.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <system_error>

namespace hemovita {

namespace {
[[nodiscard]] bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}
}  // namespace

std::string trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool contains_ignore_case(std::string_view haystack, std::string_view needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::optional<double> parse_number(std::string_view text) {
    const std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }
    const char* first = value.data();
    const char* last = first + value.size();
    if (*first == '+' && value.size() > 1 && value[1] != '-') {
        ++first;
    }
    double parsed = 0.0;
    const auto [end, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc() || end != last || std::isnan(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace hemovita
