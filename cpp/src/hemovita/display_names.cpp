#include "hemovita/display_names.hpp"

#include <cctype>
#include <unordered_map>
#include <vector>

namespace hemovita {

namespace {

const std::unordered_map<std::string, std::string>& human_labels() {
    static const std::unordered_map<std::string, std::string> labels{
        {"Hemoglobin", "Hemoglobin"},
        {"MCV", "Mean corpuscular volume (MCV)"},
        {"ferritin", "Serum ferritin"},
        {"iron", "Iron"},
        {"vitamin_B12", "Vitamin B12"},
        {"folate_plasma", "Folic Acid"},
        {"folate", "Folate"},
        {"vitamin_D", "Vitamin D (25(OH)D)"},
        {"vitamin_C", "Vitamin C"},
        {"vitamin_E", "Vitamin E"},
        {"vitamin_A", "Vitamin A (retinol)"},
        {"vitamin_B6", "Vitamin B6 (PLP)"},
        {"magnesium", "Magnesium"},
        {"calcium", "Calcium"},
        {"zinc", "Zinc"},
        {"homocysteine", "Homocysteine"},
    };
    return labels;
}

[[nodiscard]] std::string title_case(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    bool word_start = true;
    for (char c : key) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            out.push_back(static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc)));
            word_start = false;
            continue;
        }
        out.push_back(c == '_' ? ' ' : c);
        word_start = true;
    }
    return out;
}

}  // namespace

std::string display_name(const std::string& key) {
    auto it = human_labels().find(key);
    return it == human_labels().end() ? key : it->second;
}

std::string pretty_nutrient(const std::string& key) {
    auto it = human_labels().find(key);
    return it == human_labels().end() ? title_case(key) : it->second;
}

std::string slots_phrase(const std::set<std::string>& slots) {
    const std::vector<std::string> sorted(slots.begin(), slots.end());
    if (sorted.empty()) {
        return {};
    }
    if (sorted.size() == 1) {
        return sorted.front();
    }
    if (sorted.size() == 2) {
        return sorted[0] + " and " + sorted[1];
    }
    std::string out;
    for (std::size_t i = 0; i + 1 < sorted.size(); ++i) {
        out += sorted[i] + ", ";
    }
    return out + "and " + sorted.back();
}

}  // namespace hemovita
