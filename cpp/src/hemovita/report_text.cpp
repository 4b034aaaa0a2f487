#include "hemovita/report_text.hpp"

#include "hemovita/display_names.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <string_view>
#include <system_error>

namespace hemovita {

namespace {

// Shortest round-trip form, always with a decimal point ("12.0", "9.5").
[[nodiscard]] std::string format_value(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    std::string text(buffer.data(), end);
    if (text.find_first_of(".eEin") == std::string::npos) {
        text += ".0";
    }
    return text;
}

[[nodiscard]] std::string format_general(double value) {
    std::array<char, 32> buffer{};
    std::snprintf(buffer.data(), buffer.size(), "%g", value);
    return buffer.data();
}

[[nodiscard]] std::string capitalize(std::string_view text) {
    std::string out(text);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

[[nodiscard]] std::string or_na(const std::string& text) {
    return text.empty() ? std::string("N/A") : text;
}

std::string join_lines(const std::vector<std::string>& lines, const char* separator = "\n") {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += lines[i];
    }
    return out;
}

}  // namespace

std::string format_lab_block(const LabPanel& labs, const LabelSet& labels) {
    std::vector<std::string> lines;
    lines.reserve(labs.size());
    for (const auto& lab : labs) {
        const std::string value = lab.value.has_value() ? format_value(*lab.value) : std::string("N/A");
        lines.push_back("- " + display_name(lab.marker) + ": " + value + " → " +
                        std::string(to_string(find_label(labels, lab.marker))));
    }
    return join_lines(lines);
}

std::string format_supplement_block(const SupplementPlan& plan) {
    std::vector<std::string> lines;
    for (Slot slot : kSlots) {
        const auto& keys = plan.at(slot);
        if (keys.empty()) {
            continue;
        }
        std::string line = "- " + capitalize(to_string(slot)) + ": ";
        for (std::size_t i = 0; i < keys.size(); ++i) {
            line += (i > 0 ? ", " : "") + display_name(keys[i]);
        }
        lines.push_back(std::move(line));
    }
    if (lines.empty()) {
        return "No supplements recommended based on current labs.";
    }
    return join_lines(lines);
}

std::string format_food_block(const std::vector<FoodSuggestion>& foods) {
    if (foods.empty()) {
        return "No specific food suggestions (no matching entries for the flagged deficiencies).";
    }
    std::vector<std::string> chunks;
    for (const auto& suggestion : foods) {
        if (suggestion.foods.empty()) {
            continue;
        }
        std::vector<std::string> lines{display_name(suggestion.bundle) + " – suggested food sources:"};
        for (const auto& food : suggestion.foods) {
            std::string line = "  • " + food.name;
            if (!food.category.empty()) {
                line += " [" + food.category + "]";
            }
            if (food.serving_g.has_value() && !std::isnan(*food.serving_g)) {
                line += " – typical serving ~" + format_general(*food.serving_g) + " g";
            }
            lines.push_back(std::move(line));
        }
        chunks.push_back(join_lines(lines));
    }
    return join_lines(chunks, "\n\n");
}

std::string format_network_block(const std::optional<std::vector<TargetExplanation>>& explanations,
                                 std::size_t chains_per_target) {
    if (!explanations.has_value()) {
        return "Nutrient interaction network not available (missing relationships file).";
    }
    if (explanations->empty()) {
        return "No network-based causal chains found for the flagged deficiencies.";
    }
    std::vector<std::string> lines;
    for (const auto& target : *explanations) {
        lines.push_back(display_name(target.target) + ":");
        for (std::size_t i = 0; i < target.paths.size() && i < chains_per_target; ++i) {
            lines.push_back("  • " + target.paths[i]);
        }
    }
    return join_lines(lines);
}

std::string render_report(const PatientInfo& patient, const ReportContent& content) {
    std::vector<std::string> header{
        "HemoVita – Personalized Micronutrient Report",
        "===========================================",
        "",
        "Patient summary:",
        "- Age: " + (patient.age.has_value() ? std::to_string(*patient.age) : std::string("N/A")),
        "- Sex: " + or_na(patient.sex),
        "- Pregnant: " + (patient.pregnant.has_value() ? std::string(*patient.pregnant ? "True" : "False") : std::string("N/A")),
        "- Country: " + or_na(patient.country),
    };
    if (!patient.notes.empty()) {
        header.push_back("- Notes: " + patient.notes);
    }

    const std::string labs_block = format_lab_block(content.labs, content.labels);

    const std::vector<std::string> parts{
        join_lines(header),
        "",
        "1. Lab overview",
        "---------------",
        labs_block.empty() ? std::string("No labs provided.") : labs_block,
        "",
        "2. Supplement plan (prototype)",
        "------------------------------",
        format_supplement_block(content.plan),
        "",
        "3. Food suggestions (per 100 g, highest nutrient density first)",
        "----------------------------------------------------------------",
        format_food_block(content.foods),
        "",
        "4. Notes on cutoffs",
        "--------------------",
        "All low/normal/high classifications are derived from a unified cutoff table ",
        "(`micronutrient_cutoffs_structured.csv`) built from WHO guidelines, IZiNCG ",
        "zinc thresholds, and widely used clinical consensus cutoffs. This table can ",
        "be updated independently of the code to reflect new evidence.",
        "",
        "5. Network-based nutrient interactions",
        "--------------------------------------",
        format_network_block(content.explanations),
    };
    return join_lines(parts);
}

}  // namespace hemovita
