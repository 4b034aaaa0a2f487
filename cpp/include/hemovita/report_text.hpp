#pragma once

#include "hemovita/nutrient_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hemovita {

inline constexpr std::size_t kReportChainsPerTarget = 3;

struct PatientInfo {
    std::optional<int> age;
    std::string sex;
    std::optional<bool> pregnant;
    std::string country;
    std::string notes;
    std::string population;  // explicit risk-model population, empty to derive from sex
};

// Everything the narrative needs, already computed by the engine.
struct ReportContent {
    LabPanel labs;
    LabelSet labels;
    SupplementPlan plan;
    std::vector<FoodSuggestion> foods;
    std::optional<std::vector<TargetExplanation>> explanations;  // nullopt: no network loaded
};

[[nodiscard]] std::string format_lab_block(const LabPanel& labs, const LabelSet& labels);

[[nodiscard]] std::string format_supplement_block(const SupplementPlan& plan);

[[nodiscard]] std::string format_food_block(const std::vector<FoodSuggestion>& foods);

[[nodiscard]] std::string format_network_block(const std::optional<std::vector<TargetExplanation>>& explanations,
                                               std::size_t chains_per_target = kReportChainsPerTarget);

// Plain-text report: patient summary, labs, plan, foods, cutoff notes and network chains.
[[nodiscard]] std::string render_report(const PatientInfo& patient, const ReportContent& content);

}  // namespace hemovita
