#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hemovita {

enum class Label {
    Low,
    Normal,
    High,
    Unknown
};

enum class TierRole {
    LowIndicator,
    HighIndicator,
    Neutral
};

enum class EdgeEffect {
    Boosts,
    Inhibits,
    Other
};

enum class Slot {
    Morning = 0,
    Midday = 1,
    Evening = 2
};

inline constexpr std::size_t kSlotCount = 3;

inline constexpr std::array<Slot, kSlotCount> kSlots{Slot::Morning, Slot::Midday, Slot::Evening};

[[nodiscard]] std::string_view to_string(Label label) noexcept;

[[nodiscard]] std::string_view to_string(TierRole role) noexcept;

[[nodiscard]] std::string_view to_string(EdgeEffect effect) noexcept;

[[nodiscard]] std::string_view to_string(Slot slot) noexcept;

[[nodiscard]] EdgeEffect parse_edge_effect(std::string_view text);

[[nodiscard]] std::optional<TierRole> parse_tier_role(std::string_view text);

struct MarkerSpec {
    std::string marker;
    std::string micronutrient;
    std::string biomarker;
    std::string population_group;  // empty = any population
    std::string unit;              // empty = any unit
    std::string low_tier;          // explicit low tier name, empty if none
    std::string high_tier;         // explicit high tier name, empty if none
};

struct CutoffRow {
    std::string micronutrient;
    std::string biomarker;
    std::string population_group;
    std::string unit;
    std::string cutoff_type;
    double cutoff_value{0.0};
    std::optional<TierRole> role;  // explicit role column, overrides the catalog
};

struct TierCutoff {
    std::string name;
    double value{0.0};
    TierRole role{TierRole::Neutral};
    std::size_t priority{0};  // rank inside its role, lower wins
};

struct ReferenceRange {
    std::optional<double> low;
    std::optional<double> high;
};

struct LabValue {
    std::string marker;
    std::optional<double> value;
};

struct MarkerLabel {
    std::string marker;
    Label label{Label::Unknown};
};

using LabPanel = std::vector<LabValue>;

using LabelSet = std::vector<MarkerLabel>;

struct RelationshipSpec {
    std::string source;
    std::string target;
    EdgeEffect effect{EdgeEffect::Other};
    std::string effect_text;  // verbatim effect column
    std::string confidence;
    std::string notes;
};

struct BoosterBundle {
    std::string target;
    std::vector<std::string> boosters;
};

struct SupplementPlan {
    std::array<std::vector<std::string>, kSlotCount> slots;
    std::vector<std::string> forced;  // keys placed in the last slot despite a conflict

    [[nodiscard]] const std::vector<std::string>& at(Slot slot) const noexcept {
        return slots[static_cast<std::size_t>(slot)];
    }

    [[nodiscard]] std::vector<std::string>& at(Slot slot) noexcept {
        return slots[static_cast<std::size_t>(slot)];
    }

    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] bool contains(const std::string& key) const noexcept;
};

struct TargetExplanation {
    std::string target;
    std::vector<std::string> paths;
};

struct FoodItem {
    std::string name;
    std::string category;
    std::string bundle;
    std::optional<double> serving_g;
    std::string diet_tag;
};

struct FoodSuggestion {
    std::string bundle;
    std::vector<FoodItem> foods;
};

struct RiskObservation {
    std::string country;
    std::string population;
    std::string gender;
    std::string micronutrient;
    std::optional<double> age;
    double true_risk{0.0};
};

struct RiskEstimate {
    std::string micronutrient;
    double risk{0.0};

    bool operator==(const RiskEstimate&) const = default;
};

[[nodiscard]] Label find_label(const LabelSet& labels, const std::string& marker) noexcept;

}  // namespace hemovita
