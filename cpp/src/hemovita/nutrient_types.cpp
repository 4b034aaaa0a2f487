#include "hemovita/nutrient_types.hpp"

#include "hemovita/string_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace hemovita {

std::string_view to_string(Label label) noexcept {
    switch (label) {
        case Label::Low:
            return "low";
        case Label::Normal:
            return "normal";
        case Label::High:
            return "high";
        case Label::Unknown:
            break;
    }
    return "unknown";
}

std::string_view to_string(TierRole role) noexcept {
    switch (role) {
        case TierRole::LowIndicator:
            return "low";
        case TierRole::HighIndicator:
            return "high";
        case TierRole::Neutral:
            break;
    }
    return "neutral";
}

std::string_view to_string(EdgeEffect effect) noexcept {
    switch (effect) {
        case EdgeEffect::Boosts:
            return "boosts";
        case EdgeEffect::Inhibits:
            return "inhibits";
        case EdgeEffect::Other:
            break;
    }
    return "other";
}

std::string_view to_string(Slot slot) noexcept {
    switch (slot) {
        case Slot::Morning:
            return "morning";
        case Slot::Midday:
            return "midday";
        case Slot::Evening:
            break;
    }
    return "evening";
}

EdgeEffect parse_edge_effect(std::string_view text) {
    const std::string norm = to_lower(trim(text));
    if (norm == "boosts") {
        return EdgeEffect::Boosts;
    }
    if (norm == "inhibits") {
        return EdgeEffect::Inhibits;
    }
    return EdgeEffect::Other;
}

std::optional<TierRole> parse_tier_role(std::string_view text) {
    const std::string norm = to_lower(trim(text));
    if (norm.empty()) {
        return std::nullopt;
    }
    if (norm == "low" || norm == "low_indicator") {
        return TierRole::LowIndicator;
    }
    if (norm == "high" || norm == "high_indicator") {
        return TierRole::HighIndicator;
    }
    if (norm == "neutral") {
        return TierRole::Neutral;
    }
    throw std::invalid_argument("unknown tier role: " + std::string(text));
}

bool SupplementPlan::empty() const noexcept {
    return std::all_of(slots.begin(), slots.end(), [](const auto& slot) { return slot.empty(); });
}

bool SupplementPlan::contains(const std::string& key) const noexcept {
    return std::any_of(slots.begin(), slots.end(), [&](const auto& slot) {
        return std::find(slot.begin(), slot.end(), key) != slot.end();
    });
}

Label find_label(const LabelSet& labels, const std::string& marker) noexcept {
    auto it = std::find_if(labels.begin(), labels.end(), [&](const MarkerLabel& entry) { return entry.marker == marker; });
    return it == labels.end() ? Label::Unknown : it->label;
}

}  // namespace hemovita
