#include "hemovita/food_advisor.hpp"

#include "hemovita/string_utils.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace hemovita {

std::vector<FoodTrigger> default_food_triggers() {
    return {
        {"Hemoglobin", "iron", Label::Low},
        {"MCV", "iron", Label::Low},
        {"ferritin", "iron", Label::Low},
        {"Serum ferritin", "iron", Label::Low},
        {"vitamin_B12", "vitamin_B12", Label::Low},
        {"folate_plasma", "folate", Label::Low},
        {"vitamin_D", "vitamin_D", Label::Low},
        {"vitamin_C", "vitamin_C", Label::Low},
        {"vitamin_E", "vitamin_E", Label::Low},
        {"vitamin_A", "vitamin_A", Label::Low},
        {"vitamin_B6", "vitamin_B6", Label::Low},
        {"magnesium", "magnesium", Label::Low},
        {"calcium", "calcium", Label::Low},
        {"zinc", "zinc", Label::Low},
        // elevated homocysteine points at B12
        {"homocysteine", "vitamin_B12", Label::High},
    };
}

FoodAdvisor::FoodAdvisor(std::vector<FoodItem> foods, std::vector<FoodTrigger> triggers)
    : foods_(std::move(foods)), triggers_(std::move(triggers)) {
    std::set<std::string> seen;
    for (const auto& trigger : triggers_) {
        if (trigger.marker.empty() || trigger.bundle.empty()) {
            throw std::invalid_argument("food trigger requires a marker and a bundle");
        }
        if (!seen.insert(trigger.marker).second) {
            throw std::invalid_argument("duplicate food trigger for marker: " + trigger.marker);
        }
    }
}

std::vector<std::string> FoodAdvisor::bundles_needed(const LabelSet& labels) const {
    std::vector<std::string> bundles;
    for (const auto& entry : labels) {
        auto trigger = std::find_if(triggers_.begin(), triggers_.end(),
                                    [&](const FoodTrigger& t) { return t.marker == entry.marker; });
        if (trigger == triggers_.end() || trigger->trigger != entry.label) {
            continue;
        }
        if (std::find(bundles.begin(), bundles.end(), trigger->bundle) == bundles.end()) {
            bundles.push_back(trigger->bundle);
        }
    }
    return bundles;
}

std::vector<FoodSuggestion> FoodAdvisor::suggest(const LabelSet& labels,
                                                 std::size_t top_n,
                                                 const std::string& diet_filter) const {
    std::vector<FoodSuggestion> out;
    const std::string diet = trim(diet_filter);
    for (const auto& bundle : bundles_needed(labels)) {
        FoodSuggestion suggestion{bundle, {}};
        std::set<std::string> names;
        for (const auto& food : foods_) {
            if (suggestion.foods.size() >= top_n) {
                break;
            }
            if (food.bundle != bundle) {
                continue;
            }
            if (!diet.empty() && !contains_ignore_case(food.diet_tag, diet)) {
                continue;
            }
            if (!names.insert(food.name).second) {
                continue;
            }
            suggestion.foods.push_back(food);
        }
        if (!suggestion.foods.empty()) {
            out.push_back(std::move(suggestion));
        }
    }
    return out;
}

bool FoodAdvisor::empty() const noexcept {
    return foods_.empty();
}

std::size_t FoodAdvisor::size() const noexcept {
    return foods_.size();
}

}  // namespace hemovita
