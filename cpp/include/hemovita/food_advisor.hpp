#pragma once

#include "hemovita/nutrient_types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace hemovita {

inline constexpr std::size_t kDefaultFoodsPerBundle = 5;

// A lab marker whose `trigger` label asks for foods from `bundle`.
struct FoodTrigger {
    std::string marker;
    std::string bundle;
    Label trigger{Label::Low};
};

[[nodiscard]] std::vector<FoodTrigger> default_food_triggers();

class FoodAdvisor {
public:
    FoodAdvisor() = default;

    explicit FoodAdvisor(std::vector<FoodItem> foods, std::vector<FoodTrigger> triggers = default_food_triggers());

    // Bundles in the order their first triggering marker appears in `labels`.
    // Each bundle holds at most `top_n` foods in table order, one row per food
    // name; a non-empty `diet_filter` keeps rows whose diet tag contains it,
    // ignoring case. Bundles left without foods are omitted.
    [[nodiscard]] std::vector<FoodSuggestion> suggest(const LabelSet& labels,
                                                      std::size_t top_n = kDefaultFoodsPerBundle,
                                                      const std::string& diet_filter = {}) const;

    [[nodiscard]] std::vector<std::string> bundles_needed(const LabelSet& labels) const;

    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    std::vector<FoodItem> foods_;
    std::vector<FoodTrigger> triggers_;
};

}  // namespace hemovita
