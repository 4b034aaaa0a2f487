#pragma once

#include "hemovita/alias_table.hpp"
#include "hemovita/nutrient_types.hpp"
#include "hemovita/rule_deriver.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hemovita {

struct ScheduleOptions {
    bool verbose{false};  // report forced placements on stderr
};

// Places supplements for low markers into the morning/midday/evening slots.
//
// Pass 1 puts every deficient supplement key into the first slot holding no
// antagonist of it; a key that fits nowhere is forced into the last slot and
// recorded in SupplementPlan::forced. Pass 2 adds the known boosters of each
// placed key to that key's slot when they do not conflict there.
class Scheduler {
public:
    Scheduler(std::shared_ptr<const AliasTable> aliases,
              std::shared_ptr<const InteractionRules> rules,
              ScheduleOptions options = {});

    [[nodiscard]] SupplementPlan schedule(const LabelSet& labels) const;

    [[nodiscard]] bool can_place(const SupplementPlan& plan, Slot slot, const std::string& key) const;

    [[nodiscard]] std::vector<std::string> deficient_keys(const LabelSet& labels) const;

private:
    std::shared_ptr<const AliasTable> aliases_;
    std::shared_ptr<const InteractionRules> rules_;
    ScheduleOptions options_;
};

}  // namespace hemovita
