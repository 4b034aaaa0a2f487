#include "hemovita/scheduler.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace hemovita {

namespace {
[[nodiscard]] bool slot_contains(const std::vector<std::string>& slot, const std::string& key) {
    return std::find(slot.begin(), slot.end(), key) != slot.end();
}
}  // namespace

Scheduler::Scheduler(std::shared_ptr<const AliasTable> aliases,
                     std::shared_ptr<const InteractionRules> rules,
                     ScheduleOptions options)
    : aliases_(std::move(aliases)), rules_(std::move(rules)), options_(options) {
    if (!aliases_) {
        throw std::invalid_argument("scheduler requires an alias table");
    }
    if (!rules_) {
        throw std::invalid_argument("scheduler requires interaction rules");
    }
}

std::vector<std::string> Scheduler::deficient_keys(const LabelSet& labels) const {
    std::vector<std::string> keys;
    for (const auto& entry : labels) {
        if (entry.label != Label::Low) {
            continue;
        }
        std::string key = aliases_->canonical(entry.marker);
        if (key.empty() || slot_contains(keys, key)) {
            continue;
        }
        keys.push_back(std::move(key));
    }
    return keys;
}

bool Scheduler::can_place(const SupplementPlan& plan, Slot slot, const std::string& key) const {
    for (const auto& already : plan.at(slot)) {
        // conflicts() checks both registrations; the derived sets are symmetric anyway
        if (rules_->conflicts(key, already)) {
            return false;
        }
    }
    return true;
}

SupplementPlan Scheduler::schedule(const LabelSet& labels) const {
    SupplementPlan plan;
    const auto deficient = deficient_keys(labels);

    for (const auto& key : deficient) {
        bool placed = false;
        for (Slot slot : kSlots) {
            if (can_place(plan, slot, key)) {
                plan.at(slot).push_back(key);
                placed = true;
                break;
            }
        }
        if (!placed) {
            plan.at(kSlots.back()).push_back(key);
            plan.forced.push_back(key);
            if (options_.verbose) {
                std::cerr << "Scheduler: no conflict-free slot for '" << key << "', forced into "
                          << to_string(kSlots.back()) << std::endl;
            }
        }
    }

    for (const auto& bundle : rules_->boosters) {
        if (!slot_contains(deficient, bundle.target)) {
            continue;
        }
        auto target_slot = std::find_if(kSlots.begin(), kSlots.end(),
                                        [&](Slot slot) { return slot_contains(plan.at(slot), bundle.target); });
        if (target_slot == kSlots.end()) {
            continue;
        }
        for (const auto& booster : bundle.boosters) {
            const std::string key = aliases_->canonical(booster);
            if (slot_contains(plan.at(*target_slot), key)) {
                continue;
            }
            if (can_place(plan, *target_slot, key)) {
                plan.at(*target_slot).push_back(key);
            }
        }
    }

    return plan;
}

}  // namespace hemovita
