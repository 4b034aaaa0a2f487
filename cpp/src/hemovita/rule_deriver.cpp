#include "hemovita/rule_deriver.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace hemovita {

const BoosterBundle* InteractionRules::bundle_for(const std::string& target) const noexcept {
    auto it = std::find_if(boosters.begin(), boosters.end(), [&](const BoosterBundle& bundle) { return bundle.target == target; });
    return it == boosters.end() ? nullptr : &*it;
}

bool InteractionRules::conflicts(const std::string& a, const std::string& b) const noexcept {
    auto lhs = antagonists.find(a);
    if (lhs != antagonists.end() && lhs->second.contains(b)) {
        return true;
    }
    auto rhs = antagonists.find(b);
    return rhs != antagonists.end() && rhs->second.contains(a);
}

void InteractionRules::add_antagonists(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) {
        throw std::invalid_argument("antagonist keys must be non-empty");
    }
    if (a == b) {
        return;
    }
    antagonists[a].insert(b);
    antagonists[b].insert(a);
}

RuleDeriver::RuleDeriver(std::shared_ptr<const AliasTable> aliases)
    : aliases_(std::move(aliases)) {
    if (!aliases_) {
        throw std::invalid_argument("rule deriver requires an alias table");
    }
}

InteractionRules RuleDeriver::derive(const std::vector<RelationshipSpec>& edges) const {
    InteractionRules rules;

    for (const auto& edge : edges) {
        if (edge.effect != EdgeEffect::Boosts) {
            continue;
        }
        const std::string target_key = aliases_->canonical(edge.target);
        const std::string source_key = aliases_->canonical(edge.source);
        if (target_key.empty() || source_key.empty() || target_key == source_key) {
            continue;
        }
        auto it = std::find_if(rules.boosters.begin(), rules.boosters.end(),
                               [&](const BoosterBundle& bundle) { return bundle.target == target_key; });
        if (it == rules.boosters.end()) {
            rules.boosters.push_back(BoosterBundle{target_key, {}});
            it = std::prev(rules.boosters.end());
        }
        if (std::find(it->boosters.begin(), it->boosters.end(), source_key) == it->boosters.end()) {
            it->boosters.push_back(source_key);
        }
    }

    for (const auto& edge : edges) {
        if (edge.effect != EdgeEffect::Inhibits) {
            continue;
        }
        const std::string a = aliases_->canonical(edge.source);
        const std::string b = aliases_->canonical(edge.target);
        if (a.empty() || b.empty() || a == b) {
            continue;
        }
        rules.add_antagonists(a, b);
    }

    return rules;
}

}  // namespace hemovita
