#pragma once

#include "hemovita/alias_table.hpp"
#include "hemovita/nutrient_types.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace hemovita {

using AntagonistSets = std::map<std::string, std::set<std::string>>;

struct InteractionRules {
    std::vector<BoosterBundle> boosters;  // first-seen target order
    AntagonistSets antagonists;           // symmetric

    [[nodiscard]] const BoosterBundle* bundle_for(const std::string& target) const noexcept;

    // True when either key lists the other as an antagonist.
    [[nodiscard]] bool conflicts(const std::string& a, const std::string& b) const noexcept;

    void add_antagonists(const std::string& a, const std::string& b);
};

class RuleDeriver {
public:
    explicit RuleDeriver(std::shared_ptr<const AliasTable> aliases);

    [[nodiscard]] InteractionRules derive(const std::vector<RelationshipSpec>& edges) const;

private:
    std::shared_ptr<const AliasTable> aliases_;
};

}  // namespace hemovita
