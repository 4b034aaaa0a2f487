#pragma once

#include "hemovita/alias_table.hpp"
#include "hemovita/interaction_graph.hpp"
#include "hemovita/nutrient_types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hemovita {

// Sentences explaining a supplement plan from the interaction network: why
// boosters share a slot with their target and why antagonists were split.
class PlanNotes {
public:
    // A null graph means the relationships file was never loaded.
    PlanNotes(std::shared_ptr<const AliasTable> aliases, std::shared_ptr<const InteractionGraph> graph);

    [[nodiscard]] std::vector<std::string> notes_for(const SupplementPlan& plan) const;

private:
    std::shared_ptr<const AliasTable> aliases_;
    std::shared_ptr<const InteractionGraph> graph_;
};

}  // namespace hemovita
