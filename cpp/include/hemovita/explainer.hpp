#pragma once

#include "hemovita/interaction_graph.hpp"
#include "hemovita/nutrient_types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace hemovita {

inline constexpr std::size_t kDefaultMaxHops = 2;

// Causal chains ending at low markers. For every low marker present in the
// graph, all simple paths of at most `max_hops` edges that end there are
// rendered as "a —boosts→ b —inhibits→ c", deduplicated and sorted.
class Explainer {
public:
    Explainer() = default;

    explicit Explainer(std::shared_ptr<const InteractionGraph> graph);

    [[nodiscard]] std::vector<TargetExplanation> explain(const LabelSet& labels,
                                                         std::size_t max_hops = kDefaultMaxHops) const;

    [[nodiscard]] std::vector<std::string> paths_to(const std::string& target,
                                                    std::size_t max_hops = kDefaultMaxHops) const;

    [[nodiscard]] bool available() const noexcept;

private:
    std::shared_ptr<const InteractionGraph> graph_;
};

[[nodiscard]] std::string render_path(const std::vector<const RelationshipSpec*>& hops);

}  // namespace hemovita
