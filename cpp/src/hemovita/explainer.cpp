#include "hemovita/explainer.hpp"

#include <set>
#include <unordered_set>

namespace hemovita {

namespace {

// Walks predecessors of `node`; `chain` holds the hops found so far, nearest
// to the target first.
void collect_paths(const InteractionGraph& graph,
                   const std::string& node,
                   std::size_t max_hops,
                   std::vector<const RelationshipSpec*>& chain,
                   std::unordered_set<std::string>& on_path,
                   std::set<std::string>& rendered) {
    for (const RelationshipSpec* edge : graph.incoming(node)) {
        if (on_path.contains(edge->source)) {
            continue;
        }
        chain.push_back(edge);
        on_path.insert(edge->source);

        std::vector<const RelationshipSpec*> hops(chain.rbegin(), chain.rend());
        rendered.insert(render_path(hops));
        if (chain.size() < max_hops) {
            collect_paths(graph, edge->source, max_hops, chain, on_path, rendered);
        }

        on_path.erase(edge->source);
        chain.pop_back();
    }
}

}  // namespace

Explainer::Explainer(std::shared_ptr<const InteractionGraph> graph)
    : graph_(std::move(graph)) {}

std::vector<TargetExplanation> Explainer::explain(const LabelSet& labels, std::size_t max_hops) const {
    std::vector<TargetExplanation> out;
    if (!available()) {
        return out;
    }
    std::unordered_set<std::string> done;
    for (const auto& entry : labels) {
        if (entry.label != Label::Low || !graph_->has_node(entry.marker)) {
            continue;
        }
        if (!done.insert(entry.marker).second) {
            continue;
        }
        auto paths = paths_to(entry.marker, max_hops);
        if (!paths.empty()) {
            out.push_back(TargetExplanation{entry.marker, std::move(paths)});
        }
    }
    return out;
}

std::vector<std::string> Explainer::paths_to(const std::string& target, std::size_t max_hops) const {
    if (!available() || max_hops == 0 || !graph_->has_node(target)) {
        return {};
    }
    std::set<std::string> rendered;
    std::vector<const RelationshipSpec*> chain;
    std::unordered_set<std::string> on_path{target};
    collect_paths(*graph_, target, max_hops, chain, on_path, rendered);
    return {rendered.begin(), rendered.end()};
}

bool Explainer::available() const noexcept {
    return graph_ != nullptr && !graph_->empty();
}

std::string render_path(const std::vector<const RelationshipSpec*>& hops) {
    if (hops.empty()) {
        return {};
    }
    std::string out = hops.front()->source;
    for (const RelationshipSpec* hop : hops) {
        out += " —";
        out += hop->effect_text;
        out += "→ ";
        out += hop->target;
    }
    return out;
}

}  // namespace hemovita
