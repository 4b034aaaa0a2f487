#include "hemovita/interaction_graph.hpp"

#include "hemovita/string_utils.hpp"

#include <stdexcept>

namespace hemovita {

namespace {
[[nodiscard]] std::string edge_key(const std::string& source, const std::string& target) {
    std::string key;
    key.reserve(source.size() + target.size() + 1);
    key.append(source);
    key.push_back('\x1f');
    key.append(target);
    return key;
}
}  // namespace

InteractionGraph::InteractionGraph(const std::vector<RelationshipSpec>& relationships) {
    for (const auto& relationship : relationships) {
        add_edge(relationship);
    }
}

void InteractionGraph::add_node(std::string name) {
    name = trim(name);
    if (name.empty()) {
        throw std::invalid_argument("graph node name must be non-empty");
    }
    if (node_index_.contains(name)) {
        return;
    }
    node_index_.emplace(name, nodes_.size());
    nodes_.push_back(std::move(name));
    incoming_.emplace_back();
    outgoing_.emplace_back();
}

void InteractionGraph::add_edge(RelationshipSpec relationship) {
    relationship.source = trim(relationship.source);
    relationship.target = trim(relationship.target);
    if (relationship.source.empty() || relationship.target.empty()) {
        throw std::invalid_argument("edge endpoints must be non-empty");
    }
    add_node(relationship.source);
    add_node(relationship.target);

    const std::string key = edge_key(relationship.source, relationship.target);
    auto it = edge_index_.find(key);
    if (it != edge_index_.end()) {
        edges_[it->second] = std::move(relationship);
        return;
    }

    const std::size_t idx = edges_.size();
    outgoing_[node_index_.at(relationship.source)].push_back(idx);
    incoming_[node_index_.at(relationship.target)].push_back(idx);
    edge_index_.emplace(key, idx);
    edges_.push_back(std::move(relationship));
}

bool InteractionGraph::has_node(const std::string& name) const noexcept {
    return node_index_.contains(name);
}

bool InteractionGraph::empty() const noexcept {
    return nodes_.empty();
}

const std::vector<std::string>& InteractionGraph::nodes() const noexcept {
    return nodes_;
}

const std::vector<RelationshipSpec>& InteractionGraph::edges() const noexcept {
    return edges_;
}

std::vector<const RelationshipSpec*> InteractionGraph::incoming(const std::string& name) const {
    std::vector<const RelationshipSpec*> out;
    auto it = node_index_.find(name);
    if (it == node_index_.end()) {
        return out;
    }
    for (std::size_t idx : incoming_[it->second]) {
        out.push_back(&edges_[idx]);
    }
    return out;
}

std::vector<const RelationshipSpec*> InteractionGraph::outgoing(const std::string& name) const {
    std::vector<const RelationshipSpec*> out;
    auto it = node_index_.find(name);
    if (it == node_index_.end()) {
        return out;
    }
    for (std::size_t idx : outgoing_[it->second]) {
        out.push_back(&edges_[idx]);
    }
    return out;
}

const RelationshipSpec* InteractionGraph::find_edge(const std::string& source, const std::string& target) const noexcept {
    auto it = edge_index_.find(edge_key(source, target));
    return it == edge_index_.end() ? nullptr : &edges_[it->second];
}

}  // namespace hemovita
