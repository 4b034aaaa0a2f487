#pragma once

#include "hemovita/nutrient_types.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace hemovita {

// Directed nutrient interaction network. Nodes keep insertion order; a second
// edge between the same ordered pair replaces the attributes of the first.
class InteractionGraph {
public:
    InteractionGraph() = default;

    explicit InteractionGraph(const std::vector<RelationshipSpec>& relationships);

    void add_node(std::string name);

    void add_edge(RelationshipSpec relationship);

    [[nodiscard]] bool has_node(const std::string& name) const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] const std::vector<std::string>& nodes() const noexcept;

    [[nodiscard]] const std::vector<RelationshipSpec>& edges() const noexcept;

    // Edges whose target is `name`, in insertion order.
    [[nodiscard]] std::vector<const RelationshipSpec*> incoming(const std::string& name) const;

    [[nodiscard]] std::vector<const RelationshipSpec*> outgoing(const std::string& name) const;

    [[nodiscard]] const RelationshipSpec* find_edge(const std::string& source, const std::string& target) const noexcept;

private:
    std::vector<std::string> nodes_;
    std::unordered_map<std::string, std::size_t> node_index_;
    std::vector<RelationshipSpec> edges_;
    std::unordered_map<std::string, std::size_t> edge_index_;
    std::vector<std::vector<std::size_t>> incoming_;
    std::vector<std::vector<std::size_t>> outgoing_;
};

}  // namespace hemovita
