#include "hemovita/plan_notes.hpp"

#include "hemovita/display_names.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <tuple>

namespace hemovita {

namespace {

using SlotSet = std::set<std::string>;

[[nodiscard]] std::string evidence_suffix(const std::string& confidence) {
    return confidence.empty() ? std::string() : " (evidence: " + confidence + ")";
}

// Sentences are closed by the caller, so a trailing period in the notes is dropped.
[[nodiscard]] std::string snippet_or(const std::string& notes, std::string fallback) {
    std::string text = notes.empty() ? std::move(fallback) : notes;
    while (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

[[nodiscard]] std::pair<std::string, std::string> ordered_pair(const std::string& a, const std::string& b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

[[nodiscard]] bool disjoint(const SlotSet& a, const SlotSet& b) {
    for (const auto& slot : a) {
        if (b.contains(slot)) {
            return false;
        }
    }
    return true;
}

}  // namespace

PlanNotes::PlanNotes(std::shared_ptr<const AliasTable> aliases, std::shared_ptr<const InteractionGraph> graph)
    : aliases_(std::move(aliases)), graph_(std::move(graph)) {
    if (!aliases_) {
        throw std::invalid_argument("plan notes require an alias table");
    }
}

std::vector<std::string> PlanNotes::notes_for(const SupplementPlan& plan) const {
    if (!graph_) {
        return {"Supplement timing uses an internal nutrient interaction network, "
                "but the relationships file (network_relationships.csv) was not found."};
    }
    if (graph_->edges().empty()) {
        return {"Supplement timing uses an internal nutrient interaction network, "
                "but no relationships were found in network_relationships.csv."};
    }

    std::map<std::string, SlotSet> slots_of;
    for (Slot slot : kSlots) {
        for (const auto& key : plan.at(slot)) {
            if (!key.empty()) {
                slots_of[key].insert(std::string(to_string(slot)));
            }
        }
    }

    std::vector<std::string> notes;
    std::set<std::tuple<std::string, std::string, std::string>> seen_boosts;
    std::set<std::pair<std::string, std::string>> seen_inhibits;

    for (const auto& edge : graph_->edges()) {
        if (edge.effect != EdgeEffect::Boosts) {
            continue;
        }
        const std::string src = aliases_->canonical(edge.source);
        const std::string tgt = aliases_->canonical(edge.target);
        if (src == tgt || !slots_of.contains(src) || !slots_of.contains(tgt)) {
            continue;
        }
        for (Slot slot : kSlots) {
            const auto& keys = plan.at(slot);
            if (std::find(keys.begin(), keys.end(), src) == keys.end() ||
                std::find(keys.begin(), keys.end(), tgt) == keys.end()) {
                continue;
            }
            const std::string slot_name(to_string(slot));
            const auto pair = ordered_pair(src, tgt);
            if (!seen_boosts.emplace(slot_name, pair.first, pair.second).second) {
                continue;
            }
            const std::string pretty_src = pretty_nutrient(src);
            const std::string pretty_tgt = pretty_nutrient(tgt);
            const std::string snippet = snippet_or(edge.notes, pretty_src + " helps the effectiveness of " + pretty_tgt);
            notes.push_back(pretty_src + " and " + pretty_tgt + " are scheduled together in the " + slot_name +
                            " slot because " + snippet + evidence_suffix(edge.confidence) + ".");
        }
    }

    for (const auto& edge : graph_->edges()) {
        if (edge.effect != EdgeEffect::Inhibits) {
            continue;
        }
        const std::string src = aliases_->canonical(edge.source);
        const std::string tgt = aliases_->canonical(edge.target);
        auto src_slots = slots_of.find(src);
        auto tgt_slots = slots_of.find(tgt);
        if (src_slots == slots_of.end() || tgt_slots == slots_of.end()) {
            continue;
        }
        if (!disjoint(src_slots->second, tgt_slots->second)) {
            continue;
        }
        if (!seen_inhibits.insert(ordered_pair(src, tgt)).second) {
            continue;
        }
        const std::string pretty_src = pretty_nutrient(src);
        const std::string pretty_tgt = pretty_nutrient(tgt);
        const std::string snippet =
            snippet_or(edge.notes, pretty_tgt + " can reduce the absorption or effect of " + pretty_src + " when taken together");
        notes.push_back(pretty_src + " is kept in the " + slots_phrase(src_slots->second) + " slot and " + pretty_tgt +
                        " in the " + slots_phrase(tgt_slots->second) + " slot to avoid interaction: " + snippet +
                        evidence_suffix(edge.confidence) + ".");
    }

    if (notes.empty()) {
        notes.emplace_back(
            "Supplement timing groups compatible nutrients and separates antagonistic ones "
            "based on the nutrient interaction network (network_relationships.csv).");
    }
    return notes;
}

}  // namespace hemovita
