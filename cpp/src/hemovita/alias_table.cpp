#include "hemovita/alias_table.hpp"

#include "hemovita/string_utils.hpp"

#include <stdexcept>

namespace hemovita {

void AliasTable::add_alias(std::string alias, std::string key) {
    alias = trim(alias);
    key = trim(key);
    if (alias.empty() || key.empty()) {
        throw std::invalid_argument("alias and supplement key must be non-empty");
    }
    auto existing = keys_.find(alias);
    if (existing != keys_.end()) {
        if (existing->second != key) {
            throw std::invalid_argument("alias registered with conflicting keys: " + alias);
        }
        return;
    }
    // Keys must be terminal so that canonical() is idempotent.
    auto chained = keys_.find(key);
    if (chained != keys_.end() && chained->second != key) {
        throw std::invalid_argument("supplement key is itself an alias: " + key);
    }
    for (const auto& [other_alias, other_key] : keys_) {
        if (other_key == alias && alias != key) {
            throw std::invalid_argument("alias is already used as a supplement key: " + alias);
        }
    }
    order_.push_back(alias);
    keys_.emplace(std::move(alias), std::move(key));
}

std::string AliasTable::canonical(std::string_view name) const {
    std::string cleaned = trim(name);
    auto it = keys_.find(cleaned);
    if (it == keys_.end()) {
        return cleaned;
    }
    return it->second;
}

bool AliasTable::contains(const std::string& alias) const noexcept {
    return keys_.contains(alias);
}

std::size_t AliasTable::size() const noexcept {
    return keys_.size();
}

std::vector<std::string> AliasTable::aliases_of(const std::string& key) const {
    std::vector<std::string> out;
    for (const auto& alias : order_) {
        if (keys_.at(alias) == key) {
            out.push_back(alias);
        }
    }
    return out;
}

AliasTable AliasTable::defaults() {
    AliasTable table;
    // anemia and iron-status markers / network constructs
    table.add_alias("Hemoglobin", "iron");
    table.add_alias("MCV", "iron");
    table.add_alias("ferritin", "iron");
    table.add_alias("Serum ferritin", "iron");
    table.add_alias("indicator_iron_serum", "iron");
    table.add_alias("total_iron_binding_capacity", "iron");
    table.add_alias("transferrin", "iron");
    table.add_alias("iron_deficiency_anemia", "iron");
    table.add_alias("folate_plasma", "folate");
    return table;
}

}  // namespace hemovita
