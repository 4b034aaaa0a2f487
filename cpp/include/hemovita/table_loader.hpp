#pragma once

#include "hemovita/alias_table.hpp"
#include "hemovita/nutrient_types.hpp"

#include <istream>
#include <string>
#include <vector>

namespace hemovita {

// CSV readers for the reference tables. Every table has a header row; cells are
// trimmed. The read_* overloads parse an already opened stream, the load_*
// overloads open a file and throw std::runtime_error when it does not exist.
// Missing required columns and malformed numbers throw std::invalid_argument.

// micronutrient, biomarker, population_group, unit, cutoff_type, cutoff_value [, role]
[[nodiscard]] std::vector<CutoffRow> read_cutoff_table(std::istream& input);
[[nodiscard]] std::vector<CutoffRow> load_cutoff_table(const std::string& path);

// source, target, effect [, confidence, notes]
[[nodiscard]] std::vector<RelationshipSpec> read_relationship_table(std::istream& input);
[[nodiscard]] std::vector<RelationshipSpec> load_relationship_table(const std::string& path);

// Country, Population, Gender, Micronutrient [, Age], True_Risk | P_Deficiency_Primary
[[nodiscard]] std::vector<RiskObservation> read_risk_observations(std::istream& input);
[[nodiscard]] std::vector<RiskObservation> load_risk_observations(const std::string& path);

// Food, Category, Bundle [, Typical_serve_g, Diet_tag]
[[nodiscard]] std::vector<FoodItem> read_food_table(std::istream& input);
[[nodiscard]] std::vector<FoodItem> load_food_table(const std::string& path);

// alias, key
[[nodiscard]] AliasTable read_alias_table(std::istream& input);
[[nodiscard]] AliasTable load_alias_table(const std::string& path);

// marker, micronutrient, biomarker [, population_group, unit, low_tier, high_tier]
[[nodiscard]] std::vector<MarkerSpec> read_marker_specs(std::istream& input);
[[nodiscard]] std::vector<MarkerSpec> load_marker_specs(const std::string& path);

}  // namespace hemovita
