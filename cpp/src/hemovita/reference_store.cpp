#include "hemovita/reference_store.hpp"

#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace hemovita {

namespace {

constexpr std::size_t kUnranked = std::numeric_limits<std::size_t>::max();

[[nodiscard]] bool row_matches(const MarkerSpec& spec, const CutoffRow& row) {
    if (row.micronutrient != spec.micronutrient || row.biomarker != spec.biomarker) {
        return false;
    }
    if (!spec.population_group.empty() && row.population_group != spec.population_group) {
        return false;
    }
    if (!spec.unit.empty() && row.unit != spec.unit) {
        return false;
    }
    return true;
}

[[nodiscard]] std::optional<double> resolve_bound(const std::vector<TierCutoff>& tiers,
                                                  const std::string& explicit_name,
                                                  TierRole role) {
    if (!explicit_name.empty()) {
        for (const auto& tier : tiers) {
            if (tier.name == explicit_name) {
                return tier.value;
            }
        }
    }
    const TierCutoff* best = nullptr;
    for (const auto& tier : tiers) {
        if (tier.role != role) {
            continue;
        }
        if (best == nullptr || tier.priority < best->priority) {
            best = &tier;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return best->value;
}

}  // namespace

TierRoleCatalog::TierRoleCatalog(std::vector<std::string> low_indicators, std::vector<std::string> high_indicators)
    : low_(std::move(low_indicators)), high_(std::move(high_indicators)) {
    for (std::size_t i = 0; i < low_.size(); ++i) {
        if (!index_.emplace(low_[i], std::make_pair(TierRole::LowIndicator, i)).second) {
            throw std::invalid_argument("tier name declared twice in role catalog: " + low_[i]);
        }
    }
    for (std::size_t i = 0; i < high_.size(); ++i) {
        if (!index_.emplace(high_[i], std::make_pair(TierRole::HighIndicator, i)).second) {
            throw std::invalid_argument("tier name declared twice in role catalog: " + high_[i]);
        }
    }
}

TierRole TierRoleCatalog::role_of(const std::string& tier_name) const noexcept {
    auto it = index_.find(tier_name);
    return it == index_.end() ? TierRole::Neutral : it->second.first;
}

std::size_t TierRoleCatalog::rank_of(const std::string& tier_name) const noexcept {
    auto it = index_.find(tier_name);
    return it == index_.end() ? kUnranked : it->second.second;
}

const std::vector<std::string>& TierRoleCatalog::low_indicators() const noexcept {
    return low_;
}

const std::vector<std::string>& TierRoleCatalog::high_indicators() const noexcept {
    return high_;
}

std::size_t TierRoleCatalog::size() const noexcept {
    return index_.size();
}

TierRoleCatalog TierRoleCatalog::defaults() {
    return TierRoleCatalog(
        {"deficiency", "anemia", "microcytosis", "ntd_insufficient", "insufficiency", "low",
         "moderate_deficiency", "severe_deficiency", "mild_anemia", "moderate_anemia", "severe_anemia"},
        {"high", "high_mild", "elevated", "macrocytosis", "high_moderate", "high_severe"});
}

ReferenceStore::ReferenceStore(const std::vector<MarkerSpec>& specs,
                               const std::vector<CutoffRow>& cutoffs,
                               const TierRoleCatalog& catalog) {
    for (const auto& spec : specs) {
        add_marker(spec, cutoffs, catalog);
    }
}

void ReferenceStore::add_marker(const MarkerSpec& spec, const std::vector<CutoffRow>& cutoffs, const TierRoleCatalog& catalog) {
    if (spec.marker.empty()) {
        throw std::invalid_argument("marker name must be non-empty");
    }
    if (spec.micronutrient.empty() || spec.biomarker.empty()) {
        throw std::invalid_argument("marker requires micronutrient and biomarker: " + spec.marker);
    }
    if (specs_.contains(spec.marker)) {
        throw std::invalid_argument("duplicate marker spec: " + spec.marker);
    }

    std::vector<TierCutoff> tiers;
    std::unordered_set<std::string> seen;
    std::size_t row_index = 0;
    for (const auto& row : cutoffs) {
        ++row_index;
        if (!row_matches(spec, row)) {
            continue;
        }
        if (!seen.insert(row.cutoff_type).second) {
            throw std::invalid_argument("duplicate cutoff tier '" + row.cutoff_type + "' for marker " + spec.marker);
        }
        TierCutoff tier{row.cutoff_type, row.cutoff_value, catalog.role_of(row.cutoff_type), catalog.rank_of(row.cutoff_type)};
        if (row.role.has_value()) {
            tier.role = *row.role;
            // Tiers tagged by the table rank after every catalog entry, in row order.
            tier.priority = catalog.rank_of(row.cutoff_type) != kUnranked && catalog.role_of(row.cutoff_type) == *row.role
                                ? catalog.rank_of(row.cutoff_type)
                                : catalog.size() + row_index;
        }
        tiers.push_back(std::move(tier));
    }

    markers_.push_back(spec.marker);
    specs_.emplace(spec.marker, spec);
    if (tiers.empty()) {
        return;
    }

    ReferenceRange range;
    range.low = resolve_bound(tiers, spec.low_tier, TierRole::LowIndicator);
    range.high = resolve_bound(tiers, spec.high_tier, TierRole::HighIndicator);
    tiers_.emplace(spec.marker, std::move(tiers));
    if (range.low.has_value() || range.high.has_value()) {
        ranges_.emplace(spec.marker, range);
    }
}

const MarkerSpec* ReferenceStore::spec(const std::string& marker) const noexcept {
    auto it = specs_.find(marker);
    return it == specs_.end() ? nullptr : &it->second;
}

const std::vector<TierCutoff>* ReferenceStore::tiers(const std::string& marker) const noexcept {
    auto it = tiers_.find(marker);
    return it == tiers_.end() ? nullptr : &it->second;
}

std::optional<ReferenceRange> ReferenceStore::range(const std::string& marker) const {
    auto it = ranges_.find(marker);
    if (it == ranges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::vector<std::string>& ReferenceStore::markers() const noexcept {
    return markers_;
}

std::size_t ReferenceStore::resolved_count() const noexcept {
    return ranges_.size();
}

std::vector<MarkerSpec> default_marker_specs() {
    return {
        // anemia & RBC indices
        {"Hemoglobin", "iron_related_anemia", "hemoglobin", "nonpregnant_women", "g/dL", "anemia", ""},
        {"MCV", "iron_related_anemia", "MCV", "adults", "fL", "microcytosis", "macrocytosis"},
        // iron status
        {"ferritin", "iron", "serum_ferritin", "nonpregnant_adults", "µg/L", "deficiency", ""},
        // B12 / folate
        {"vitamin_B12", "vitamin_B12", "serum_B12", "adults", "pg/mL", "deficiency", ""},
        {"folate_plasma", "folate", "plasma_or_serum_folate", "adults", "nmol/L", "deficiency", ""},
        // fat-soluble vitamins
        {"vitamin_D", "vitamin_D", "serum_25OHD", "general", "nmol/L", "deficiency", ""},
        {"vitamin_A", "vitamin_A", "serum_retinol", "children_and_adults_nonpregnant", "µmol/L", "deficiency", ""},
        {"vitamin_E", "vitamin_E", "plasma_alpha_tocopherol", "adults", "µmol/L", "deficiency", ""},
        // water-soluble vitamins
        {"vitamin_C", "vitamin_C", "plasma_vitamin_C", "adults", "µmol/L", "deficiency", ""},
        {"vitamin_B6", "vitamin_B6", "plasma_PLP", "adults", "nmol/L", "deficiency", ""},
        // minerals
        {"magnesium", "magnesium", "serum_magnesium", "adults", "mmol/L", "deficiency", ""},
        {"calcium", "calcium", "serum_total_calcium", "adults", "mmol/L", "low", ""},
        {"zinc", "zinc", "plasma_or_serum_zinc", "females_over_10", "µg/dL", "deficiency", ""},
        // functional B12/folate marker, >15 µmol/L
        {"homocysteine", "homocysteine_related", "plasma_homocysteine", "adults", "µmol/L", "", "high_mild"},
    };
}

}  // namespace hemovita
