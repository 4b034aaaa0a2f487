#pragma once

#include "hemovita/nutrient_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hemovita {

// Declares which cutoff tier names indicate a low or a high value, in priority
// order. Tier names missing from both lists are neutral.
class TierRoleCatalog {
public:
    TierRoleCatalog() = default;

    TierRoleCatalog(std::vector<std::string> low_indicators, std::vector<std::string> high_indicators);

    [[nodiscard]] TierRole role_of(const std::string& tier_name) const noexcept;

    [[nodiscard]] std::size_t rank_of(const std::string& tier_name) const noexcept;

    [[nodiscard]] const std::vector<std::string>& low_indicators() const noexcept;

    [[nodiscard]] const std::vector<std::string>& high_indicators() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] static TierRoleCatalog defaults();

private:
    std::vector<std::string> low_;
    std::vector<std::string> high_;
    std::unordered_map<std::string, std::pair<TierRole, std::size_t>> index_;
};

class ReferenceStore {
public:
    ReferenceStore() = default;

    ReferenceStore(const std::vector<MarkerSpec>& specs,
                   const std::vector<CutoffRow>& cutoffs,
                   const TierRoleCatalog& catalog = TierRoleCatalog::defaults());

    [[nodiscard]] const MarkerSpec* spec(const std::string& marker) const noexcept;

    [[nodiscard]] const std::vector<TierCutoff>* tiers(const std::string& marker) const noexcept;

    [[nodiscard]] std::optional<ReferenceRange> range(const std::string& marker) const;

    [[nodiscard]] const std::vector<std::string>& markers() const noexcept;

    [[nodiscard]] std::size_t resolved_count() const noexcept;

private:
    void add_marker(const MarkerSpec& spec, const std::vector<CutoffRow>& cutoffs, const TierRoleCatalog& catalog);

    std::vector<std::string> markers_;
    std::unordered_map<std::string, MarkerSpec> specs_;
    std::unordered_map<std::string, std::vector<TierCutoff>> tiers_;
    std::unordered_map<std::string, ReferenceRange> ranges_;
};

[[nodiscard]] std::vector<MarkerSpec> default_marker_specs();

}  // namespace hemovita
