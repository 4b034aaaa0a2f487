#pragma once

#include "hemovita/nutrient_types.hpp"

#include <compare>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace hemovita {

inline constexpr double kDefaultRiskAge = 15.0;

struct RiskContext {
    std::string country;
    std::string population;
    std::string gender;
    double age{kDefaultRiskAge};

    auto operator<=>(const RiskContext&) const = default;
};

// Historical deficiency probabilities aggregated by (context, micronutrient).
//
// Rows are normalised on construction: categorical fields are trimmed, rows
// without a risk value are dropped, risks are divided by 100 when the table is
// expressed in percent, and a missing or non-finite age is replaced by
// `default_age`.
class RiskTable {
public:
    explicit RiskTable(const std::vector<RiskObservation>& observations, double default_age = kDefaultRiskAge);

    [[nodiscard]] const std::vector<RiskContext>& contexts() const noexcept;

    // Micronutrients observed for `context`, sorted.
    [[nodiscard]] const std::vector<std::string>& actions(const RiskContext& context) const;

    [[nodiscard]] double true_risk(const RiskContext& context, const std::string& micronutrient) const;

    // Every micronutrient in the table, sorted.
    [[nodiscard]] const std::vector<std::string>& micronutrients() const noexcept;

    [[nodiscard]] const std::vector<std::string>& countries() const noexcept;

    [[nodiscard]] const std::vector<std::string>& populations() const noexcept;

    [[nodiscard]] const std::vector<std::string>& genders() const noexcept;

    // Mean risk per micronutrient over rows matching population and gender;
    // empty when nothing matches.
    [[nodiscard]] std::vector<RiskEstimate> population_baseline(const std::string& population,
                                                                const std::string& gender) const;

    [[nodiscard]] std::vector<RiskEstimate> global_baseline() const;

    [[nodiscard]] std::size_t row_count() const noexcept;

    [[nodiscard]] bool percent_scaled() const noexcept;

private:
    struct Mean {
        double sum{0.0};
        std::size_t count{0};

        void add(double value) {
            sum += value;
            ++count;
        }

        [[nodiscard]] double value() const { return count == 0 ? 0.0 : sum / static_cast<double>(count); }
    };

    std::vector<RiskContext> contexts_;
    std::map<RiskContext, std::vector<std::string>> actions_;
    std::map<std::pair<RiskContext, std::string>, double> risks_;
    std::vector<std::string> micronutrients_;
    std::vector<std::string> countries_;
    std::vector<std::string> populations_;
    std::vector<std::string> genders_;
    std::map<std::pair<std::string, std::string>, std::map<std::string, Mean>> population_means_;
    std::map<std::string, Mean> global_means_;
    std::size_t row_count_{0};
    bool percent_scaled_{false};
};

}  // namespace hemovita
