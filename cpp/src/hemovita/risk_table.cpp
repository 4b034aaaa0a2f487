#include "hemovita/risk_table.hpp"

#include "hemovita/string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace hemovita {

namespace {

struct NormalizedRow {
    RiskContext context;
    std::string micronutrient;
    double risk;
};

[[nodiscard]] std::vector<RiskEstimate> sorted_estimates(const std::map<std::string, double>& means) {
    std::vector<RiskEstimate> out;
    out.reserve(means.size());
    for (const auto& [micronutrient, risk] : means) {
        out.push_back(RiskEstimate{micronutrient, risk});
    }
    std::stable_sort(out.begin(), out.end(), [](const RiskEstimate& a, const RiskEstimate& b) { return a.risk > b.risk; });
    return out;
}

}  // namespace

RiskTable::RiskTable(const std::vector<RiskObservation>& observations, double default_age) {
    if (!std::isfinite(default_age)) {
        throw std::invalid_argument("default age must be finite");
    }

    std::vector<NormalizedRow> rows;
    rows.reserve(observations.size());
    double max_risk = 0.0;
    for (const auto& obs : observations) {
        if (std::isnan(obs.true_risk)) {
            continue;
        }
        if (obs.true_risk < 0.0) {
            throw std::invalid_argument("negative deficiency risk for " + obs.micronutrient);
        }
        NormalizedRow row;
        row.context.country = trim(obs.country);
        row.context.population = trim(obs.population);
        row.context.gender = trim(obs.gender);
        row.context.age = (obs.age.has_value() && std::isfinite(*obs.age)) ? *obs.age : default_age;
        row.micronutrient = trim(obs.micronutrient);
        row.risk = obs.true_risk;
        if (row.micronutrient.empty()) {
            throw std::invalid_argument("risk row without micronutrient");
        }
        max_risk = std::max(max_risk, row.risk);
        rows.push_back(std::move(row));
    }
    if (rows.empty()) {
        throw std::invalid_argument("risk table has no usable rows");
    }

    percent_scaled_ = max_risk > 1.0;
    if (percent_scaled_) {
        for (auto& row : rows) {
            row.risk /= 100.0;
        }
        if (max_risk > 100.0) {
            throw std::invalid_argument("deficiency risk exceeds 100 percent");
        }
    }

    std::map<RiskContext, std::map<std::string, Mean>> grouped;
    std::set<std::string> countries;
    std::set<std::string> populations;
    std::set<std::string> genders;
    std::set<std::string> micronutrients;
    for (const auto& row : rows) {
        grouped[row.context][row.micronutrient].add(row.risk);
        population_means_[{row.context.population, row.context.gender}][row.micronutrient].add(row.risk);
        global_means_[row.micronutrient].add(row.risk);
        countries.insert(row.context.country);
        populations.insert(row.context.population);
        genders.insert(row.context.gender);
        micronutrients.insert(row.micronutrient);
    }

    for (const auto& [context, per_action] : grouped) {
        contexts_.push_back(context);
        auto& available = actions_[context];
        for (const auto& [micronutrient, mean] : per_action) {
            available.push_back(micronutrient);
            risks_.emplace(std::make_pair(context, micronutrient), mean.value());
        }
    }
    countries_.assign(countries.begin(), countries.end());
    populations_.assign(populations.begin(), populations.end());
    genders_.assign(genders.begin(), genders.end());
    micronutrients_.assign(micronutrients.begin(), micronutrients.end());
    row_count_ = rows.size();
}

const std::vector<RiskContext>& RiskTable::contexts() const noexcept {
    return contexts_;
}

const std::vector<std::string>& RiskTable::actions(const RiskContext& context) const {
    auto it = actions_.find(context);
    if (it == actions_.end()) {
        throw std::out_of_range("context not present in risk table: " + context.country + "/" + context.population + "/" + context.gender);
    }
    return it->second;
}

double RiskTable::true_risk(const RiskContext& context, const std::string& micronutrient) const {
    auto it = risks_.find(std::make_pair(context, micronutrient));
    if (it == risks_.end()) {
        throw std::out_of_range("no risk recorded for " + micronutrient + " in context " + context.country);
    }
    return it->second;
}

const std::vector<std::string>& RiskTable::micronutrients() const noexcept {
    return micronutrients_;
}

const std::vector<std::string>& RiskTable::countries() const noexcept {
    return countries_;
}

const std::vector<std::string>& RiskTable::populations() const noexcept {
    return populations_;
}

const std::vector<std::string>& RiskTable::genders() const noexcept {
    return genders_;
}

std::vector<RiskEstimate> RiskTable::population_baseline(const std::string& population, const std::string& gender) const {
    auto it = population_means_.find({trim(population), trim(gender)});
    if (it == population_means_.end()) {
        return {};
    }
    std::map<std::string, double> means;
    for (const auto& [micronutrient, mean] : it->second) {
        means.emplace(micronutrient, mean.value());
    }
    return sorted_estimates(means);
}

std::vector<RiskEstimate> RiskTable::global_baseline() const {
    std::map<std::string, double> means;
    for (const auto& [micronutrient, mean] : global_means_) {
        means.emplace(micronutrient, mean.value());
    }
    return sorted_estimates(means);
}

std::size_t RiskTable::row_count() const noexcept {
    return row_count_;
}

bool RiskTable::percent_scaled() const noexcept {
    return percent_scaled_;
}

}  // namespace hemovita
