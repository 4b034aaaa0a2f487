#pragma once

#include "hemovita/alias_table.hpp"
#include "hemovita/bandit_risk_model.hpp"
#include "hemovita/classifier.hpp"
#include "hemovita/explainer.hpp"
#include "hemovita/food_advisor.hpp"
#include "hemovita/interaction_graph.hpp"
#include "hemovita/nutrient_types.hpp"
#include "hemovita/plan_notes.hpp"
#include "hemovita/reference_store.hpp"
#include "hemovita/report_text.hpp"
#include "hemovita/risk_table.hpp"
#include "hemovita/rule_deriver.hpp"
#include "hemovita/scheduler.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hemovita {

inline constexpr double kModerateRiskThreshold = 0.33;
inline constexpr double kHighRiskThreshold = 0.66;

struct EngineConfig {
    std::string data_dir{"data"};
    std::string cutoff_file{"micronutrient_cutoffs_structured.csv"};
    std::string relationship_file{"network_relationships.csv"};
    std::string risk_file{"micronutrient_data.csv"};
    std::string food_file{"foods_usda.csv"};
    std::string alias_file;   // empty: built-in alias table
    std::string marker_file;  // empty: built-in marker specs
    std::string risk_data_path;  // overrides data_dir/risk_file when set
    BanditOptions bandit{};
    ScheduleOptions schedule{};
    std::size_t max_hops{kDefaultMaxHops};
    bool verbose{false};

    // Relative names resolve against data_dir.
    [[nodiscard]] std::string resolve(const std::string& file) const;

    [[nodiscard]] std::string risk_path() const;

    // Defaults overridden by HEMOVITA_DATA_DIR and HEMOVITA_RISK_DATA.
    [[nodiscard]] static EngineConfig from_environment();
};

// Reference data already parsed into memory.
struct EngineTables {
    std::vector<MarkerSpec> markers{default_marker_specs()};
    std::vector<CutoffRow> cutoffs;
    std::optional<std::vector<RelationshipSpec>> relationships;  // nullopt: no network file
    std::vector<RiskObservation> risk_observations;
    std::vector<FoodItem> foods;
    AliasTable aliases{AliasTable::defaults()};
    TierRoleCatalog roles{TierRoleCatalog::defaults()};

    [[nodiscard]] static EngineTables load(const EngineConfig& config);
};

struct ReportRequest {
    LabPanel labs;
    PatientInfo patient;
    std::string diet_filter;
};

struct RiskSummary {
    double overall_risk{0.0};
    std::string bucket;  // low, moderate or high
    std::vector<RiskEstimate> high_risk;
    RiskProfile profile;
    std::string text;  // summary followed by the disclaimer, if any
};

struct ReportResponse {
    LabelSet labels;
    SupplementPlan plan;
    std::vector<FoodSuggestion> foods;
    std::vector<std::string> network_notes;
    std::vector<TargetExplanation> explanations;
    std::string report_text;
    std::optional<RiskSummary> risk;
    std::string risk_error;  // why `risk` is empty, if it is
};

[[nodiscard]] std::string risk_bucket(double overall_risk);

[[nodiscard]] RiskSummary summarize_risk_profile(const RiskProfile& profile);

// (population, gender) for the risk model; an explicit population always wins.
[[nodiscard]] std::pair<std::string, std::string> risk_demographics(const PatientInfo& patient);

// Read-only decision pipeline. All tables are loaded and the risk model is
// trained before construction returns; afterwards every member is const and
// safe to call concurrently.
class DecisionEngine {
public:
    DecisionEngine(EngineTables tables, EngineConfig config = {});

    // Serves risk profiles from `profiler` instead of the trained bandit,
    // which is still built and reachable through risk_model().
    DecisionEngine(EngineTables tables, std::shared_ptr<const RiskProfiler> profiler, EngineConfig config = {});

    // Loads every table from disk. Missing or empty required tables throw.
    [[nodiscard]] static std::shared_ptr<const DecisionEngine> create(const EngineConfig& config);

    [[nodiscard]] LabelSet classify_panel(const LabPanel& labs) const;

    [[nodiscard]] SupplementPlan schedule(const LabelSet& labels) const;

    [[nodiscard]] std::vector<TargetExplanation> explain(const LabelSet& labels) const;

    [[nodiscard]] RiskProfile risk_profile(const std::string& country,
                                           const std::string& population,
                                           const std::string& gender,
                                           std::optional<double> age) const;

    [[nodiscard]] std::vector<FoodSuggestion> suggest_foods(const LabelSet& labels,
                                                            const std::string& diet_filter = {},
                                                            std::size_t top_n = kDefaultFoodsPerBundle) const;

    [[nodiscard]] std::vector<std::string> network_notes(const SupplementPlan& plan) const;

    [[nodiscard]] ReportResponse build_report(const ReportRequest& request) const;

    [[nodiscard]] const InteractionRules& rules() const noexcept;

    [[nodiscard]] const BanditRiskModel& risk_model() const noexcept;

    [[nodiscard]] const ReferenceStore& reference() const noexcept;

    [[nodiscard]] bool network_available() const noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept;

private:
    EngineConfig config_;
    std::shared_ptr<const AliasTable> aliases_;
    std::shared_ptr<const ReferenceStore> reference_;
    std::shared_ptr<const InteractionGraph> graph_;
    std::shared_ptr<const InteractionRules> rules_;
    std::shared_ptr<const RiskTable> risk_table_;
    std::shared_ptr<const BanditRiskModel> risk_model_;
    std::shared_ptr<const RiskProfiler> risk_profiler_;
    std::unique_ptr<Classifier> classifier_;
    std::unique_ptr<Explainer> explainer_;
    std::unique_ptr<Scheduler> scheduler_;
    std::unique_ptr<FoodAdvisor> foods_;
    std::unique_ptr<PlanNotes> notes_;
};

}  // namespace hemovita
