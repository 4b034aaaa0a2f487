#include "hemovita/engine.hpp"

#include "hemovita/string_utils.hpp"
#include "hemovita/table_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace hemovita {

namespace {

[[nodiscard]] std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

std::string EngineConfig::resolve(const std::string& file) const {
    const std::filesystem::path path(file);
    if (path.is_absolute() || data_dir.empty()) {
        return path.string();
    }
    return (std::filesystem::path(data_dir) / path).string();
}

std::string EngineConfig::risk_path() const {
    return risk_data_path.empty() ? resolve(risk_file) : risk_data_path;
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;
    if (auto dir = env_value("HEMOVITA_DATA_DIR")) {
        config.data_dir = *dir;
    }
    if (auto risk = env_value("HEMOVITA_RISK_DATA")) {
        config.risk_data_path = *risk;
    }
    return config;
}

EngineTables EngineTables::load(const EngineConfig& config) {
    EngineTables tables;
    if (!config.marker_file.empty()) {
        tables.markers = load_marker_specs(config.resolve(config.marker_file));
    }
    if (!config.alias_file.empty()) {
        tables.aliases = load_alias_table(config.resolve(config.alias_file));
    }

    tables.cutoffs = load_cutoff_table(config.resolve(config.cutoff_file));

    const std::string relationships = config.resolve(config.relationship_file);
    if (std::filesystem::exists(relationships)) {
        tables.relationships = load_relationship_table(relationships);
    } else if (config.verbose) {
        std::cout << "[engine] relationships file not found: " << relationships
                  << "; network features disabled" << std::endl;
    }

    const std::string risk = config.risk_path();
    if (config.verbose) {
        std::cout << "[risk] loading risk data from: " << risk << std::endl;
    }
    tables.risk_observations = load_risk_observations(risk);

    const std::string foods = config.resolve(config.food_file);
    if (std::filesystem::exists(foods)) {
        tables.foods = load_food_table(foods);
    } else if (config.verbose) {
        std::cout << "[engine] food table not found: " << foods << std::endl;
    }
    return tables;
}

std::string risk_bucket(double overall_risk) {
    if (overall_risk < kModerateRiskThreshold) {
        return "low";
    }
    if (overall_risk < kHighRiskThreshold) {
        return "moderate";
    }
    return "high";
}

RiskSummary summarize_risk_profile(const RiskProfile& profile) {
    RiskSummary summary;
    for (const auto& entry : profile.risks) {
        summary.overall_risk = std::max(summary.overall_risk, entry.risk);
        if (entry.risk >= kHighRiskThreshold) {
            summary.high_risk.push_back(entry);
        }
    }
    summary.bucket = risk_bucket(summary.overall_risk);
    summary.text = profile.disclaimer.empty() ? profile.summary : profile.summary + " " + profile.disclaimer;
    summary.profile = profile;
    return summary;
}

std::pair<std::string, std::string> risk_demographics(const PatientInfo& patient) {
    const std::string sex = to_lower(trim(patient.sex));
    std::string population;
    std::string gender;
    if (sex == "female") {
        population = patient.pregnant.value_or(false) ? "Pregnant women" : "Women";
        gender = "Female";
    } else if (sex == "male") {
        population = "Men";
        gender = "Male";
    } else {
        population = "Adults";
        gender = "All";
    }
    const std::string explicit_population = trim(patient.population);
    if (!explicit_population.empty()) {
        population = explicit_population;
    }
    return {population, gender};
}

DecisionEngine::DecisionEngine(EngineTables tables, EngineConfig config)
    : config_(std::move(config)) {
    if (tables.cutoffs.empty()) {
        throw std::runtime_error("cutoff table is empty");
    }
    if (tables.risk_observations.empty()) {
        throw std::runtime_error("historical risk table is empty");
    }

    aliases_ = std::make_shared<const AliasTable>(std::move(tables.aliases));
    reference_ = std::make_shared<const ReferenceStore>(tables.markers, tables.cutoffs, tables.roles);
    if (reference_->resolved_count() == 0) {
        throw std::runtime_error("no marker could be resolved against the cutoff table");
    }

    if (tables.relationships.has_value()) {
        graph_ = std::make_shared<const InteractionGraph>(*tables.relationships);
        rules_ = std::make_shared<const InteractionRules>(RuleDeriver(aliases_).derive(graph_->edges()));
    } else {
        rules_ = std::make_shared<const InteractionRules>();
    }

    risk_table_ = std::make_shared<const RiskTable>(tables.risk_observations, config_.bandit.default_age);
    BanditOptions bandit = config_.bandit;
    bandit.verbose = bandit.verbose || config_.verbose;
    risk_model_ = std::make_shared<const BanditRiskModel>(BanditRiskModel(risk_table_, bandit).train());
    risk_profiler_ = risk_model_;

    ScheduleOptions schedule = config_.schedule;
    schedule.verbose = schedule.verbose || config_.verbose;
    classifier_ = std::make_unique<Classifier>(reference_);
    explainer_ = std::make_unique<Explainer>(graph_);
    scheduler_ = std::make_unique<Scheduler>(aliases_, rules_, schedule);
    foods_ = std::make_unique<FoodAdvisor>(std::move(tables.foods));
    notes_ = std::make_unique<PlanNotes>(aliases_, graph_);

    if (config_.verbose) {
        std::cout << "[engine] markers: " << reference_->resolved_count() << "/" << reference_->markers().size()
                  << ", graph edges: " << (graph_ ? graph_->edges().size() : 0)
                  << ", risk rows: " << risk_table_->row_count() << ", foods: " << foods_->size() << std::endl;
    }
}

DecisionEngine::DecisionEngine(EngineTables tables, std::shared_ptr<const RiskProfiler> profiler, EngineConfig config)
    : DecisionEngine(std::move(tables), std::move(config)) {
    if (!profiler) {
        throw std::invalid_argument("decision engine requires a risk profiler");
    }
    risk_profiler_ = std::move(profiler);
}

std::shared_ptr<const DecisionEngine> DecisionEngine::create(const EngineConfig& config) {
    return std::make_shared<const DecisionEngine>(EngineTables::load(config), config);
}

LabelSet DecisionEngine::classify_panel(const LabPanel& labs) const {
    return classifier_->classify_panel(labs);
}

SupplementPlan DecisionEngine::schedule(const LabelSet& labels) const {
    return scheduler_->schedule(labels);
}

std::vector<TargetExplanation> DecisionEngine::explain(const LabelSet& labels) const {
    return explainer_->explain(labels, config_.max_hops);
}

RiskProfile DecisionEngine::risk_profile(const std::string& country,
                                         const std::string& population,
                                         const std::string& gender,
                                         std::optional<double> age) const {
    return risk_profiler_->risk_profile(country, population, gender, age);
}

std::vector<FoodSuggestion> DecisionEngine::suggest_foods(const LabelSet& labels,
                                                          const std::string& diet_filter,
                                                          std::size_t top_n) const {
    return foods_->suggest(labels, top_n, diet_filter);
}

std::vector<std::string> DecisionEngine::network_notes(const SupplementPlan& plan) const {
    return notes_->notes_for(plan);
}

ReportResponse DecisionEngine::build_report(const ReportRequest& request) const {
    ReportResponse response;
    response.labels = classify_panel(request.labs);
    response.plan = schedule(response.labels);
    response.foods = suggest_foods(response.labels, request.diet_filter);
    response.network_notes = network_notes(response.plan);
    response.explanations = explain(response.labels);

    ReportContent content;
    content.labs = request.labs;
    content.labels = response.labels;
    content.plan = response.plan;
    // the narrative lists every food bundle, unfiltered by diet
    content.foods = suggest_foods(response.labels);
    if (network_available()) {
        content.explanations = response.explanations;
    }
    response.report_text = render_report(request.patient, content);

    try {
        const auto [population, gender] = risk_demographics(request.patient);
        std::optional<double> age;
        if (request.patient.age.has_value()) {
            age = static_cast<double>(*request.patient.age);
        }
        response.risk = summarize_risk_profile(risk_profile(request.patient.country, population, gender, age));
    } catch (const std::exception& e) {
        std::cerr << "Risk model failed: " << e.what() << std::endl;
        response.risk.reset();
        response.risk_error = e.what();
    }
    return response;
}

const InteractionRules& DecisionEngine::rules() const noexcept {
    return *rules_;
}

const BanditRiskModel& DecisionEngine::risk_model() const noexcept {
    return *risk_model_;
}

const ReferenceStore& DecisionEngine::reference() const noexcept {
    return *reference_;
}

bool DecisionEngine::network_available() const noexcept {
    return graph_ != nullptr;
}

const EngineConfig& DecisionEngine::config() const noexcept {
    return config_;
}

}  // namespace hemovita
