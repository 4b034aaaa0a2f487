#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>

#include "hemovita/engine.hpp"

namespace {

using hemovita::Label;
using hemovita::Slot;

hemovita::CutoffRow cutoff(std::string micronutrient, std::string biomarker, std::string type, double value) {
    hemovita::CutoffRow row;
    row.micronutrient = std::move(micronutrient);
    row.biomarker = std::move(biomarker);
    row.population_group = "adults";
    row.unit = "unit";
    row.cutoff_type = std::move(type);
    row.cutoff_value = value;
    return row;
}

hemovita::RelationshipSpec edge(std::string source, std::string target, std::string effect, std::string notes = "") {
    hemovita::RelationshipSpec spec;
    spec.source = std::move(source);
    spec.target = std::move(target);
    spec.effect_text = effect;
    spec.effect = hemovita::parse_edge_effect(effect);
    spec.notes = std::move(notes);
    return spec;
}

hemovita::EngineTables clinic_tables() {
    hemovita::EngineTables tables;
    tables.markers = {
        {"Hemoglobin", "iron_related_anemia", "hemoglobin", "", "", "anemia", ""},
        {"ferritin", "iron", "serum_ferritin", "", "", "", ""},
        {"vitamin_D", "vitamin_D", "serum_25OHD", "", "", "", ""},
        {"calcium", "calcium", "serum_total_calcium", "", "", "low", ""},
        {"homocysteine", "homocysteine_related", "plasma_homocysteine", "", "", "", "high_mild"},
    };
    tables.cutoffs = {
        cutoff("iron_related_anemia", "hemoglobin", "anemia", 12.0),
        cutoff("iron", "serum_ferritin", "deficiency", 15.0),
        cutoff("vitamin_D", "serum_25OHD", "deficiency", 50.0),
        cutoff("calcium", "serum_total_calcium", "low", 2.1),
        cutoff("homocysteine_related", "plasma_homocysteine", "high_mild", 15.0),
    };
    tables.relationships = std::vector<hemovita::RelationshipSpec>{
        edge("vitamin_C", "ferritin", "boosts", "vitamin C aids non-heme iron uptake"),
        edge("calcium", "ferritin", "inhibits", "calcium competes with iron"),
        edge("vitamin_A", "vitamin_C", "boosts"),
    };
    tables.risk_observations = {
        {"Kenya", "Women", "Female", "iron", 30.0, 0.7},
        {"Kenya", "Women", "Female", "zinc", 30.0, 0.2},
        {"India", "Men", "Male", "iron", 40.0, 0.1},
        {"India", "Men", "Male", "vitamin_A", 40.0, 0.4},
    };
    tables.foods = {
        {"Beef liver", "Meat", "iron", 85.0, "omnivore"},
        {"Lentils", "Legume", "iron", 100.0, "vegan"},
        {"Salmon", "Fish", "vitamin_D", 100.0, "pescatarian/omnivore"},
    };
    return tables;
}

hemovita::EngineConfig quick_config() {
    hemovita::EngineConfig config;
    config.bandit.training_steps = 500;
    return config;
}

class UnavailableRiskProfiler final : public hemovita::RiskProfiler {
public:
    [[nodiscard]] hemovita::RiskProfile risk_profile(const std::string&,
                                                     const std::string&,
                                                     const std::string&,
                                                     std::optional<double>) const override {
        throw std::runtime_error("risk service offline");
    }
};

void write_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

}  // namespace

TEST_CASE("Engine classifies and schedules the anemia example", "[engine]") {
    hemovita::DecisionEngine engine(clinic_tables(), quick_config());

    const auto labels = engine.classify_panel({{"Hemoglobin", 9.5}, {"ferritin", 5.0}, {"vitamin_D", 20.0}});
    REQUIRE(labels.size() == 3);
    for (const auto& entry : labels) {
        REQUIRE(entry.label == Label::Low);
    }

    const auto plan = engine.schedule(labels);
    REQUIRE(plan.at(Slot::Morning) == std::vector<std::string>{"iron", "vitamin_D", "vitamin_C"});
    REQUIRE(plan.at(Slot::Midday).empty());
    REQUIRE(plan.at(Slot::Evening).empty());
}

TEST_CASE("Engine keeps network antagonists apart and explains why", "[engine]") {
    hemovita::DecisionEngine engine(clinic_tables(), quick_config());

    const auto labels = engine.classify_panel({{"ferritin", 5.0}, {"calcium", 1.9}});
    const auto plan = engine.schedule(labels);
    REQUIRE(plan.at(Slot::Morning) == std::vector<std::string>{"iron", "vitamin_C"});
    REQUIRE(plan.at(Slot::Midday) == std::vector<std::string>{"calcium"});
    REQUIRE(engine.rules().conflicts("calcium", "iron"));

    const auto notes = engine.network_notes(plan);
    REQUIRE(notes.size() == 2);
    REQUIRE(notes[0] ==
            "Vitamin C and Iron are scheduled together in the morning slot because vitamin C aids non-heme iron uptake.");
    REQUIRE(notes[1] ==
            "Calcium is kept in the midday slot and Iron in the morning slot to avoid interaction: calcium competes with "
            "iron.");

    const auto explanations = engine.explain(labels);
    REQUIRE(explanations.size() == 1);
    REQUIRE(explanations[0].target == "ferritin");
    REQUIRE(explanations[0].paths == std::vector<std::string>{
                                         "calcium —inhibits→ ferritin",
                                         "vitamin_A —boosts→ vitamin_C —boosts→ ferritin",
                                         "vitamin_C —boosts→ ferritin",
                                     });
}

TEST_CASE("Engine serves risk profiles from the trained model", "[engine]") {
    hemovita::DecisionEngine engine(clinic_tables(), quick_config());

    REQUIRE(engine.risk_model().steps_trained() == 500);

    const auto unseen = engine.risk_profile("Atlantis", "Women", "Female", 30.0);
    REQUIRE(unseen.fallback_used);
    REQUIRE_FALSE(unseen.disclaimer.empty());
    REQUIRE(unseen.risks.front().micronutrient == "iron");

    const auto known = engine.risk_profile("Kenya", "Women", "Female", 30.0);
    REQUIRE_FALSE(known.fallback_used);
    REQUIRE(known.risks.size() == 3);
}

TEST_CASE("Engine report combines every output", "[engine]") {
    hemovita::DecisionEngine engine(clinic_tables(), quick_config());
    hemovita::ReportRequest request;
    request.labs = {{"Hemoglobin", 9.5}, {"ferritin", 5.0}, {"homocysteine", 18.0}};
    request.patient.age = 30;
    request.patient.sex = "Female";
    request.patient.country = "Atlantis";
    request.diet_filter = "vegan";

    const auto response = engine.build_report(request);
    REQUIRE(hemovita::find_label(response.labels, "homocysteine") == Label::High);
    REQUIRE(response.plan.at(Slot::Morning).front() == "iron");
    REQUIRE(response.foods.size() == 1);
    REQUIRE(response.foods[0].foods.size() == 1);
    REQUIRE(response.foods[0].foods[0].name == "Lentils");
    REQUIRE_FALSE(response.network_notes.empty());
    REQUIRE(response.explanations.size() == 1);
    REQUIRE(response.report_text.find("Beef liver") != std::string::npos);
    REQUIRE(response.report_text.find("Serum ferritin:") != std::string::npos);

    const auto first_only = engine.suggest_foods(response.labels, "", 1);
    REQUIRE(first_only.size() == 1);
    REQUIRE(first_only[0].foods.size() == 1);
    REQUIRE(first_only[0].foods[0].name == "Beef liver");

    REQUIRE(response.risk.has_value());
    REQUIRE(response.risk_error.empty());
    REQUIRE(response.risk->profile.population == "Women");
    REQUIRE(response.risk->profile.fallback_used);
    REQUIRE(response.risk->overall_risk == Catch::Approx(0.7));
    REQUIRE(response.risk->bucket == "high");
    REQUIRE(response.risk->high_risk.size() == 1);
    REQUIRE(response.risk->text == response.risk->profile.summary + " " + response.risk->profile.disclaimer);
}

TEST_CASE("Risk demographics follow the patient unless a population is given", "[engine]") {
    hemovita::PatientInfo patient;
    patient.sex = "female";
    REQUIRE(hemovita::risk_demographics(patient) == std::make_pair(std::string("Women"), std::string("Female")));
    patient.pregnant = true;
    REQUIRE(hemovita::risk_demographics(patient).first == "Pregnant women");
    patient.sex = "MALE";
    REQUIRE(hemovita::risk_demographics(patient) == std::make_pair(std::string("Men"), std::string("Male")));
    patient.sex.clear();
    REQUIRE(hemovita::risk_demographics(patient) == std::make_pair(std::string("Adults"), std::string("All")));
    patient.population = "Children";
    REQUIRE(hemovita::risk_demographics(patient).first == "Children");
}

TEST_CASE("Risk buckets split at one and two thirds", "[engine]") {
    REQUIRE(hemovita::risk_bucket(0.0) == "low");
    REQUIRE(hemovita::risk_bucket(0.329) == "low");
    REQUIRE(hemovita::risk_bucket(0.33) == "moderate");
    REQUIRE(hemovita::risk_bucket(0.659) == "moderate");
    REQUIRE(hemovita::risk_bucket(0.66) == "high");

    hemovita::RiskProfile profile;
    profile.summary = "No major micronutrient risks predicted from demographics alone.";
    const auto summary = hemovita::summarize_risk_profile(profile);
    REQUIRE(summary.overall_risk == 0.0);
    REQUIRE(summary.bucket == "low");
    REQUIRE(summary.high_risk.empty());
    REQUIRE(summary.text == profile.summary);
}

TEST_CASE("Engine without a network still schedules and reports", "[engine]") {
    auto tables = clinic_tables();
    tables.relationships.reset();
    hemovita::DecisionEngine engine(std::move(tables), quick_config());

    REQUIRE_FALSE(engine.network_available());
    const auto labels = engine.classify_panel({{"ferritin", 5.0}, {"calcium", 1.9}});
    const auto plan = engine.schedule(labels);
    REQUIRE(plan.at(Slot::Morning) == std::vector<std::string>{"iron", "calcium"});
    REQUIRE(engine.explain(labels).empty());
    REQUIRE(engine.network_notes(plan).front().find("was not found") != std::string::npos);
}

TEST_CASE("Engine refuses to start with incomplete reference data", "[engine]") {
    auto no_cutoffs = clinic_tables();
    no_cutoffs.cutoffs.clear();
    REQUIRE_THROWS_AS(hemovita::DecisionEngine(std::move(no_cutoffs), quick_config()), std::runtime_error);

    auto no_risk = clinic_tables();
    no_risk.risk_observations.clear();
    REQUIRE_THROWS_AS(hemovita::DecisionEngine(std::move(no_risk), quick_config()), std::runtime_error);

    auto unresolved = clinic_tables();
    unresolved.cutoffs = {cutoff("selenium", "serum_selenium", "deficiency", 70.0)};
    REQUIRE_THROWS_AS(hemovita::DecisionEngine(std::move(unresolved), quick_config()), std::runtime_error);

    auto config = quick_config();
    config.data_dir = (std::filesystem::temp_directory_path() / "hemovita_no_such_dir").string();
    REQUIRE_THROWS_AS(hemovita::DecisionEngine::create(config), std::runtime_error);
}

TEST_CASE("Engine loads its tables from the data directory", "[engine]") {
    const auto dir = std::filesystem::temp_directory_path() / "hemovita_engine_data";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    write_file(dir / "micronutrient_cutoffs_structured.csv",
               "micronutrient,biomarker,population_group,unit,cutoff_type,cutoff_value\n"
               "iron,serum_ferritin,nonpregnant_adults,µg/L,deficiency,15\n"
               "vitamin_D,serum_25OHD,general,nmol/L,deficiency,50\n");
    write_file(dir / "risk.csv",
               "Country,Population,Gender,Micronutrient,Age,P_Deficiency_Primary\n"
               "Kenya,Women,Female,iron,30,45\n"
               "Kenya,Women,Female,zinc,30,\n"
               "Kenya,Women,Female,vitamin_D,30,20\n");

    auto config = quick_config();
    config.data_dir = dir.string();
    config.risk_data_path = (dir / "risk.csv").string();
    const auto engine = hemovita::DecisionEngine::create(config);

    REQUIRE(engine->reference().resolved_count() == 2);
    REQUIRE_FALSE(engine->network_available());
    const auto labels = engine->classify_panel({{"ferritin", 10.0}, {"vitamin_D", 80.0}});
    REQUIRE(hemovita::find_label(labels, "ferritin") == Label::Low);
    REQUIRE(hemovita::find_label(labels, "vitamin_D") == Label::Normal);
    REQUIRE(engine->suggest_foods(labels).empty());
    REQUIRE(engine->risk_model().actions() == std::vector<std::string>{"iron", "vitamin_D"});

    std::filesystem::remove_all(dir);
}

TEST_CASE("Engine configuration reads the environment", "[engine]") {
    ::setenv("HEMOVITA_DATA_DIR", "/srv/hemovita", 1);
    ::setenv("HEMOVITA_RISK_DATA", "/tmp/risk.csv", 1);
    const auto config = hemovita::EngineConfig::from_environment();
    ::unsetenv("HEMOVITA_DATA_DIR");
    ::unsetenv("HEMOVITA_RISK_DATA");

    REQUIRE(config.data_dir == "/srv/hemovita");
    REQUIRE(config.risk_path() == "/tmp/risk.csv");
    REQUIRE(config.resolve("foods_usda.csv") == "/srv/hemovita/foods_usda.csv");
    REQUIRE(config.resolve("/abs/foods.csv") == "/abs/foods.csv");

    const auto defaults = hemovita::EngineConfig::from_environment();
    REQUIRE(defaults.data_dir == "data");
    REQUIRE(defaults.risk_path() == "data/micronutrient_data.csv");
}

TEST_CASE("Engine report survives a failing risk step", "[engine]") {
    hemovita::DecisionEngine engine(clinic_tables(), std::make_shared<const UnavailableRiskProfiler>(), quick_config());
    hemovita::ReportRequest request;
    request.labs = {{"ferritin", 5.0}, {"calcium", 1.9}};
    request.patient.sex = "Female";
    request.patient.country = "Kenya";

    const auto response = engine.build_report(request);
    REQUIRE_FALSE(response.risk.has_value());
    REQUIRE(response.risk_error == "risk service offline");
    REQUIRE(hemovita::find_label(response.labels, "ferritin") == Label::Low);
    REQUIRE(response.plan.at(Slot::Morning) == std::vector<std::string>{"iron", "vitamin_C"});
    REQUIRE(response.plan.at(Slot::Midday) == std::vector<std::string>{"calcium"});
    REQUIRE(response.explanations.size() == 1);
    REQUIRE(response.network_notes.size() == 2);
    REQUIRE(response.report_text.find("1. Lab overview") != std::string::npos);

    REQUIRE_THROWS_AS(engine.risk_profile("Kenya", "Women", "Female", 30.0), std::runtime_error);
    REQUIRE(engine.risk_model().steps_trained() == 500);
    REQUIRE_THROWS_AS(hemovita::DecisionEngine(clinic_tables(), nullptr, quick_config()), std::invalid_argument);
}

TEST_CASE("Engine keeps panel order and notes a plan assembled by slot name", "[engine]") {
    hemovita::DecisionEngine engine(clinic_tables(), quick_config());

    const auto labels = engine.classify_panel({{"vitamin_D", 80.0}, {"calcium", 1.9}, {"ferritin", 5.0}});
    REQUIRE(labels.size() == 3);
    REQUIRE(labels[0].marker == "vitamin_D");
    REQUIRE(labels[1].marker == "calcium");
    REQUIRE(labels[2].marker == "ferritin");

    hemovita::SupplementPlan plan;
    for (Slot slot : hemovita::kSlots) {
        if (std::string(hemovita::to_string(slot)) == "morning") {
            plan.at(slot) = {"iron", "vitamin_C"};
        } else if (std::string(hemovita::to_string(slot)) == "midday") {
            plan.at(slot) = {"calcium"};
        }
    }
    const auto notes = engine.network_notes(plan);
    REQUIRE(notes.size() == 2);
    REQUIRE(notes[1] ==
            "Calcium is kept in the midday slot and Iron in the morning slot to avoid interaction: calcium competes with "
            "iron.");

    const auto scheduled = engine.schedule(labels);
    REQUIRE(scheduled.at(Slot::Morning) == std::vector<std::string>{"calcium"});
    REQUIRE(scheduled.at(Slot::Midday) == std::vector<std::string>{"iron", "vitamin_C"});
}
