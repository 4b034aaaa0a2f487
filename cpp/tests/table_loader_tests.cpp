#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "hemovita/string_utils.hpp"
#include "hemovita/table_loader.hpp"

TEST_CASE("Cutoff table rows are trimmed and typed", "[table_loader]") {
    std::istringstream csv(
        "micronutrient,biomarker,population_group,unit,cutoff_type,cutoff_value,role\n"
        "iron, serum_ferritin ,nonpregnant_adults,µg/L,deficiency,15,\n"
        "calcium,serum_total_calcium,adults,mmol/L,hypercalcemia,2.6,high\n");

    const auto rows = hemovita::read_cutoff_table(csv);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].biomarker == "serum_ferritin");
    REQUIRE(rows[0].cutoff_value == 15.0);
    REQUIRE_FALSE(rows[0].role.has_value());
    REQUIRE(rows[1].role == hemovita::TierRole::HighIndicator);
    REQUIRE(rows[1].cutoff_value == Catch::Approx(2.6));
}

TEST_CASE("Cutoff table without a role column is accepted", "[table_loader]") {
    std::istringstream csv(
        "micronutrient,biomarker,population_group,unit,cutoff_type,cutoff_value\n"
        "vitamin_D,serum_25OHD,general,nmol/L,deficiency,50\n");

    const auto rows = hemovita::read_cutoff_table(csv);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].population_group == "general");
}

TEST_CASE("Cutoff table errors name the problem", "[table_loader]") {
    std::istringstream missing_column(
        "micronutrient,biomarker,unit,cutoff_type\n"
        "iron,serum_ferritin,µg/L,deficiency\n");
    REQUIRE_THROWS_AS(hemovita::read_cutoff_table(missing_column), std::invalid_argument);

    std::istringstream bad_number(
        "micronutrient,biomarker,population_group,unit,cutoff_type,cutoff_value\n"
        "iron,serum_ferritin,adults,µg/L,deficiency,fifteen\n");
    REQUIRE_THROWS_AS(hemovita::read_cutoff_table(bad_number), std::invalid_argument);

    std::istringstream bad_role(
        "micronutrient,biomarker,population_group,unit,cutoff_type,cutoff_value,role\n"
        "iron,serum_ferritin,adults,µg/L,deficiency,15,sideways\n");
    REQUIRE_THROWS_AS(hemovita::read_cutoff_table(bad_role), std::invalid_argument);
}

TEST_CASE("Relationship table keeps effect text and quoted notes", "[table_loader]") {
    std::istringstream csv(
        "source,target,effect,confidence,notes\n"
        "vitamin_C,ferritin,Boosts,high,\"Vitamin C reduces Fe3+ to Fe2+, improving uptake\"\n"
        "calcium,iron,inhibits,moderate,\n"
        ",iron,boosts,low,orphan\n"
        "folate,homocysteine,lowers,,\n");

    const auto rows = hemovita::read_relationship_table(csv);
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].effect == hemovita::EdgeEffect::Boosts);
    REQUIRE(rows[0].effect_text == "Boosts");
    REQUIRE(rows[0].notes == "Vitamin C reduces Fe3+ to Fe2+, improving uptake");
    REQUIRE(rows[1].effect == hemovita::EdgeEffect::Inhibits);
    REQUIRE(rows[1].notes.empty());
    REQUIRE(rows[2].effect == hemovita::EdgeEffect::Other);
    REQUIRE(rows[2].confidence.empty());
}

TEST_CASE("Relationship table only requires source, target and effect", "[table_loader]") {
    std::istringstream csv("source,target,effect\nzinc,copper,inhibits\n");

    const auto rows = hemovita::read_relationship_table(csv);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].confidence.empty());
}

TEST_CASE("Risk observations read either risk column", "[table_loader]") {
    std::istringstream primary(
        "Country,Population,Gender,Micronutrient,Age,P_Deficiency_Primary\n"
        "Kenya,Women,Female,iron,30,42.5\n"
        "Kenya,Women,Female,zinc,,\n");

    const auto rows = hemovita::read_risk_observations(primary);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].age == 30.0);
    REQUIRE(rows[0].true_risk == Catch::Approx(42.5));
    REQUIRE_FALSE(rows[1].age.has_value());
    REQUIRE(std::isnan(rows[1].true_risk));

    std::istringstream true_risk(
        "Country,Population,Gender,Micronutrient,True_Risk\n"
        "Peru,Adults,All,vitamin_A,0.12\n");
    const auto simple = hemovita::read_risk_observations(true_risk);
    REQUIRE(simple.size() == 1);
    REQUIRE(simple[0].true_risk == Catch::Approx(0.12));

    std::istringstream neither("Country,Population,Gender,Micronutrient\nPeru,Adults,All,iron\n");
    REQUIRE_THROWS_AS(hemovita::read_risk_observations(neither), std::invalid_argument);
}

TEST_CASE("Food table tolerates missing servings and diet tags", "[table_loader]") {
    std::istringstream csv(
        "Food,Category,Bundle,Typical_serve_g,Diet_tag,FDC_ID\n"
        "Beef liver,Meat,iron,85,omnivore,1\n"
        "Lentils,Legume,iron,,vegan,2\n"
        ",Legume,iron,100,vegan,3\n");

    const auto foods = hemovita::read_food_table(csv);
    REQUIRE(foods.size() == 2);
    REQUIRE(foods[0].serving_g == 85.0);
    REQUIRE(foods[0].diet_tag == "omnivore");
    REQUIRE_FALSE(foods[1].serving_g.has_value());

    std::istringstream bare("Food,Category,Bundle\nSpinach,Vegetable,folate\n");
    const auto minimal = hemovita::read_food_table(bare);
    REQUIRE(minimal.size() == 1);
    REQUIRE(minimal[0].diet_tag.empty());
}

TEST_CASE("Alias and marker tables load as data", "[table_loader]") {
    std::istringstream aliases_csv("alias,key\nHemoglobin,iron\nfolate_plasma,folate\n");
    const auto aliases = hemovita::read_alias_table(aliases_csv);
    REQUIRE(aliases.size() == 2);
    REQUIRE(aliases.canonical("Hemoglobin") == "iron");

    std::istringstream conflicting("alias,key\nHemoglobin,iron\nHemoglobin,folate\n");
    REQUIRE_THROWS_AS(hemovita::read_alias_table(conflicting), std::invalid_argument);

    std::istringstream markers_csv(
        "marker,micronutrient,biomarker,population_group,unit,low_tier,high_tier\n"
        "MCV,iron_related_anemia,MCV,adults,fL,microcytosis,macrocytosis\n"
        "zinc,zinc,plasma_or_serum_zinc,,,,\n");
    const auto markers = hemovita::read_marker_specs(markers_csv);
    REQUIRE(markers.size() == 2);
    REQUIRE(markers[0].high_tier == "macrocytosis");
    REQUIRE(markers[1].population_group.empty());
    REQUIRE(markers[1].low_tier.empty());
}

TEST_CASE("Loading a missing file is a startup error", "[table_loader]") {
    const auto missing = (std::filesystem::temp_directory_path() / "hemovita_missing_table.csv").string();
    std::filesystem::remove(missing);

    REQUIRE_THROWS_AS(hemovita::load_cutoff_table(missing), std::runtime_error);
    REQUIRE_THROWS_AS(hemovita::load_risk_observations(missing), std::runtime_error);
    REQUIRE_THROWS_AS(hemovita::load_relationship_table(missing), std::runtime_error);
}

TEST_CASE("Loading a file reads it through the stream parser", "[table_loader]") {
    const auto path = std::filesystem::temp_directory_path() / "hemovita_loader_foods.csv";
    {
        std::ofstream out(path);
        out << "Food,Category,Bundle,Typical_serve_g,Diet_tag\n"
            << "Salmon,Fish,vitamin_D,100,pescatarian/omnivore\n";
    }

    const auto foods = hemovita::load_food_table(path.string());
    REQUIRE(foods.size() == 1);
    REQUIRE(foods[0].name == "Salmon");
    std::filesystem::remove(path);
}

TEST_CASE("Numeric cells must parse completely", "[table_loader]") {
    REQUIRE(hemovita::parse_number(" 15 ") == 15.0);
    REQUIRE(hemovita::parse_number("2.6") == 2.6);
    REQUIRE(hemovita::parse_number("+0.5") == 0.5);
    REQUIRE(hemovita::parse_number("-1e2") == -100.0);
    REQUIRE_FALSE(hemovita::parse_number("").has_value());
    REQUIRE_FALSE(hemovita::parse_number("2,6").has_value());
    REQUIRE_FALSE(hemovita::parse_number("15 µg/L").has_value());
    REQUIRE_FALSE(hemovita::parse_number("+-3").has_value());
    REQUIRE_FALSE(hemovita::parse_number("nan").has_value());
    REQUIRE_FALSE(hemovita::parse_number("0x10").has_value());
}
