#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "hemovita/risk_table.hpp"

namespace {

using Rows = std::vector<hemovita::RiskObservation>;

hemovita::RiskObservation obs(std::string country, std::string population, std::string gender,
                              std::string micronutrient, std::optional<double> age, double risk) {
    return hemovita::RiskObservation{std::move(country), std::move(population), std::move(gender),
                                     std::move(micronutrient), age, risk};
}

std::vector<hemovita::RiskObservation> percent_rows() {
    return {
        obs("Kenya", "Women", "Female", "iron", 30.0, 40.0),
        obs("Kenya", "Women", "Female", "iron", 30.0, 60.0),
        obs("Kenya", "Women", "Female", "zinc", 30.0, 20.0),
        obs(" India ", "Women", "Female", "vitamin_A", std::nullopt, 30.0),
        obs("India", "Men", "Male", "iron", 40.0, 10.0),
        obs("India", "Men", "Male", "zinc", 40.0, std::numeric_limits<double>::quiet_NaN()),
    };
}

}  // namespace

TEST_CASE("RiskTable normalises percent risks and drops empty rows", "[risk_table]") {
    hemovita::RiskTable table(percent_rows());

    REQUIRE(table.percent_scaled());
    REQUIRE(table.row_count() == 5);

    const hemovita::RiskContext kenya{"Kenya", "Women", "Female", 30.0};
    REQUIRE(table.true_risk(kenya, "iron") == Catch::Approx(0.5));
    REQUIRE(table.true_risk(kenya, "zinc") == Catch::Approx(0.2));
    REQUIRE(table.actions(kenya) == std::vector<std::string>{"iron", "zinc"});
    REQUIRE_THROWS_AS(table.true_risk(kenya, "vitamin_A"), std::out_of_range);
}

TEST_CASE("RiskTable fills missing ages with the default", "[risk_table]") {
    hemovita::RiskTable table(percent_rows(), 18.0);

    const hemovita::RiskContext india{"India", "Women", "Female", 18.0};
    REQUIRE(table.true_risk(india, "vitamin_A") == Catch::Approx(0.3));
    REQUIRE(table.contexts().size() == 3);
    REQUIRE(std::is_sorted(table.contexts().begin(), table.contexts().end()));
}

TEST_CASE("RiskTable collects sorted category lists", "[risk_table]") {
    hemovita::RiskTable table(percent_rows());

    REQUIRE(table.countries() == std::vector<std::string>{"India", "Kenya"});
    REQUIRE(table.populations() == std::vector<std::string>{"Men", "Women"});
    REQUIRE(table.genders() == std::vector<std::string>{"Female", "Male"});
    REQUIRE(table.micronutrients() == std::vector<std::string>{"iron", "vitamin_A", "zinc"});
}

TEST_CASE("RiskTable baselines average by population and globally", "[risk_table]") {
    hemovita::RiskTable table(percent_rows());

    const auto women = table.population_baseline("Women", "Female");
    REQUIRE(women.size() == 3);
    REQUIRE(women[0].micronutrient == "iron");
    REQUIRE(women[0].risk == Catch::Approx(0.5));
    REQUIRE(women[1].micronutrient == "vitamin_A");
    REQUIRE(women[2].micronutrient == "zinc");

    REQUIRE(table.population_baseline("Children", "All").empty());

    const auto global = table.global_baseline();
    REQUIRE(global.size() == 3);
    REQUIRE(global[0].micronutrient == "iron");
    REQUIRE(global[0].risk == Catch::Approx((0.4 + 0.6 + 0.1) / 3.0));
}

TEST_CASE("RiskTable keeps probabilities already in the unit range", "[risk_table]") {
    hemovita::RiskTable table(Rows{obs("Peru", "Adults", "All", "iron", 25.0, 0.8), obs("Peru", "Adults", "All", "zinc", 25.0, 0.1)});

    REQUIRE_FALSE(table.percent_scaled());
    REQUIRE(table.true_risk({"Peru", "Adults", "All", 25.0}, "iron") == Catch::Approx(0.8));
}

TEST_CASE("RiskTable rejects unusable data", "[risk_table]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(hemovita::RiskTable(Rows{}), std::invalid_argument);
    REQUIRE_THROWS_AS(hemovita::RiskTable(Rows{obs("Peru", "Adults", "All", "iron", 25.0, nan)}), std::invalid_argument);
    REQUIRE_THROWS_AS(hemovita::RiskTable(Rows{obs("Peru", "Adults", "All", "iron", 25.0, -0.1)}), std::invalid_argument);
    REQUIRE_THROWS_AS(hemovita::RiskTable(Rows{obs("Peru", "Adults", "All", "iron", 25.0, 140.0)}), std::invalid_argument);
    REQUIRE_THROWS_AS(hemovita::RiskTable(Rows{obs("Peru", "Adults", "All", " ", 25.0, 0.2)}), std::invalid_argument);
}

TEST_CASE("RiskTable replaces infinite ages with the default", "[risk_table]") {
    hemovita::RiskTable table(Rows{
        obs("Kenya", "Women", "Female", "iron", std::numeric_limits<double>::infinity(), 0.4),
    });
    REQUIRE(table.contexts().front().age == hemovita::kDefaultRiskAge);
    REQUIRE_THROWS_AS(hemovita::RiskTable(Rows{obs("Kenya", "Women", "Female", "iron", 30.0, 0.4)},
                                          std::numeric_limits<double>::infinity()),
                      std::invalid_argument);
}
