#include "hemovita/table_loader.hpp"

#include "hemovita/string_utils.hpp"

#include <rapidcsv.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace hemovita {

namespace {

// Header-indexed view over a rapidcsv document.
class CsvTable {
public:
    CsvTable(std::istream& input, std::string name)
        : name_(std::move(name)),
          doc_(input, rapidcsv::LabelParams(0, -1), rapidcsv::SeparatorParams(',', true),
               rapidcsv::ConverterParams(), rapidcsv::LineReaderParams(false, '#', true)) {}

    [[nodiscard]] std::size_t rows() const { return doc_.GetRowCount(); }

    [[nodiscard]] int optional_column(const std::string& column) const {
        return doc_.GetColumnIdx(column);
    }

    [[nodiscard]] int required_column(const std::string& column) const {
        const int idx = doc_.GetColumnIdx(column);
        if (idx < 0) {
            throw std::invalid_argument(name_ + ": missing required column '" + column + "'");
        }
        return idx;
    }

    [[nodiscard]] std::vector<std::string> row(std::size_t index) const {
        return doc_.GetRow<std::string>(index);
    }

    [[nodiscard]] std::string cell(const std::vector<std::string>& row, int column) const {
        if (column < 0 || static_cast<std::size_t>(column) >= row.size()) {
            return {};
        }
        return trim(row[static_cast<std::size_t>(column)]);
    }

    [[nodiscard]] double number(const std::vector<std::string>& row, int column, std::size_t index) const {
        const std::string text = cell(row, column);
        auto value = parse_number(text);
        if (!value.has_value()) {
            throw std::invalid_argument(name_ + ": row " + std::to_string(index + 1) + " has non-numeric value '" + text + "'");
        }
        return *value;
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    rapidcsv::Document doc_;
};

template <typename Reader>
[[nodiscard]] auto load_file(const std::string& path, Reader reader) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("table file not found: " + path);
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("unable to open table file: " + path);
    }
    return reader(input);
}

}  // namespace

std::vector<CutoffRow> read_cutoff_table(std::istream& input) {
    CsvTable table(input, "cutoff table");
    const int micronutrient = table.required_column("micronutrient");
    const int biomarker = table.required_column("biomarker");
    const int unit = table.required_column("unit");
    const int cutoff_type = table.required_column("cutoff_type");
    const int cutoff_value = table.required_column("cutoff_value");
    const int population_group = table.optional_column("population_group");
    const int role = table.optional_column("role");

    std::vector<CutoffRow> rows;
    rows.reserve(table.rows());
    for (std::size_t i = 0; i < table.rows(); ++i) {
        const auto row = table.row(i);
        CutoffRow out;
        out.micronutrient = table.cell(row, micronutrient);
        out.biomarker = table.cell(row, biomarker);
        out.population_group = table.cell(row, population_group);
        out.unit = table.cell(row, unit);
        out.cutoff_type = table.cell(row, cutoff_type);
        out.cutoff_value = table.number(row, cutoff_value, i);
        out.role = parse_tier_role(table.cell(row, role));
        if (out.cutoff_type.empty()) {
            throw std::invalid_argument("cutoff table: row " + std::to_string(i + 1) + " has no cutoff_type");
        }
        rows.push_back(std::move(out));
    }
    return rows;
}

std::vector<CutoffRow> load_cutoff_table(const std::string& path) {
    return load_file(path, [](std::istream& in) { return read_cutoff_table(in); });
}

std::vector<RelationshipSpec> read_relationship_table(std::istream& input) {
    CsvTable table(input, "relationship table");
    const int source = table.required_column("source");
    const int target = table.required_column("target");
    const int effect = table.required_column("effect");
    const int confidence = table.optional_column("confidence");
    const int notes = table.optional_column("notes");

    std::vector<RelationshipSpec> rows;
    rows.reserve(table.rows());
    for (std::size_t i = 0; i < table.rows(); ++i) {
        const auto row = table.row(i);
        RelationshipSpec out;
        out.source = table.cell(row, source);
        out.target = table.cell(row, target);
        out.effect_text = table.cell(row, effect);
        out.effect = parse_edge_effect(out.effect_text);
        out.confidence = table.cell(row, confidence);
        out.notes = table.cell(row, notes);
        if (out.source.empty() || out.target.empty()) {
            continue;
        }
        rows.push_back(std::move(out));
    }
    return rows;
}

std::vector<RelationshipSpec> load_relationship_table(const std::string& path) {
    return load_file(path, [](std::istream& in) { return read_relationship_table(in); });
}

std::vector<RiskObservation> read_risk_observations(std::istream& input) {
    CsvTable table(input, "risk table");
    const int country = table.required_column("Country");
    const int population = table.required_column("Population");
    const int gender = table.required_column("Gender");
    const int micronutrient = table.required_column("Micronutrient");
    const int age = table.optional_column("Age");
    int risk = table.optional_column("True_Risk");
    if (risk < 0) {
        risk = table.required_column("P_Deficiency_Primary");
    }

    std::vector<RiskObservation> rows;
    rows.reserve(table.rows());
    for (std::size_t i = 0; i < table.rows(); ++i) {
        const auto row = table.row(i);
        RiskObservation out;
        out.country = table.cell(row, country);
        out.population = table.cell(row, population);
        out.gender = table.cell(row, gender);
        out.micronutrient = table.cell(row, micronutrient);
        out.age = parse_number(table.cell(row, age));
        // rows without a primary deficiency probability are dropped by RiskTable
        out.true_risk = parse_number(table.cell(row, risk)).value_or(std::numeric_limits<double>::quiet_NaN());
        rows.push_back(std::move(out));
    }
    return rows;
}

std::vector<RiskObservation> load_risk_observations(const std::string& path) {
    return load_file(path, [](std::istream& in) { return read_risk_observations(in); });
}

std::vector<FoodItem> read_food_table(std::istream& input) {
    CsvTable table(input, "food table");
    const int food = table.required_column("Food");
    const int category = table.required_column("Category");
    const int bundle = table.required_column("Bundle");
    const int serving = table.optional_column("Typical_serve_g");
    const int diet = table.optional_column("Diet_tag");

    std::vector<FoodItem> rows;
    rows.reserve(table.rows());
    for (std::size_t i = 0; i < table.rows(); ++i) {
        const auto row = table.row(i);
        FoodItem out;
        out.name = table.cell(row, food);
        out.category = table.cell(row, category);
        out.bundle = table.cell(row, bundle);
        out.serving_g = parse_number(table.cell(row, serving));
        out.diet_tag = table.cell(row, diet);
        if (out.name.empty() || out.bundle.empty()) {
            continue;
        }
        rows.push_back(std::move(out));
    }
    return rows;
}

std::vector<FoodItem> load_food_table(const std::string& path) {
    return load_file(path, [](std::istream& in) { return read_food_table(in); });
}

AliasTable read_alias_table(std::istream& input) {
    CsvTable table(input, "alias table");
    const int alias = table.required_column("alias");
    const int key = table.required_column("key");

    AliasTable aliases;
    for (std::size_t i = 0; i < table.rows(); ++i) {
        const auto row = table.row(i);
        aliases.add_alias(table.cell(row, alias), table.cell(row, key));
    }
    return aliases;
}

AliasTable load_alias_table(const std::string& path) {
    return load_file(path, [](std::istream& in) { return read_alias_table(in); });
}

std::vector<MarkerSpec> read_marker_specs(std::istream& input) {
    CsvTable table(input, "marker table");
    const int marker = table.required_column("marker");
    const int micronutrient = table.required_column("micronutrient");
    const int biomarker = table.required_column("biomarker");
    const int population_group = table.optional_column("population_group");
    const int unit = table.optional_column("unit");
    const int low_tier = table.optional_column("low_tier");
    const int high_tier = table.optional_column("high_tier");

    std::vector<MarkerSpec> specs;
    specs.reserve(table.rows());
    for (std::size_t i = 0; i < table.rows(); ++i) {
        const auto row = table.row(i);
        specs.push_back(MarkerSpec{table.cell(row, marker),
                                   table.cell(row, micronutrient),
                                   table.cell(row, biomarker),
                                   table.cell(row, population_group),
                                   table.cell(row, unit),
                                   table.cell(row, low_tier),
                                   table.cell(row, high_tier)});
    }
    return specs;
}

std::vector<MarkerSpec> load_marker_specs(const std::string& path) {
    return load_file(path, [](std::istream& in) { return read_marker_specs(in); });
}

}  // namespace hemovita
