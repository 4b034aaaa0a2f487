#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "hemovita/engine.hpp"

#include <string>
#include <vector>

namespace py = pybind11;
using namespace hemovita;

namespace {

// Keeps the dict's insertion order, which drives scheduling order.
LabPanel to_panel(const py::dict& labs) {
    LabPanel panel;
    for (const auto& item : labs) {
        LabValue lab;
        lab.marker = py::cast<std::string>(item.first);
        if (!item.second.is_none()) {
            lab.value = py::cast<double>(item.second);
        }
        panel.push_back(std::move(lab));
    }
    return panel;
}

// Keeps panel order.
py::dict labels_to_dict(const LabelSet& labels) {
    py::dict out;
    for (const auto& entry : labels) {
        out[py::str(entry.marker)] = std::string(to_string(entry.label));
    }
    return out;
}

// Slots in day order.
py::dict plan_to_dict(const SupplementPlan& plan) {
    py::dict out;
    for (Slot slot : kSlots) {
        out[py::str(std::string(to_string(slot)))] = plan.at(slot);
    }
    return out;
}

// Accepts the dict produced by plan_to_dict; missing slots are empty.
SupplementPlan plan_from_dict(const py::dict& plan) {
    SupplementPlan out;
    for (Slot slot : kSlots) {
        const py::str name(std::string(to_string(slot)));
        if (plan.contains(name)) {
            out.at(slot) = py::cast<std::vector<std::string>>(plan[name]);
        }
    }
    return out;
}

}  // namespace

PYBIND11_MODULE(_hemovita, m) {
    m.doc() = "hemovita python bindings";

    py::enum_<Label>(m, "Label")
        .value("Low", Label::Low)
        .value("Normal", Label::Normal)
        .value("High", Label::High)
        .value("Unknown", Label::Unknown)
        .export_values();

    py::enum_<Slot>(m, "Slot")
        .value("Morning", Slot::Morning)
        .value("Midday", Slot::Midday)
        .value("Evening", Slot::Evening)
        .export_values();

    py::class_<BanditOptions>(m, "BanditOptions")
        .def(py::init<>())
        .def_readwrite("alpha", &BanditOptions::alpha)
        .def_readwrite("training_steps", &BanditOptions::training_steps)
        .def_readwrite("seed", &BanditOptions::seed)
        .def_readwrite("default_age", &BanditOptions::default_age)
        .def_readwrite("progress_interval", &BanditOptions::progress_interval)
        .def_readwrite("verbose", &BanditOptions::verbose);

    py::class_<ScheduleOptions>(m, "ScheduleOptions")
        .def(py::init<>())
        .def_readwrite("verbose", &ScheduleOptions::verbose);

    py::class_<EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_static("from_environment", &EngineConfig::from_environment)
        .def_readwrite("data_dir", &EngineConfig::data_dir)
        .def_readwrite("cutoff_file", &EngineConfig::cutoff_file)
        .def_readwrite("relationship_file", &EngineConfig::relationship_file)
        .def_readwrite("risk_file", &EngineConfig::risk_file)
        .def_readwrite("food_file", &EngineConfig::food_file)
        .def_readwrite("alias_file", &EngineConfig::alias_file)
        .def_readwrite("marker_file", &EngineConfig::marker_file)
        .def_readwrite("risk_data_path", &EngineConfig::risk_data_path)
        .def_readwrite("bandit", &EngineConfig::bandit)
        .def_readwrite("schedule", &EngineConfig::schedule)
        .def_readwrite("max_hops", &EngineConfig::max_hops)
        .def_readwrite("verbose", &EngineConfig::verbose);

    py::class_<RiskEstimate>(m, "RiskEstimate")
        .def(py::init<>())
        .def_readwrite("micronutrient", &RiskEstimate::micronutrient)
        .def_readwrite("risk", &RiskEstimate::risk);

    py::class_<RiskProfile>(m, "RiskProfile")
        .def(py::init<>())
        .def_readwrite("risks", &RiskProfile::risks)
        .def_readwrite("summary", &RiskProfile::summary)
        .def_readwrite("disclaimer", &RiskProfile::disclaimer)
        .def_readwrite("fallback_used", &RiskProfile::fallback_used)
        .def_readwrite("country_known", &RiskProfile::country_known)
        .def_readwrite("fallback_level", &RiskProfile::fallback_level)
        .def_readwrite("country", &RiskProfile::country)
        .def_readwrite("population", &RiskProfile::population)
        .def_readwrite("gender", &RiskProfile::gender)
        .def_readwrite("age", &RiskProfile::age);

    py::class_<RiskSummary>(m, "RiskSummary")
        .def(py::init<>())
        .def_readwrite("overall_risk", &RiskSummary::overall_risk)
        .def_readwrite("bucket", &RiskSummary::bucket)
        .def_readwrite("high_risk", &RiskSummary::high_risk)
        .def_readwrite("profile", &RiskSummary::profile)
        .def_readwrite("text", &RiskSummary::text);

    py::class_<FoodItem>(m, "FoodItem")
        .def(py::init<>())
        .def_readwrite("name", &FoodItem::name)
        .def_readwrite("category", &FoodItem::category)
        .def_readwrite("bundle", &FoodItem::bundle)
        .def_readwrite("serving_g", &FoodItem::serving_g)
        .def_readwrite("diet_tag", &FoodItem::diet_tag);

    py::class_<FoodSuggestion>(m, "FoodSuggestion")
        .def(py::init<>())
        .def_readwrite("bundle", &FoodSuggestion::bundle)
        .def_readwrite("foods", &FoodSuggestion::foods);

    py::class_<TargetExplanation>(m, "TargetExplanation")
        .def(py::init<>())
        .def_readwrite("target", &TargetExplanation::target)
        .def_readwrite("paths", &TargetExplanation::paths);

    py::class_<PatientInfo>(m, "PatientInfo")
        .def(py::init<>())
        .def_readwrite("age", &PatientInfo::age)
        .def_readwrite("sex", &PatientInfo::sex)
        .def_readwrite("pregnant", &PatientInfo::pregnant)
        .def_readwrite("country", &PatientInfo::country)
        .def_readwrite("notes", &PatientInfo::notes)
        .def_readwrite("population", &PatientInfo::population);

    py::class_<ReportResponse>(m, "ReportResponse")
        .def_property_readonly("labels", [](const ReportResponse& r) { return labels_to_dict(r.labels); })
        .def_property_readonly("supplement_plan", [](const ReportResponse& r) { return plan_to_dict(r.plan); })
        .def_property_readonly("forced", [](const ReportResponse& r) { return r.plan.forced; })
        .def_readonly("foods", &ReportResponse::foods)
        .def_readonly("network_notes", &ReportResponse::network_notes)
        .def_readonly("explanations", &ReportResponse::explanations)
        .def_readonly("report_text", &ReportResponse::report_text)
        .def_readonly("risk", &ReportResponse::risk)
        .def_readonly("risk_error", &ReportResponse::risk_error);

    py::class_<DecisionEngine, std::shared_ptr<DecisionEngine>>(m, "DecisionEngine")
        .def(py::init([](const EngineConfig& config) {
                 return std::make_shared<DecisionEngine>(EngineTables::load(config), config);
             }),
             py::arg("config") = EngineConfig{})
        .def("classify_panel",
             [](const DecisionEngine& engine, const py::dict& labs) { return labels_to_dict(engine.classify_panel(to_panel(labs))); })
        .def("schedule",
             [](const DecisionEngine& engine, const py::dict& labs) {
                 return plan_to_dict(engine.schedule(engine.classify_panel(to_panel(labs))));
             })
        .def("explain",
             [](const DecisionEngine& engine, const py::dict& labs) { return engine.explain(engine.classify_panel(to_panel(labs))); })
        .def("network_notes",
             [](const DecisionEngine& engine, const py::dict& plan) { return engine.network_notes(plan_from_dict(plan)); },
             py::arg("plan"))
        .def("risk_profile", &DecisionEngine::risk_profile,
             py::arg("country"), py::arg("population"), py::arg("gender"), py::arg("age") = py::none())
        .def("suggest_foods",
             [](const DecisionEngine& engine, const py::dict& labs, const std::string& diet_filter, std::size_t top_n) {
                 return engine.suggest_foods(engine.classify_panel(to_panel(labs)), diet_filter, top_n);
             },
             py::arg("labs"), py::arg("diet_filter") = std::string(), py::arg("top_n") = kDefaultFoodsPerBundle)
        .def("build_report",
             [](const DecisionEngine& engine, const py::dict& labs, const PatientInfo& patient, const std::string& diet_filter) {
                 return engine.build_report(ReportRequest{to_panel(labs), patient, diet_filter});
             },
             py::arg("labs"), py::arg("patient"), py::arg("diet_filter") = std::string())
        .def_property_readonly("network_available", &DecisionEngine::network_available);

    m.def("risk_bucket", &risk_bucket);
    m.def("summarize_risks", &summarize_risks,
          py::arg("risks"), py::arg("top_n") = kSummaryTopN, py::arg("threshold") = kSummaryRiskThreshold);
}
