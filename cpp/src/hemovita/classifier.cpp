#include "hemovita/classifier.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hemovita {

Classifier::Classifier(std::shared_ptr<const ReferenceStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("classifier requires a reference store");
    }
}

Label Classifier::classify(const std::string& marker, std::optional<double> value) const {
    if (!value.has_value() || std::isnan(*value)) {
        return Label::Unknown;
    }
    const auto range = store_->range(marker);
    if (!range.has_value()) {
        return Label::Unknown;
    }
    if (range->low.has_value() && *value < *range->low) {
        return Label::Low;
    }
    if (range->high.has_value() && *value > *range->high) {
        return Label::High;
    }
    return Label::Normal;
}

LabelSet Classifier::classify_panel(const LabPanel& labs) const {
    LabelSet labels;
    labels.reserve(labs.size());
    for (const auto& lab : labs) {
        const Label label = classify(lab.marker, lab.value);
        auto it = std::find_if(labels.begin(), labels.end(), [&](const MarkerLabel& entry) { return entry.marker == lab.marker; });
        if (it != labels.end()) {
            it->label = label;
            continue;
        }
        labels.push_back(MarkerLabel{lab.marker, label});
    }
    return labels;
}

const ReferenceStore& Classifier::store() const noexcept {
    return *store_;
}

}  // namespace hemovita
