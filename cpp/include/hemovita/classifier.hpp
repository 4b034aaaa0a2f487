#pragma once

#include "hemovita/nutrient_types.hpp"
#include "hemovita/reference_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace hemovita {

class Classifier {
public:
    explicit Classifier(std::shared_ptr<const ReferenceStore> store);

    [[nodiscard]] Label classify(const std::string& marker, std::optional<double> value) const;

    [[nodiscard]] LabelSet classify_panel(const LabPanel& labs) const;

    [[nodiscard]] const ReferenceStore& store() const noexcept;

private:
    std::shared_ptr<const ReferenceStore> store_;
};

}  // namespace hemovita
