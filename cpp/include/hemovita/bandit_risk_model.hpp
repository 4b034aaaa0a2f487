#pragma once

#include "hemovita/nutrient_types.hpp"
#include "hemovita/risk_table.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hemovita {

inline constexpr double kSummaryRiskThreshold = 0.15;
inline constexpr std::size_t kSummaryTopN = 3;
inline constexpr const char* kFallbackLevel = "population_gender_or_global";

struct BanditOptions {
    double alpha{1.0};                    // exploration weight of the UCB bonus
    std::size_t training_steps{30000};
    std::uint64_t seed{42};
    double default_age{kDefaultRiskAge};  // age used when a query or row has none
    std::size_t progress_interval{10000};
    bool verbose{false};
};

// (country, population, gender, age) -> [country code, population code, gender code, age / 100].
// Codes index the sorted categories seen in training; unseen values encode as -1.
class ContextEncoder {
public:
    static constexpr std::size_t kDimension = 4;

    ContextEncoder() = default;

    explicit ContextEncoder(const RiskTable& table);

    [[nodiscard]] Eigen::VectorXd encode(const std::string& country,
                                         const std::string& population,
                                         const std::string& gender,
                                         double age) const;

    [[nodiscard]] Eigen::VectorXd encode(const RiskContext& context) const;

    [[nodiscard]] bool knows_country(const std::string& country) const;

private:
    std::unordered_map<std::string, int> countries_;
    std::unordered_map<std::string, int> populations_;
    std::unordered_map<std::string, int> genders_;
};

struct LinUCBArm {
    Eigen::MatrixXd A;  // ridge design matrix
    Eigen::VectorXd b;

    [[nodiscard]] Eigen::VectorXd theta() const;
};

struct RiskProfile {
    std::vector<RiskEstimate> risks;  // sorted by risk, descending
    std::string summary;
    std::string disclaimer;
    bool fallback_used{false};
    bool country_known{false};
    std::string fallback_level;
    std::string country;
    std::string population;
    std::string gender;
    double age{kDefaultRiskAge};
};

// Anything that can turn a demographic profile into deficiency risks.
class RiskProfiler {
public:
    virtual ~RiskProfiler() = default;

    [[nodiscard]] virtual RiskProfile risk_profile(const std::string& country,
                                                   const std::string& population,
                                                   const std::string& gender,
                                                   std::optional<double> age) const = 0;
};

// LinUCB contextual bandit over micronutrients. A model is trained once through
// train(), which returns a new model; every other member only reads the
// parameters, so a trained model can be shared between threads.
class BanditRiskModel final : public RiskProfiler {
public:
    explicit BanditRiskModel(std::shared_ptr<const RiskTable> table, BanditOptions options = {});

    [[nodiscard]] BanditRiskModel train(std::size_t steps, std::uint64_t seed) const;

    [[nodiscard]] BanditRiskModel train() const;

    [[nodiscard]] double score(const Eigen::VectorXd& context, const std::string& action) const;

    [[nodiscard]] std::string select_action(const Eigen::VectorXd& context, const std::vector<std::string>& allowed) const;

    [[nodiscard]] std::vector<RiskEstimate> predict(const std::string& country,
                                                    const std::string& population,
                                                    const std::string& gender,
                                                    double age) const;

    [[nodiscard]] std::vector<RiskEstimate> fallback(const std::string& population, const std::string& gender) const;

    [[nodiscard]] RiskProfile risk_profile(const std::string& country,
                                           const std::string& population,
                                           const std::string& gender,
                                           std::optional<double> age) const override;

    [[nodiscard]] bool knows_country(const std::string& country) const;

    [[nodiscard]] const LinUCBArm& arm(const std::string& action) const;

    [[nodiscard]] const std::vector<std::string>& actions() const noexcept;

    [[nodiscard]] const ContextEncoder& encoder() const noexcept;

    [[nodiscard]] const BanditOptions& options() const noexcept;

    [[nodiscard]] std::size_t steps_trained() const noexcept;

    [[nodiscard]] double mean_reward() const noexcept;

private:
    [[nodiscard]] std::size_t action_index(const std::string& action) const;

    void update(std::size_t action, const Eigen::VectorXd& context, double reward);

    std::shared_ptr<const RiskTable> table_;
    BanditOptions options_;
    ContextEncoder encoder_;
    std::vector<std::string> actions_;
    std::unordered_map<std::string, std::size_t> action_index_;
    std::vector<LinUCBArm> arms_;
    std::size_t steps_trained_{0};
    double total_reward_{0.0};
};

[[nodiscard]] std::string summarize_risks(const std::vector<RiskEstimate>& risks,
                                          std::size_t top_n = kSummaryTopN,
                                          double threshold = kSummaryRiskThreshold);

[[nodiscard]] std::string fallback_disclaimer(const std::string& population, const std::string& gender);

}  // namespace hemovita
