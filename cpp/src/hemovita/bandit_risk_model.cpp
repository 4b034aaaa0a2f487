#include "hemovita/bandit_risk_model.hpp"

#include "hemovita/string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace hemovita {

namespace {

constexpr std::size_t kRewardWindow = 1000;

[[nodiscard]] std::unordered_map<std::string, int> index_categories(const std::vector<std::string>& sorted) {
    std::unordered_map<std::string, int> out;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        out.emplace(sorted[i], static_cast<int>(i));
    }
    return out;
}

[[nodiscard]] double lookup_code(const std::unordered_map<std::string, int>& codes, const std::string& value) {
    auto it = codes.find(trim(value));
    return it == codes.end() ? -1.0 : static_cast<double>(it->second);
}

void sort_by_risk(std::vector<RiskEstimate>& risks) {
    std::stable_sort(risks.begin(), risks.end(), [](const RiskEstimate& a, const RiskEstimate& b) { return a.risk > b.risk; });
}

}  // namespace

ContextEncoder::ContextEncoder(const RiskTable& table)
    : countries_(index_categories(table.countries())),
      populations_(index_categories(table.populations())),
      genders_(index_categories(table.genders())) {}

Eigen::VectorXd ContextEncoder::encode(const std::string& country,
                                       const std::string& population,
                                       const std::string& gender,
                                       double age) const {
    Eigen::VectorXd x(kDimension);
    x(0) = lookup_code(countries_, country);
    x(1) = lookup_code(populations_, population);
    x(2) = lookup_code(genders_, gender);
    x(3) = age / 100.0;
    return x;
}

Eigen::VectorXd ContextEncoder::encode(const RiskContext& context) const {
    return encode(context.country, context.population, context.gender, context.age);
}

bool ContextEncoder::knows_country(const std::string& country) const {
    return countries_.contains(trim(country));
}

Eigen::VectorXd LinUCBArm::theta() const {
    return A.ldlt().solve(b);
}

BanditRiskModel::BanditRiskModel(std::shared_ptr<const RiskTable> table, BanditOptions options)
    : table_(std::move(table)), options_(options) {
    if (!table_) {
        throw std::invalid_argument("bandit risk model requires a risk table");
    }
    if (!(options_.alpha >= 0.0)) {
        throw std::invalid_argument("exploration weight must be non-negative");
    }
    if (!std::isfinite(options_.default_age)) {
        throw std::invalid_argument("default age must be finite");
    }
    encoder_ = ContextEncoder(*table_);
    actions_ = table_->micronutrients();
    const auto d = static_cast<Eigen::Index>(ContextEncoder::kDimension);
    arms_.reserve(actions_.size());
    for (std::size_t i = 0; i < actions_.size(); ++i) {
        action_index_.emplace(actions_[i], i);
        arms_.push_back(LinUCBArm{Eigen::MatrixXd::Identity(d, d), Eigen::VectorXd::Zero(d)});
    }
    if (options_.verbose) {
        std::cout << "[risk_model] #contexts: " << table_->contexts().size()
                  << ", #actions (micronutrients): " << actions_.size() << std::endl;
    }
}

BanditRiskModel BanditRiskModel::train(std::size_t steps, std::uint64_t seed) const {
    BanditRiskModel trained(*this);
    const auto& contexts = table_->contexts();
    if (contexts.empty() || steps == 0) {
        return trained;
    }

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::size_t> pick_context(0, contexts.size() - 1);
    std::vector<double> recent;
    recent.reserve(kRewardWindow);
    std::size_t recent_pos = 0;

    for (std::size_t t = 1; t <= steps; ++t) {
        const RiskContext& context = contexts[pick_context(rng)];
        const Eigen::VectorXd x = trained.encoder_.encode(context);
        const std::string chosen = trained.select_action(x, table_->actions(context));

        std::bernoulli_distribution deficient(table_->true_risk(context, chosen));
        const double reward = deficient(rng) ? 1.0 : 0.0;
        trained.update(trained.action_index(chosen), x, reward);

        if (recent.size() < kRewardWindow) {
            recent.push_back(reward);
        } else {
            recent[recent_pos] = reward;
            recent_pos = (recent_pos + 1) % kRewardWindow;
        }
        if (options_.verbose && options_.progress_interval > 0 && t % options_.progress_interval == 0) {
            double sum = 0.0;
            for (double r : recent) {
                sum += r;
            }
            std::cout << "[risk_model] Step " << t << "/" << steps << " | recent avg reward (last " << kRewardWindow
                      << "): " << std::fixed << std::setprecision(3) << sum / static_cast<double>(recent.size())
                      << std::defaultfloat << std::endl;
        }
    }

    if (options_.verbose) {
        std::cout << "[risk_model] Training complete." << std::endl;
    }
    return trained;
}

BanditRiskModel BanditRiskModel::train() const {
    return train(options_.training_steps, options_.seed);
}

double BanditRiskModel::score(const Eigen::VectorXd& context, const std::string& action) const {
    const auto& arm = arms_[action_index(action)];
    const auto solver = arm.A.ldlt();
    const Eigen::VectorXd theta = solver.solve(arm.b);
    const Eigen::VectorXd a_inv_x = solver.solve(context);
    const double mean_reward = theta.dot(context);
    const double variance = std::max(0.0, context.dot(a_inv_x));
    return mean_reward + options_.alpha * std::sqrt(variance);
}

std::string BanditRiskModel::select_action(const Eigen::VectorXd& context, const std::vector<std::string>& allowed) const {
    if (allowed.empty()) {
        throw std::invalid_argument("no admissible actions for context");
    }
    const std::string* best = nullptr;
    double best_score = -std::numeric_limits<double>::infinity();
    for (const auto& action : allowed) {
        const double p = score(context, action);
        if (best == nullptr || p > best_score) {
            best_score = p;
            best = &action;
        }
    }
    return *best;
}

std::vector<RiskEstimate> BanditRiskModel::predict(const std::string& country,
                                                   const std::string& population,
                                                   const std::string& gender,
                                                   double age) const {
    const double query_age = std::isfinite(age) ? age : options_.default_age;
    const Eigen::VectorXd x = encoder_.encode(country, population, gender, query_age);
    std::vector<RiskEstimate> out;
    out.reserve(actions_.size());
    for (std::size_t i = 0; i < actions_.size(); ++i) {
        const double r_hat = arms_[i].theta().dot(x);
        out.push_back(RiskEstimate{actions_[i], std::isfinite(r_hat) ? std::clamp(r_hat, 0.0, 1.0) : 0.0});
    }
    sort_by_risk(out);
    return out;
}

std::vector<RiskEstimate> BanditRiskModel::fallback(const std::string& population, const std::string& gender) const {
    auto risks = table_->population_baseline(population, gender);
    if (risks.empty()) {
        risks = table_->global_baseline();
    }
    return risks;
}

RiskProfile BanditRiskModel::risk_profile(const std::string& country,
                                          const std::string& population,
                                          const std::string& gender,
                                          std::optional<double> age) const {
    RiskProfile profile;
    profile.country = trim(country);
    profile.population = trim(population).empty() ? std::string("All") : trim(population);
    profile.gender = trim(gender).empty() ? std::string("All") : trim(gender);
    profile.age = (age.has_value() && std::isfinite(*age)) ? *age : options_.default_age;
    profile.country_known = knows_country(profile.country);

    if (profile.country_known) {
        profile.risks = predict(profile.country, profile.population, profile.gender, profile.age);
    } else {
        profile.risks = fallback(profile.population, profile.gender);
        profile.fallback_used = true;
        profile.fallback_level = kFallbackLevel;
        profile.disclaimer = fallback_disclaimer(profile.population, profile.gender);
    }
    profile.summary = summarize_risks(profile.risks);
    return profile;
}

bool BanditRiskModel::knows_country(const std::string& country) const {
    return encoder_.knows_country(country);
}

const LinUCBArm& BanditRiskModel::arm(const std::string& action) const {
    return arms_[action_index(action)];
}

const std::vector<std::string>& BanditRiskModel::actions() const noexcept {
    return actions_;
}

const ContextEncoder& BanditRiskModel::encoder() const noexcept {
    return encoder_;
}

const BanditOptions& BanditRiskModel::options() const noexcept {
    return options_;
}

std::size_t BanditRiskModel::steps_trained() const noexcept {
    return steps_trained_;
}

double BanditRiskModel::mean_reward() const noexcept {
    return steps_trained_ == 0 ? 0.0 : total_reward_ / static_cast<double>(steps_trained_);
}

std::size_t BanditRiskModel::action_index(const std::string& action) const {
    auto it = action_index_.find(action);
    if (it == action_index_.end()) {
        throw std::out_of_range("unknown micronutrient action: " + action);
    }
    return it->second;
}

void BanditRiskModel::update(std::size_t action, const Eigen::VectorXd& context, double reward) {
    auto& arm = arms_[action];
    arm.A.noalias() += context * context.transpose();
    arm.b += reward * context;
    ++steps_trained_;
    total_reward_ += reward;
}

std::string summarize_risks(const std::vector<RiskEstimate>& risks, std::size_t top_n, double threshold) {
    if (risks.empty()) {
        return "No micronutrient risks could be estimated from demographic profile.";
    }
    auto sorted = risks;
    sort_by_risk(sorted);

    std::vector<RiskEstimate> top;
    for (const auto& entry : sorted) {
        if (top.size() >= top_n) {
            break;
        }
        if (entry.risk >= threshold) {
            top.push_back(entry);
        }
    }
    if (top.empty()) {
        return "No major micronutrient risks predicted from demographics alone.";
    }

    std::ostringstream out;
    out << "Highest predicted deficiency risks from demographics alone: ";
    out << std::fixed << std::setprecision(1);
    for (std::size_t i = 0; i < top.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << top[i].micronutrient << " (~" << top[i].risk * 100.0 << "%)";
    }
    out << ".";
    return out.str();
}

std::string fallback_disclaimer(const std::string& population, const std::string& gender) {
    return "Country-specific data was not available for this profile. "
           "Risk estimates are based on global patterns for individuals "
           "in the same population group (" +
           population + ", " + gender + ").";
}

}  // namespace hemovita
