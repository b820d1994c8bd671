#ifndef POSTERIOR_HPP
#define POSTERIOR_HPP

#include "hypothesis.hpp"
#include "measurement.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bayes_period {

/**
 * @brief Shannon entropy -sum p log2 p over the strictly positive entries.
 */
double
shannon_entropy(const Eigen::VectorXd &probabilities);

/**
 * @brief Rescales @p values to sum to one.
 *
 * @return false if the total is zero or non-finite; @p values is then set to all zeros.
 */
bool
normalize_in_place(Eigen::VectorXd &values);

/**
 * @brief Index of the largest strictly positive entry, first one on ties.
 */
std::optional<Eigen::Index>
argmax_positive(const Eigen::VectorXd &values);

/**
 * @brief Probability mass over a hypothesis set, indexed by hypothesis position.
 *
 * Starts from the normalized priors. Every call to update() applies the conservative
 * multiplicative rule p_i <- p_i * (1 + w * L_i(m) * strength) for each measurement m of the
 * batch, with w the measurement's share of the batch, and renormalizes. If the mass collapses
 * (total zero or non-finite) the posterior is left at all zeros and is_degenerate() turns true.
 *
 * The hypothesis set is held by reference and must outlive the posterior.
 */
template<typename T>
class Posterior {
  public:
    explicit Posterior(const HypothesisSet<T> &hypotheses)
      : hypotheses_(hypotheses)
      , probabilities_(static_cast<Eigen::Index>(hypotheses.size()))
      , degenerate_(false) {
        check_hypotheses(hypotheses_);
        valid_.reserve(hypotheses_.size());
        for (std::size_t i = 0; i < hypotheses_.size(); ++i) {
            probabilities_(static_cast<Eigen::Index>(i)) = hypotheses_[i].prior;
            valid_.push_back(hypotheses_[i].is_valid());
        }
        normalize_in_place(probabilities_);
    }

    /**
     * @brief Folds one batch of measurements into the posterior.
     *
     * A batch whose counts sum to zero carries no evidence and leaves the posterior untouched.
     *
     * @throws std::invalid_argument on negative counts or a likelihood that is negative or
     *         non-finite.
     */
    void update(const MeasurementBatch &batch, const NoiseModel &noise, double update_strength) {
        std::int64_t total = total_count(batch);
        if (total == 0 || degenerate_) { return; }

        for (const auto &m : batch) {
            if (m.count == 0) { continue; }
            double weight = static_cast<double>(m.count) / static_cast<double>(total);
            for (std::size_t i = 0; i < hypotheses_.size(); ++i) {
                double likelihood = hypotheses_[i].likelihood(m, noise);
                if (!std::isfinite(likelihood) || likelihood < 0.0) {
                    throw std::invalid_argument("Likelihood returned " + std::to_string(likelihood) +
                                                " for outcome " + std::to_string(m.value) + ".");
                }
                probabilities_(static_cast<Eigen::Index>(i)) *= 1.0 + weight * likelihood * update_strength;
            }
        }

        degenerate_ = !normalize_in_place(probabilities_);
    }

    /**
     * @brief The hypothesis carrying the most mass among those that pass validation.
     * @return std::nullopt if no valid hypothesis has positive mass.
     */
    std::optional<std::size_t> best_valid_index() const {
        std::optional<std::size_t> best;
        double max_prob = 0.0;
        for (std::size_t i = 0; i < hypotheses_.size(); ++i) {
            double p = probabilities_(static_cast<Eigen::Index>(i));
            if (valid_[i] && p > max_prob) {
                max_prob = p;
                best = i;
            }
        }
        return best;
    }

    /**
     * @brief The hypothesis carrying the most mass, validated or not.
     */
    std::optional<std::size_t> top_index() const {
        auto idx = argmax_positive(probabilities_);
        if (!idx) { return std::nullopt; }
        return static_cast<std::size_t>(*idx);
    }

    double entropy() const { return shannon_entropy(probabilities_); }
    double total_mass() const { return probabilities_.sum(); }
    bool is_degenerate() const { return degenerate_; }
    bool is_valid(std::size_t index) const { return valid_.at(index); }
    std::size_t size() const { return hypotheses_.size(); }

    const Eigen::VectorXd &probabilities() const { return probabilities_; }
    const HypothesisSet<T> &hypotheses() const { return hypotheses_; }

    /**
     * @brief Candidate -> probability view for reporting.
     */
    std::map<T, double> to_map() const {
        std::map<T, double> out;
        for (std::size_t i = 0; i < hypotheses_.size(); ++i) {
            out[hypotheses_[i].candidate] += probabilities_(static_cast<Eigen::Index>(i));
        }
        return out;
    }

  private:
    const HypothesisSet<T> &hypotheses_;
    Eigen::VectorXd probabilities_;
    std::vector<bool> valid_; // validate() evaluated once per call
    bool degenerate_;
};

} // namespace bayes_period

#endif // POSTERIOR_HPP
