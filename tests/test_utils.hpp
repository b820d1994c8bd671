#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include <Eigen/Dense> // Ensure Eigen is included early

#include "hypothesis.hpp"
#include "measurement.hpp"
#include <algorithm> // For std::find
#include <cmath>
#include <cstdint>
#include <gtest/gtest.h>
#include <map>
#include <random> // For std::mt19937, std::uniform_real_distribution
#include <stdexcept>
#include <vector>

namespace bayes_period {
namespace test_utils {

// Turns a value -> count map into a histogram, ascending by value (deterministic order).
inline MeasurementBatch
histogram_from_map(const std::map<std::int64_t, std::int64_t> &counts) {
    MeasurementBatch batch;
    for (const auto &[value, count] : counts) { batch.emplace_back(value, count); }
    return batch;
}

// Histogram of the worked order-finding example N = 21, a = 2, 8-bit register: peaks at
// round(k * 256 / 6) for k = 0..5, each observed @p count times.
inline MeasurementBatch
order_six_histogram(std::int64_t count = 100) {
    return histogram_from_map({ { 0, count }, { 42, count }, { 85, count }, { 128, count }, { 170, count }, { 213, count } });
}

/**
 * @brief Seeded stand-in for a phase register measured after order finding.
 *
 * With probability 1 - noise_rate a shot lands on round(k / r * 2^bits) for a uniformly drawn
 * k in [0, r), shifted by a dephasing offset in {-1, 0, 0, +1}; otherwise it is uniform over the
 * register.
 */
inline MeasurementBatch
synthetic_period_histogram(std::int64_t r, int bits, std::int64_t shots, double noise_rate, unsigned int seed) {
    const std::int64_t size = std::int64_t{ 1 } << bits;
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<std::int64_t> pick_k(0, r - 1);
    std::uniform_int_distribution<std::int64_t> pick_any(0, size - 1);
    std::uniform_int_distribution<int> dephase(0, 3);
    const int offsets[4] = { -1, 0, 0, 1 };

    std::map<std::int64_t, std::int64_t> counts;
    for (std::int64_t s = 0; s < shots; ++s) {
        std::int64_t value;
        if (coin(gen) >= noise_rate) {
            auto peak = static_cast<std::int64_t>(
              std::llround(std::ldexp(static_cast<double>(pick_k(gen)) / static_cast<double>(r), bits)));
            value = ((peak + offsets[dephase(gen)]) % size + size) % size;
        } else {
            value = pick_any(gen);
        }
        ++counts[value];
    }
    return histogram_from_map(counts);
}

// A shot-ordered stream: every batch is drawn independently with its own seed.
inline std::vector<MeasurementBatch>
synthetic_period_batches(std::int64_t r, int bits, int n_batches, std::int64_t batch_size, double noise_rate,
                         unsigned int seed) {
    std::vector<MeasurementBatch> batches;
    for (int i = 0; i < n_batches; ++i) {
        batches.push_back(synthetic_period_histogram(r, bits, batch_size, noise_rate, seed + static_cast<unsigned int>(i)));
    }
    return batches;
}

// Phase-estimation register: signal at round(phase * 2^bits) with the same dephasing model.
inline MeasurementBatch
synthetic_phase_histogram(double phase, int bits, std::int64_t shots, double noise_rate, unsigned int seed) {
    const std::int64_t size = std::int64_t{ 1 } << bits;
    const std::int64_t peak = static_cast<std::int64_t>(std::llround(std::ldexp(phase, bits))) % size;
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<std::int64_t> pick_any(0, size - 1);
    std::uniform_int_distribution<int> dephase(0, 3);
    const int offsets[4] = { -1, 0, 0, 1 };

    std::map<std::int64_t, std::int64_t> counts;
    for (std::int64_t s = 0; s < shots; ++s) {
        std::int64_t value =
          coin(gen) >= noise_rate ? ((peak + offsets[dephase(gen)]) % size + size) % size : pick_any(gen);
        ++counts[value];
    }
    return histogram_from_map(counts);
}

// Search outcomes: target with probability (1 - noise_rate) * p_success, otherwise a uniform item.
inline MeasurementBatch
synthetic_search_histogram(const std::vector<std::int64_t> &database,
                           std::int64_t target,
                           double p_success,
                           std::int64_t shots,
                           double noise_rate,
                           unsigned int seed) {
    if (std::find(database.begin(), database.end(), target) == database.end()) {
        throw std::invalid_argument("synthetic_search_histogram: target not in database");
    }
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<std::size_t> pick_any(0, database.size() - 1);

    std::map<std::int64_t, std::int64_t> counts;
    for (std::int64_t s = 0; s < shots; ++s) {
        bool hit = coin(gen) >= noise_rate && coin(gen) < p_success;
        ++counts[hit ? target : database[pick_any(gen)]];
    }
    return histogram_from_map(counts);
}

// Posterior-normalization invariant: total is 1 within tolerance, or exactly 0 when degenerate.
inline void
EXPECT_NORMALIZED_OR_DEGENERATE(const Eigen::VectorXd &p, double tol = 1e-9) {
    double total = p.sum();
    if (total == 0.0) { return; }
    EXPECT_NEAR(total, 1.0, tol);
    EXPECT_GE(p.minCoeff(), 0.0);
}

inline double
map_total(const std::map<std::int64_t, double> &m) {
    double total = 0.0;
    for (const auto &entry : m) { total += entry.second; }
    return total;
}

// Minimal hand-built hypothesis set: candidate c explains outcome c perfectly and nothing else.
inline HypothesisSet<std::int64_t>
indicator_hypotheses(const std::vector<std::int64_t> &candidates) {
    HypothesisSet<std::int64_t> hypotheses;
    const double uniform = 1.0 / static_cast<double>(candidates.size());
    for (std::int64_t c : candidates) {
        Hypothesis<std::int64_t> h;
        h.candidate = c;
        h.prior = 1.0;
        h.likelihood = [c, uniform](const Measurement &m, const NoiseModel &noise) {
            return mixture_likelihood(m.value == c ? 1.0 : 0.0, noise, uniform);
        };
        hypotheses.push_back(h);
    }
    return hypotheses;
}

} // namespace test_utils
} // namespace bayes_period

#endif // TEST_UTILS_HPP
