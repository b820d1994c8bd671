#include "bayes_period/period_extraction.hpp"
#include "consensus.hpp"
#include "hypothesis.hpp"
#include "number_theory.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace bayes_period {
namespace instances {

namespace nt = number_theory;

void
ExtractionConfig::validate() const {
    if (top_k < 1) { throw std::invalid_argument("ExtractionConfig.top_k must be >= 1."); }
    if (max_multiple < 1) { throw std::invalid_argument("ExtractionConfig.max_multiple must be >= 1."); }
    if (!std::isfinite(phase_tolerance) || phase_tolerance <= 0.0 || phase_tolerance > 0.5) {
        throw std::invalid_argument("ExtractionConfig.phase_tolerance must lie in (0, 0.5].");
    }
    if (!std::isfinite(evidence_threshold) || evidence_threshold < 0.0 || evidence_threshold > 1.0) {
        throw std::invalid_argument("ExtractionConfig.evidence_threshold must lie in [0, 1].");
    }
    if (divisor_limit < 2) { throw std::invalid_argument("ExtractionConfig.divisor_limit must be >= 2."); }
    if (!std::isfinite(consistency_tolerance) || consistency_tolerance <= 0.0 || consistency_tolerance > 0.5) {
        throw std::invalid_argument("ExtractionConfig.consistency_tolerance must lie in (0, 0.5].");
    }
    if (recurrence_repeats < 1) { throw std::invalid_argument("ExtractionConfig.recurrence_repeats must be >= 1."); }
}

std::string
to_string(ExtractionMethod method) {
    switch (method) {
        case ExtractionMethod::DivisorSearch: return "divisor_search";
        case ExtractionMethod::Bayesian: return "bayesian";
        case ExtractionMethod::Hybrid: return "hybrid";
        case ExtractionMethod::None: break;
    }
    return "none";
}

double
phase_evidence(const MeasurementBatch &histogram, std::int64_t r, int phase_bits, double tolerance) {
    if (r < 1) { throw std::invalid_argument("phase_evidence: period must be >= 1."); }
    std::int64_t total = total_count(histogram);
    if (total == 0) { return 0.0; }

    const auto rd = static_cast<double>(r);
    std::int64_t evidence = 0;
    for (const auto &m : histogram) {
        double phase = std::ldexp(static_cast<double>(m.value), -phase_bits);
        // nearest k/r, wrapping k = r back to 0
        double nearest = std::round(phase * rd) / rd;
        if (circular_distance(phase, nearest) < tolerance) { evidence += m.count; }
    }
    return static_cast<double>(evidence) / static_cast<double>(total);
}

std::optional<std::int64_t>
divisor_search(const PeriodProblem &problem, const MeasurementBatch &histogram, const ExtractionConfig &config) {
    std::int64_t limit = std::min(config.divisor_limit, problem.modulus);
    for (std::int64_t r : nt::divisors(nt::euler_totient(problem.modulus))) {
        if (r <= 1) { continue; }
        if (r >= limit) { break; }
        if (!verify_period(problem, r)) { continue; }
        if (phase_evidence(histogram, r, problem.phase_bits, config.phase_tolerance) > config.evidence_threshold) {
            return r;
        }
    }
    return std::nullopt;
}

std::map<std::int64_t, double>
continued_fraction_votes(const PeriodProblem &problem,
                         const MeasurementBatch &histogram,
                         const ExtractionConfig &config,
                         std::int64_t *rejected) {
    MeasurementBatch ranked = histogram;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Measurement &x, const Measurement &y) { return x.count > y.count; });
    if (ranked.size() > static_cast<std::size_t>(config.top_k)) { ranked.resize(static_cast<std::size_t>(config.top_k)); }

    const std::int64_t n = problem.modulus;
    std::map<std::int64_t, double> votes;
    std::int64_t rejected_count = 0;

    for (const auto &m : ranked) {
        if (m.value <= 0 || m.count <= 0) { continue; }
        nt::Convergent c = nt::continued_fraction(m.value, problem.register_size(), n - 1);
        std::int64_t r = c.denominator;
        if (r <= 1 || r >= n) { continue; }

        // m = 1 credits the denominator itself, once
        for (int mult = 1; mult <= config.max_multiple; ++mult) {
            std::int64_t candidate = r * mult;
            if (candidate >= n) { break; }
            if (verify_period(problem, candidate)) {
                votes[candidate] += static_cast<double>(m.count) / mult;
            } else {
                ++rejected_count;
            }
        }
    }
    if (rejected) { *rejected = rejected_count; }
    return votes;
}

std::map<std::int64_t, double>
recurrence_votes(const PeriodProblem &problem, const MeasurementBatch &histogram, const ExtractionConfig &config) {
    RecurrenceConfig recurrence;
    recurrence.max_repeats_per_value = config.recurrence_repeats;
    recurrence.window = std::min(config.divisor_limit, problem.modulus);
    recurrence.value_tolerance = 3;

    std::map<std::int64_t, double> votes;
    for (const auto &[gap, tally] : recurrence_gaps(histogram, recurrence)) {
        if (gap > 1 && gap < problem.modulus && verify_period(problem, gap)) {
            votes[gap] = 2.0 * static_cast<double>(tally);
        }
    }
    return votes;
}

std::map<std::int64_t, double>
consistency_votes(const PeriodProblem &problem, const MeasurementBatch &histogram, const ExtractionConfig &config) {
    const std::int64_t limit = std::min(config.divisor_limit, problem.modulus);
    std::vector<std::int64_t> verified;
    for (std::int64_t t = 2; t < limit; ++t) {
        if (verify_period(problem, t)) { verified.push_back(t); }
    }

    MeasurementBatch ranked = histogram;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Measurement &x, const Measurement &y) { return x.count > y.count; });
    if (ranked.size() > static_cast<std::size_t>(config.top_k)) { ranked.resize(static_cast<std::size_t>(config.top_k)); }

    std::map<std::int64_t, double> votes;
    for (const auto &m : ranked) {
        if (m.value <= 0 || m.count <= 0) { continue; }
        double phase = std::ldexp(static_cast<double>(m.value), -problem.phase_bits);
        for (std::int64_t t : verified) {
            const auto td = static_cast<double>(t);
            if (circular_distance(phase, std::round(phase * td) / td) < config.consistency_tolerance) {
                votes[t] += 0.5 * static_cast<double>(m.count);
            }
        }
    }
    return votes;
}

std::map<std::int64_t, double>
hybrid_scores(const PeriodProblem &problem,
              const std::map<std::int64_t, double> &posterior,
              const std::map<std::int64_t, double> &votes,
              std::int64_t shots) {
    const double d = static_cast<double>(nt::divisors(nt::euler_totient(problem.modulus)).size());
    const double bayes_weight = std::min(0.8, 0.4 + 0.03 * d);
    const auto total = static_cast<double>(shots);

    std::map<std::int64_t, double> scores;
    for (std::int64_t r : candidate_periods(problem)) {
        auto p = posterior.find(r);
        auto v = votes.find(r);
        double bayes = p == posterior.end() ? 0.0 : p->second * total;
        double chaos = v == votes.end() ? 0.0 : v->second;
        scores[r] = bayes_weight * bayes + (1.0 - bayes_weight) * chaos;
    }
    // verified multiples of the order outside phi(N)'s divisors get a reduced share
    for (const auto &[r, v] : votes) {
        if (scores.find(r) == scores.end()) { scores[r] = 0.3 * v; }
    }
    return scores;
}

PeriodExtractionResult
extract_period(const PeriodProblem &problem,
               const MeasurementBatch &histogram,
               const NoiseModel &noise,
               const ExtractionConfig &config,
               const InferenceConfig &inference_config) {
    config.validate();
    noise.validate();
    candidate_periods(problem); // surfaces NoValidHypothesesError before any work

    PeriodExtractionResult result;
    const std::int64_t total = total_count(histogram);
    if (total == 0) { return result; }

    const bool verbose = inference_config.verbose;

    // Stage 1: direct divisor search, smallest period first
    if (auto r = divisor_search(problem, histogram, config)) {
        result.period = *r;
        result.confidence = phase_evidence(histogram, *r, problem.phase_bits, config.phase_tolerance);
        result.method = ExtractionMethod::DivisorSearch;
        if (verbose) {
            std::cout << "[extract_period] divisor search accepted r = " << *r << " (evidence "
                      << result.confidence << ")" << std::endl;
        }
        return result;
    }

    // Stage 2: Bayesian consensus with thresholds scaled by the richness of phi(N)
    PeriodFinder finder(inference_config);
    InferenceResult<std::int64_t> inference = finder.find_period(problem, histogram, noise);
    result.inference = inference;

    const double d = static_cast<double>(nt::divisors(nt::euler_totient(problem.modulus)).size());
    const double entropy_threshold = std::min(6.0, 3.0 + 0.15 * d);
    if (inference.best && verify_period(problem, *inference.best)) {
        double confidence_threshold = *inference.best < 50 ? 0.001 : std::max(0.05, 0.15 - 0.01 * d);
        if (inference.confidence > confidence_threshold && inference.entropy < entropy_threshold) {
            result.period = inference.best;
            result.confidence = inference.confidence;
            result.method = ExtractionMethod::Bayesian;
            if (verbose) {
                std::cout << "[extract_period] Bayesian stage accepted r = " << *inference.best << " (confidence "
                          << inference.confidence << ", entropy " << inference.entropy << ")" << std::endl;
            }
            return result;
        }
    }

    // Stage 3: hybrid of vote sources and the Bayesian posterior
    result.recurrence_votes = recurrence_votes(problem, histogram, config);
    result.continued_fraction_votes = continued_fraction_votes(problem, histogram, config, &result.rejected_candidates);
    result.consistency_votes = consistency_votes(problem, histogram, config);
    if (verbose && result.rejected_candidates > 0) {
        std::cout << "[extract_period] discarded " << result.rejected_candidates
                  << " unverified continued-fraction candidates" << std::endl;
    }

    std::map<std::int64_t, double> votes;
    for (const auto *source : { &result.recurrence_votes, &result.continued_fraction_votes, &result.consistency_votes }) {
        for (const auto &[r, v] : *source) { votes[r] += v; }
    }
    result.hybrid_scores = hybrid_scores(problem, inference.posterior, votes, total);

    std::optional<std::int64_t> best;
    double best_score = 0.0;
    for (const auto &[r, score] : result.hybrid_scores) {
        if (score > best_score && verify_period(problem, r)) {
            best_score = score;
            best = r;
        }
    }
    if (best) {
        result.period = best;
        result.confidence = std::min(1.0, best_score / static_cast<double>(total));
        result.method = ExtractionMethod::Hybrid;

        auto supports = [&best](const std::map<std::int64_t, double> &m) {
            auto it = m.find(*best);
            return it != m.end() && it->second > 0.0;
        };
        if (supports(inference.posterior)) { result.contributing_sources.push_back("bayesian"); }
        if (supports(result.recurrence_votes)) { result.contributing_sources.push_back("recurrence"); }
        if (supports(result.continued_fraction_votes)) { result.contributing_sources.push_back("continued_fraction"); }
        if (supports(result.consistency_votes)) { result.contributing_sources.push_back("consistency"); }
        if (verbose) {
            std::cout << "[extract_period] hybrid stage accepted r = " << *best << " (score " << best_score << ")"
                      << std::endl;
        }
    }
    return result;
}

std::optional<std::pair<std::int64_t, std::int64_t>>
factors_from_period(std::int64_t modulus, std::int64_t base, std::int64_t period) {
    if (modulus < 4 || period < 1) { return std::nullopt; }

    std::vector<std::int64_t> trials{ period };
    if (period % 2 == 0) { trials.push_back(period / 2); }
    trials.push_back(period * 2);
    for (std::int64_t d = 2; d <= 10; ++d) {
        if (period % d == 0) { trials.push_back(period / d); }
    }

    for (std::int64_t t : trials) {
        if (t <= 0 || t % 2 != 0) { continue; }
        std::int64_t x = nt::mod_pow(base, t / 2, modulus);
        if (x == 1 || x == modulus - 1) { continue; }
        for (std::int64_t f : { nt::gcd(x - 1, modulus), nt::gcd(x + 1, modulus) }) {
            if (f > 1 && f < modulus) {
                std::int64_t other = modulus / f;
                return std::make_pair(std::min(f, other), std::max(f, other));
            }
        }
    }
    return std::nullopt;
}

std::vector<std::int64_t>
rank_bases_by_smoothness(std::int64_t modulus, std::size_t max_bases) {
    if (modulus < 3) { return {}; }
    const std::vector<std::int64_t> phi_divisors = nt::divisors(nt::euler_totient(modulus));

    auto score = [&phi_divisors](std::int64_t a) {
        std::int64_t rest = a;
        std::int64_t s = 0;
        for (std::int64_t p : { 2, 3, 5, 7 }) {
            while (rest % p == 0) {
                rest /= p;
                s += 100;
            }
        }
        if (rest > 1) { s -= rest * 50; }
        for (std::int64_t d : phi_divisors) {
            if (d == a) { s += 200; }
            if (d % a == 0) { s += 50; }
        }
        return s;
    };

    std::vector<std::pair<std::int64_t, std::int64_t>> scored; // (base, score)
    for (std::int64_t a = 2; a < std::min<std::int64_t>(modulus, 50); ++a) {
        if (nt::gcd(a, modulus) == 1) { scored.emplace_back(a, score(a)); }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto &x, const auto &y) { return x.second > y.second; });

    std::vector<std::int64_t> bases;
    for (const auto &entry : scored) {
        if (bases.size() >= max_bases) { break; }
        bases.push_back(entry.first);
    }
    return bases;
}

} // namespace instances
} // namespace bayes_period
