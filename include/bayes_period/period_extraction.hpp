#ifndef PERIOD_EXTRACTION_HPP
#define PERIOD_EXTRACTION_HPP

#include "../inference_config.hpp"
#include "../inference_result.hpp"
#include "../measurement.hpp"
#include "period_finding.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bayes_period {
namespace instances {

/**
 * @brief Tuning knobs of the period extraction pipeline.
 */
struct ExtractionConfig {
    int top_k = 50;                   // most frequent outcomes fed to continued fractions
    int max_multiple = 3;             // multiples r, 2r, ... of each convergent denominator tried
    double phase_tolerance = 0.02;    // distance to k/r that still counts as evidence
    double evidence_threshold = 0.20; // share of mass required by the divisor search
    std::int64_t divisor_limit = 1000; // divisor search covers r < min(divisor_limit, N)
    double consistency_tolerance = 0.01;  // phase distance for a direct period-consistency vote
    std::int64_t recurrence_repeats = 100; // copies of one outcome in the recurrence sequence

    /**
     * @throws std::invalid_argument if a field is out of range.
     */
    void validate() const;
};

enum class ExtractionMethod { None, DivisorSearch, Bayesian, Hybrid };

std::string
to_string(ExtractionMethod method);

/**
 * @brief Outcome of extract_period.
 *
 * A present @c period has always passed base^period = 1 (mod N).
 */
struct PeriodExtractionResult {
    std::optional<std::int64_t> period;
    double confidence = 0.0;
    ExtractionMethod method = ExtractionMethod::None;
    std::optional<InferenceResult<std::int64_t>> inference; // set once the Bayesian stage ran

    // Hybrid stage only; vote maps hold verified candidates only
    std::map<std::int64_t, double> recurrence_votes;
    std::map<std::int64_t, double> continued_fraction_votes;
    std::map<std::int64_t, double> consistency_votes;
    std::map<std::int64_t, double> hybrid_scores;
    std::int64_t rejected_candidates = 0;  // convergent candidates that failed verification
    std::vector<std::string> contributing_sources; // sources with support for the returned period
};

/**
 * @brief Share of the histogram's mass lying within @p tolerance of some k/r on the unit circle.
 * @return 0 for an empty histogram.
 */
double
phase_evidence(const MeasurementBatch &histogram, std::int64_t r, int phase_bits, double tolerance);

/**
 * @brief Smallest verified divisor r of phi(N), 1 < r < min(divisor_limit, N), whose phase evidence
 *        exceeds the evidence threshold.
 */
std::optional<std::int64_t>
divisor_search(const PeriodProblem &problem, const MeasurementBatch &histogram, const ExtractionConfig &config);

/**
 * @brief Continued-fraction votes for verified period candidates.
 *
 * For each of the top_k most frequent non-zero outcomes, the convergent of value / 2^bits with
 * denominator below N proposes r; r * m for m = 1..max_multiple is credited count / m when it passes
 * verification and is counted in @p rejected otherwise.
 */
std::map<std::int64_t, double>
continued_fraction_votes(const PeriodProblem &problem,
                         const MeasurementBatch &histogram,
                         const ExtractionConfig &config,
                         std::int64_t *rejected = nullptr);

/**
 * @brief Recurrence votes: repeat gaps of the expanded outcome sequence read as periods.
 *
 * The sequence repeats each outcome min(count, recurrence_repeats) times; gaps below
 * min(divisor_limit, N) between outcomes less than 3 apart are tallied. Every verified gap
 * 1 < g < N is credited twice its tally.
 */
std::map<std::int64_t, double>
recurrence_votes(const PeriodProblem &problem, const MeasurementBatch &histogram, const ExtractionConfig &config);

/**
 * @brief Direct period-consistency votes.
 *
 * For each of the top_k most frequent non-zero outcomes, every verified t in
 * [2, min(divisor_limit, N)) whose nearest k/t lies within consistency_tolerance of the outcome's
 * phase is credited half the outcome's count.
 */
std::map<std::int64_t, double>
consistency_votes(const PeriodProblem &problem, const MeasurementBatch &histogram, const ExtractionConfig &config);

/**
 * @brief Blends the Bayesian posterior with the summed vote maps.
 *
 * With d = |divisors(phi(N))| the Bayesian weight is w = min(0.8, 0.4 + 0.03 d). A candidate
 * period r scores w * posterior(r) * shots + (1 - w) * votes(r); a voted period outside the
 * candidate set scores 0.3 * votes(r).
 *
 * @param posterior Bayesian posterior over candidate periods; may be empty.
 * @param votes Summed votes of all sources.
 */
std::map<std::int64_t, double>
hybrid_scores(const PeriodProblem &problem,
              const std::map<std::int64_t, double> &posterior,
              const std::map<std::int64_t, double> &votes,
              std::int64_t shots);

/**
 * @brief Recovers the period from a phase histogram.
 *
 * Stages, first success wins: divisor search, Bayesian consensus under phi(N)-adaptive thresholds,
 * then a hybrid of recurrence, continued-fraction and period-consistency votes blended with the
 * Bayesian posterior. Every returned period passes verify_period.
 *
 * @throws NoValidHypothesesError if phi(N) has no admissible divisor.
 * @throws std::invalid_argument on malformed input.
 */
PeriodExtractionResult
extract_period(const PeriodProblem &problem,
               const MeasurementBatch &histogram,
               const NoiseModel &noise,
               const ExtractionConfig &config = ExtractionConfig(),
               const InferenceConfig &inference_config = period_finding_defaults());

/**
 * @brief Turns a period into a non-trivial factorization of N.
 *
 * Tries r, r/2, 2r and r/d for d = 2..10. For an even trial t with x = a^(t/2) mod N outside
 * {1, N-1}, gcd(x - 1, N) or gcd(x + 1, N) gives a factor.
 *
 * @return The factor pair, smaller first, or std::nullopt.
 */
std::optional<std::pair<std::int64_t, std::int64_t>>
factors_from_period(std::int64_t modulus, std::int64_t base, std::int64_t period);

/**
 * @brief Coprime bases 2..min(N, 50)-1 ordered by how likely they are to have a short order.
 *
 * Each small prime factor (2, 3, 5, 7) adds 100, a remaining cofactor c subtracts 50c, being a
 * divisor of phi(N) adds 200 and each multiple of the base among phi(N)'s divisors adds 50.
 */
std::vector<std::int64_t>
rank_bases_by_smoothness(std::int64_t modulus, std::size_t max_bases);

} // namespace instances
} // namespace bayes_period

#endif // PERIOD_EXTRACTION_HPP
