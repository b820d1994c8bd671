#ifndef MEASUREMENT_HPP
#define MEASUREMENT_HPP

#include <cstdint>
#include <optional>
#include <vector>

namespace bayes_period {

/**
 * @brief A discrete measurement outcome together with how often it was observed.
 *
 * Produced by an external measurement source and consumed immediately by the
 * inference engine.
 */
struct Measurement {
    std::int64_t value = 0;             ///< Observed outcome (e.g. a phase register value).
    std::int64_t count = 0;             ///< Number of times the outcome was observed, must be >= 0.
    std::optional<std::int64_t> batch;  ///< Index of the batch the outcome came from, if known.

    Measurement() = default;

    Measurement(std::int64_t v, std::int64_t c)
      : value(v)
      , count(c) {}

    Measurement(std::int64_t v, std::int64_t c, std::int64_t b)
      : value(v)
      , count(c)
      , batch(b) {}

    /**
     * @brief Equality on (value, count); batch tags are bookkeeping only.
     */
    bool operator==(const Measurement &other) const { return value == other.value && count == other.count; }
    bool operator!=(const Measurement &other) const { return !(*this == other); }
};

/**
 * @brief An ordered histogram of measurements. Order is significant for recurrence analysis.
 */
using MeasurementBatch = std::vector<Measurement>;

/**
 * @brief Declared noise characteristics of the measurement source.
 *
 * Immutable per inference call; passed through to likelihoods and never mutated.
 */
struct NoiseModel {
    double error_rate = 0.0;               ///< Fraction of outcomes that are pure noise, in [0, 1].
    double coherence_time = 1.0;           ///< Coherence time of the source (arbitrary units), > 0.
    std::optional<double> gate_error_rate; ///< Per-operation error rate, optional.

    /**
     * @brief Checks the model's ranges.
     * @throws std::invalid_argument if any field is out of range.
     */
    void validate() const;
};

/**
 * @brief Sums the counts of a batch.
 * @throws std::invalid_argument if any count is negative.
 */
std::int64_t
total_count(const MeasurementBatch &batch);

/**
 * @brief Accumulates several batches into one histogram.
 *
 * Values keep the order in which they were first seen; counts of repeated values are added.
 * Batch tags are dropped.
 */
MeasurementBatch
merge_batches(const std::vector<MeasurementBatch> &batches);

/**
 * @brief Splits a histogram into consecutive batches of exactly @p batch_size shots.
 *
 * Walks the histogram in order and cuts counts across batch boundaries, so every batch except
 * possibly the last one holds @p batch_size shots. Each produced measurement is tagged with its
 * batch index.
 *
 * @throws std::invalid_argument if batch_size is not positive or a count is negative.
 */
std::vector<MeasurementBatch>
partition_into_batches(const MeasurementBatch &histogram, std::int64_t batch_size);

} // namespace bayes_period

#endif // MEASUREMENT_HPP
