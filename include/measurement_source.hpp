#ifndef MEASUREMENT_SOURCE_HPP
#define MEASUREMENT_SOURCE_HPP

#include "measurement.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace bayes_period {

/**
 * @brief Abstract base class for anything that yields measurement batches on demand.
 *
 * The inference core only pulls from this interface; how the outcomes were produced (hardware,
 * simulator, recorded file) is the implementation's business. Batches are consumed strictly in
 * the order next_batch() returns them.
 */
class MeasurementSource {
  public:
    virtual ~MeasurementSource() = default;

    /**
     * @brief Whether another batch can be pulled.
     */
    virtual bool has_next() const = 0;

    /**
     * @brief Pulls the next batch.
     * @throws std::out_of_range if has_next() is false.
     */
    virtual MeasurementBatch next_batch() = 0;

    /**
     * @brief Returns the name of the source implementation.
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Source over an in-memory, already collected list of batches.
 */
class BatchListSource : public MeasurementSource {
  public:
    explicit BatchListSource(std::vector<MeasurementBatch> batches);

    /**
     * @brief Partitions a flat histogram into batches of @p batch_size shots.
     */
    BatchListSource(const MeasurementBatch &histogram, std::int64_t batch_size);

    bool has_next() const override;
    MeasurementBatch next_batch() override;
    std::string name() const override { return "BatchListSource"; }

    std::size_t batches_remaining() const { return batches_.size() - cursor_; }

  private:
    std::vector<MeasurementBatch> batches_;
    std::size_t cursor_ = 0;
};

} // namespace bayes_period

#endif // MEASUREMENT_SOURCE_HPP
