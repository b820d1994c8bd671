#include "measurement_source.hpp"

#include <stdexcept>
#include <utility>

namespace bayes_period {

BatchListSource::BatchListSource(std::vector<MeasurementBatch> batches)
  : batches_(std::move(batches)) {}

BatchListSource::BatchListSource(const MeasurementBatch &histogram, std::int64_t batch_size)
  : batches_(partition_into_batches(histogram, batch_size)) {}

bool
BatchListSource::has_next() const {
    return cursor_ < batches_.size();
}

MeasurementBatch
BatchListSource::next_batch() {
    if (!has_next()) { throw std::out_of_range("BatchListSource: no batches left."); }
    return batches_[cursor_++];
}

} // namespace bayes_period
