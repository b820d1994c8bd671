#include "measurement.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace bayes_period {

void
NoiseModel::validate() const {
    if (!std::isfinite(error_rate) || error_rate < 0.0 || error_rate > 1.0) {
        throw std::invalid_argument("NoiseModel error_rate must lie in [0, 1], got " + std::to_string(error_rate));
    }
    if (!std::isfinite(coherence_time) || coherence_time <= 0.0) {
        throw std::invalid_argument("NoiseModel coherence_time must be positive, got " +
                                    std::to_string(coherence_time));
    }
    if (gate_error_rate && (!std::isfinite(*gate_error_rate) || *gate_error_rate < 0.0 || *gate_error_rate > 1.0)) {
        throw std::invalid_argument("NoiseModel gate_error_rate must lie in [0, 1], got " +
                                    std::to_string(*gate_error_rate));
    }
}

std::int64_t
total_count(const MeasurementBatch &batch) {
    std::int64_t total = 0;
    for (const auto &m : batch) {
        if (m.count < 0) {
            throw std::invalid_argument("Measurement count cannot be negative (value " + std::to_string(m.value) +
                                        ", count " + std::to_string(m.count) + ").");
        }
        total += m.count;
    }
    return total;
}

MeasurementBatch
merge_batches(const std::vector<MeasurementBatch> &batches) {
    MeasurementBatch merged;
    std::unordered_map<std::int64_t, std::size_t> position; // value -> index in merged

    for (const auto &batch : batches) {
        for (const auto &m : batch) {
            if (m.count < 0) { throw std::invalid_argument("Measurement count cannot be negative."); }
            auto it = position.find(m.value);
            if (it == position.end()) {
                position.emplace(m.value, merged.size());
                merged.emplace_back(m.value, m.count);
            } else {
                merged[it->second].count += m.count;
            }
        }
    }
    return merged;
}

std::vector<MeasurementBatch>
partition_into_batches(const MeasurementBatch &histogram, std::int64_t batch_size) {
    if (batch_size <= 0) {
        throw std::invalid_argument("Batch size must be positive, got " + std::to_string(batch_size));
    }

    std::vector<MeasurementBatch> batches;
    MeasurementBatch current;
    std::int64_t room = batch_size;

    for (const auto &m : histogram) {
        if (m.count < 0) { throw std::invalid_argument("Measurement count cannot be negative."); }
        std::int64_t remaining = m.count;
        while (remaining > 0) {
            std::int64_t take = remaining < room ? remaining : room;
            current.emplace_back(m.value, take, static_cast<std::int64_t>(batches.size()));
            remaining -= take;
            room -= take;
            if (room == 0) {
                batches.push_back(std::move(current));
                current.clear();
                room = batch_size;
            }
        }
    }
    if (!current.empty()) { batches.push_back(std::move(current)); }
    return batches;
}

} // namespace bayes_period
