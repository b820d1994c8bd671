#include "consensus.hpp"

#include <algorithm>
#include <vector>

namespace bayes_period {

std::map<std::int64_t, std::int64_t>
recurrence_gaps(const MeasurementBatch &measurements, const RecurrenceConfig &config) {
    std::vector<std::int64_t> sequence;
    for (const auto &m : measurements) {
        std::int64_t repeats = std::min(m.count, config.max_repeats_per_value);
        for (std::int64_t k = 0; k < repeats; ++k) { sequence.push_back(m.value); }
    }

    std::map<std::int64_t, std::int64_t> gaps;
    const auto n = static_cast<std::int64_t>(sequence.size());
    for (std::int64_t i = 0; i < n; ++i) {
        std::int64_t end = std::min(i + config.window, n);
        for (std::int64_t j = i + 1; j < end; ++j) {
            std::int64_t diff = sequence[i] - sequence[j];
            if (diff < 0) { diff = -diff; }
            if (diff < config.value_tolerance) { ++gaps[j - i]; }
        }
    }
    return gaps;
}

} // namespace bayes_period
