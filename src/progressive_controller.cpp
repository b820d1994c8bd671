#include "progressive_controller.hpp"

#include <algorithm>

namespace bayes_period {

StopThresholds
adaptive_stop_thresholds(double avg_complexity, double avg_richness) {
    StopThresholds t;
    // harder problems get a lower confidence bar and a looser entropy bar
    t.confidence = std::clamp(0.6 - 0.08 * avg_complexity + 0.04 * avg_richness, 0.45, 0.85);
    t.entropy = std::clamp(3.5 + 0.4 * avg_complexity, 2.0, 6.0);
    return t;
}

} // namespace bayes_period
