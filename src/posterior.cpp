#include "posterior.hpp"

namespace bayes_period {

double
shannon_entropy(const Eigen::VectorXd &probabilities) {
    double entropy = 0.0;
    for (Eigen::Index i = 0; i < probabilities.size(); ++i) {
        double p = probabilities(i);
        if (p > 0.0) { entropy -= p * std::log2(p); }
    }
    // guard against -0.0 and tiny negative rounding for one-hot vectors
    return entropy > 0.0 ? entropy : 0.0;
}

bool
normalize_in_place(Eigen::VectorXd &values) {
    double total = values.sum();
    if (!(total > 0.0) || !std::isfinite(total)) {
        values.setZero();
        return false;
    }
    values /= total;
    return true;
}

std::optional<Eigen::Index>
argmax_positive(const Eigen::VectorXd &values) {
    std::optional<Eigen::Index> best;
    double max_value = 0.0;
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (values(i) > max_value) {
            max_value = values(i);
            best = i;
        }
    }
    return best;
}

} // namespace bayes_period
