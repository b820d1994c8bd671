#include "bayes_period.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <random>
#include <sstream>
#include <vector>

using namespace bayes_period;
using namespace bayes_period::instances;

namespace {

// Stand-in for a phase register after order finding: peaks at round(k / r * 2^bits)
bayes_period::MeasurementBatch
simulate_register(std::int64_t r, int bits, std::int64_t shots, double noise_rate, unsigned int seed) {
    const std::int64_t size = std::int64_t{ 1 } << bits;
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<std::int64_t> pick_k(0, r - 1);
    std::uniform_int_distribution<std::int64_t> pick_any(0, size - 1);

    std::map<std::int64_t, std::int64_t> counts;
    for (std::int64_t s = 0; s < shots; ++s) {
        std::int64_t value = pick_any(gen);
        if (coin(gen) >= noise_rate) {
            value = static_cast<std::int64_t>(
                      std::llround(std::ldexp(static_cast<double>(pick_k(gen)) / static_cast<double>(r), bits))) %
                    size;
        }
        ++counts[value];
    }

    bayes_period::MeasurementBatch histogram;
    for (const auto &[value, count] : counts) { histogram.emplace_back(value, count); }
    return histogram;
}

} // namespace

int
main(int argc, char **argv) {
    std::cout << "--- Period Finding Example ---" << '\n';

    // --- 1. Configuration (optionally overridden by a JSON file) ---
    InferenceConfig config = period_finding_defaults();
    if (argc > 1) {
        std::ifstream in(argv[1]);
        if (!in) {
            std::cerr << "Cannot open config file " << argv[1] << '\n';
            return 1;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        try {
            config = parse_inference_config(buffer.str(), config);
        } catch (const std::invalid_argument &e) {
            std::cerr << "Error reading configuration: " << e.what() << '\n';
            return 1;
        }
    }

    // --- 2. Pick a base likely to have a short order ---
    const std::int64_t N = 21;
    const int bits = 8;
    std::vector<std::int64_t> bases = rank_bases_by_smoothness(N, 3);
    std::cout << "N = " << N << ", candidate bases:";
    for (std::int64_t a : bases) { std::cout << " " << a; }
    std::cout << '\n';

    try {
        for (std::int64_t a : bases) {
            PeriodProblem problem(N, a, bits);
            auto true_order = number_theory::multiplicative_order(a, N);
            if (!true_order) { continue; }

            // --- 3. Generate Synthetic Measurements ---
            NoiseModel noise;
            noise.error_rate = 0.05;
            std::vector<MeasurementBatch> batches;
            for (unsigned int i = 0; i < 5; ++i) {
                batches.push_back(simulate_register(*true_order, bits, config.batch_size, noise.error_rate, 2024 + i));
            }
            MeasurementBatch histogram = merge_batches(batches);
            std::cout << "\nBase a = " << a << " (true order " << *true_order << "), " << total_count(histogram)
                      << " shots over " << histogram.size() << " distinct outcomes" << '\n';

            // --- 4. Progressive inference, one batch at a time ---
            PeriodFinder finder(config);
            auto progressive = finder.find_period_progressive(problem, batches, noise);
            std::cout << "Progressive: best = " << (progressive.best ? std::to_string(*progressive.best) : "none")
                      << ", confidence = " << progressive.confidence << ", used " << progressive.measurements_used
                      << " shots" << (progressive.early_stop ? " (early stop)" : "") << '\n';

            // --- 5. Full extraction pipeline and factoring ---
            PeriodExtractionResult extraction = extract_period(problem, histogram, noise, ExtractionConfig(), config);
            std::cout << "Extraction: " << nlohmann::json(extraction).dump(2) << '\n';

            if (extraction.period) {
                auto factors = factors_from_period(N, a, *extraction.period);
                if (factors) {
                    std::cout << "\nFactored " << N << " = " << factors->first << " x " << factors->second << '\n';
                    return 0;
                }
                std::cout << "Period " << *extraction.period << " gives only trivial factors, trying next base" << '\n';
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "Error during period finding: " << e.what() << '\n';
        return 1;
    }

    std::cout << "\nNo base produced a factorization." << '\n';
    return 1;
}
