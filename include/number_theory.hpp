#ifndef NUMBER_THEORY_HPP
#define NUMBER_THEORY_HPP

#include <cstdint>
#include <optional>
#include <vector>

namespace bayes_period {
namespace number_theory {

/**
 * @brief Greatest common divisor by the Euclidean algorithm.
 *
 * Signs are ignored. gcd(0, 0) returns 0 by convention.
 */
std::int64_t
gcd(std::int64_t a, std::int64_t b);

/**
 * @brief Computes base^exponent mod modulus by square-and-multiply.
 *
 * Every product is reduced immediately. Moduli up to 2^32 run in native 64-bit arithmetic; larger
 * moduli go through FLINT's arbitrary-precision fmpz so that modulus^2 never overflows.
 *
 * @param base Any integer; negative bases are reduced into [0, modulus).
 * @param exponent Must be >= 0.
 * @param modulus Must be >= 1.
 * @return The residue in [0, modulus).
 * @throws std::invalid_argument if exponent < 0 or modulus < 1.
 */
std::int64_t
mod_pow(std::int64_t base, std::int64_t exponent, std::int64_t modulus);

/**
 * @brief Euler's totient by trial division up to sqrt(n).
 * @throws std::invalid_argument if n < 1.
 */
std::int64_t
euler_totient(std::int64_t n);

/**
 * @brief All positive divisors of n, sorted ascending, without duplicates.
 * @throws std::invalid_argument if n < 1.
 */
std::vector<std::int64_t>
divisors(std::int64_t n);

/**
 * @brief Smoothness weight: x1.2 per factor of 2, 3, 5 or 7, divided by the square root of
 *        whatever cofactor remains.
 * @throws std::invalid_argument if n < 1.
 */
double
smoothness_score(std::int64_t n);

/**
 * @brief Smallest r > 0 with a^r = 1 (mod n), searched over the divisors of phi(n).
 * @return std::nullopt if gcd(a, n) != 1 or n < 2.
 */
std::optional<std::int64_t>
multiplicative_order(std::int64_t a, std::int64_t n);

/**
 * @brief A rational approximation numerator/denominator.
 */
struct Convergent {
    std::int64_t numerator = 0;
    std::int64_t denominator = 1;
};

/**
 * @brief Last continued-fraction convergent of value/denominator whose denominator does not
 *        exceed max_denominator.
 *
 * The result satisfies |p/q - value/denominator| < 1/(q * max_denominator).
 *
 * @throws std::invalid_argument if denominator < 1, value < 0 or max_denominator < 1.
 */
Convergent
continued_fraction(std::int64_t value, std::int64_t denominator, std::int64_t max_denominator);

/**
 * @brief Partial quotients [a0; a1, a2, ...] of value/denominator, at most max_terms of them.
 * @throws std::invalid_argument if denominator < 1 or value < 0.
 */
std::vector<std::int64_t>
continued_fraction_terms(std::int64_t value, std::int64_t denominator, std::size_t max_terms);

} // namespace number_theory
} // namespace bayes_period

#endif // NUMBER_THEORY_HPP
