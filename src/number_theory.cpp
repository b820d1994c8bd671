#include "number_theory.hpp"

// Keep GMP from declaring its C++ stream operators; FLINT pulls gmp.h in.
#ifndef __GMP_DONT_USE_CXX_STREAM_OPS
#define __GMP_DONT_USE_CXX_STREAM_OPS 1
#endif

#include <flint/flint.h>
#include <flint/fmpz.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace bayes_period {
namespace number_theory {

namespace {

// (modulus - 1)^2 fits in 64 unsigned bits up to this bound.
constexpr std::uint64_t kNativeModulusLimit = 1ULL << 32;

std::uint64_t
mod_pow_native(std::uint64_t base, std::uint64_t exponent, std::uint64_t modulus) {
    std::uint64_t result = 1 % modulus;
    base %= modulus;
    while (exponent > 0) {
        if (exponent & 1ULL) { result = (result * base) % modulus; }
        exponent >>= 1;
        base = (base * base) % modulus;
    }
    return result;
}

std::uint64_t
mod_pow_fmpz(std::uint64_t base, std::uint64_t exponent, std::uint64_t modulus) {
    fmpz_t b, m, r;
    fmpz_init(b);
    fmpz_init(m);
    fmpz_init(r);

    fmpz_set_ui(b, static_cast<ulong>(base));
    fmpz_set_ui(m, static_cast<ulong>(modulus));
    fmpz_powm_ui(r, b, static_cast<ulong>(exponent), m);
    std::uint64_t out = static_cast<std::uint64_t>(fmpz_get_ui(r));

    fmpz_clear(b);
    fmpz_clear(m);
    fmpz_clear(r);
    return out;
}

} // namespace

std::int64_t
gcd(std::int64_t a, std::int64_t b) {
    a = a < 0 ? -a : a;
    b = b < 0 ? -b : b;
    while (b != 0) {
        std::int64_t t = a % b;
        a = b;
        b = t;
    }
    return a;
}

std::int64_t
mod_pow(std::int64_t base, std::int64_t exponent, std::int64_t modulus) {
    if (modulus < 1) { throw std::invalid_argument("mod_pow: modulus must be >= 1, got " + std::to_string(modulus)); }
    if (exponent < 0) {
        throw std::invalid_argument("mod_pow: exponent must be >= 0, got " + std::to_string(exponent));
    }
    if (modulus == 1) { return 0; }

    std::int64_t reduced = base % modulus;
    if (reduced < 0) { reduced += modulus; }

    auto m = static_cast<std::uint64_t>(modulus);
    auto b = static_cast<std::uint64_t>(reduced);
    auto e = static_cast<std::uint64_t>(exponent);

    std::uint64_t r = (m <= kNativeModulusLimit) ? mod_pow_native(b, e, m) : mod_pow_fmpz(b, e, m);
    return static_cast<std::int64_t>(r);
}

std::int64_t
euler_totient(std::int64_t n) {
    if (n < 1) { throw std::invalid_argument("euler_totient: n must be >= 1, got " + std::to_string(n)); }
    std::int64_t result = n;
    for (std::int64_t p = 2; p <= n / p; ++p) {
        if (n % p == 0) {
            while (n % p == 0) { n /= p; }
            result -= result / p;
        }
    }
    if (n > 1) { result -= result / n; }
    return result;
}

std::vector<std::int64_t>
divisors(std::int64_t n) {
    if (n < 1) { throw std::invalid_argument("divisors: n must be >= 1, got " + std::to_string(n)); }
    std::vector<std::int64_t> small;
    std::vector<std::int64_t> large;
    for (std::int64_t i = 1; i <= n / i; ++i) {
        if (n % i == 0) {
            small.push_back(i);
            if (i != n / i) { large.push_back(n / i); }
        }
    }
    // small is ascending, large is descending
    small.insert(small.end(), large.rbegin(), large.rend());
    return small;
}

double
smoothness_score(std::int64_t n) {
    if (n < 1) { throw std::invalid_argument("smoothness_score: n must be >= 1, got " + std::to_string(n)); }
    double score = 1.0;
    for (std::int64_t p : { 2, 3, 5, 7 }) {
        while (n % p == 0) {
            n /= p;
            score *= 1.2;
        }
    }
    if (n > 1) { score /= std::sqrt(static_cast<double>(n)); }
    return score;
}

std::optional<std::int64_t>
multiplicative_order(std::int64_t a, std::int64_t n) {
    if (n < 2 || gcd(a, n) != 1) { return std::nullopt; }
    for (std::int64_t d : divisors(euler_totient(n))) {
        if (mod_pow(a, d, n) == 1) { return d; }
    }
    return std::nullopt; // unreachable when gcd(a, n) == 1
}

Convergent
continued_fraction(std::int64_t value, std::int64_t denominator, std::int64_t max_denominator) {
    if (denominator < 1) { throw std::invalid_argument("continued_fraction: denominator must be >= 1."); }
    if (value < 0) { throw std::invalid_argument("continued_fraction: value must be >= 0."); }
    if (max_denominator < 1) { throw std::invalid_argument("continued_fraction: max_denominator must be >= 1."); }

    // h_{-2}=0, h_{-1}=1, k_{-2}=1, k_{-1}=0
    std::int64_t h_prev2 = 0, h_prev1 = 1;
    std::int64_t k_prev2 = 1, k_prev1 = 0;
    std::int64_t num = value;
    std::int64_t den = denominator;

    Convergent best;
    best.numerator = value / denominator;
    best.denominator = 1;

    while (den != 0) {
        std::int64_t a = num / den;
        std::int64_t h = a * h_prev1 + h_prev2;
        std::int64_t k = a * k_prev1 + k_prev2;
        if (k > max_denominator) { break; }

        best.numerator = h;
        best.denominator = k;

        h_prev2 = h_prev1;
        h_prev1 = h;
        k_prev2 = k_prev1;
        k_prev1 = k;

        std::int64_t rem = num - a * den;
        num = den;
        den = rem;
    }
    return best;
}

std::vector<std::int64_t>
continued_fraction_terms(std::int64_t value, std::int64_t denominator, std::size_t max_terms) {
    if (denominator < 1) { throw std::invalid_argument("continued_fraction_terms: denominator must be >= 1."); }
    if (value < 0) { throw std::invalid_argument("continued_fraction_terms: value must be >= 0."); }

    std::vector<std::int64_t> terms;
    std::int64_t num = value;
    std::int64_t den = denominator;
    while (den != 0 && terms.size() < max_terms) {
        terms.push_back(num / den);
        std::int64_t rem = num % den;
        num = den;
        den = rem;
    }
    return terms;
}

} // namespace number_theory
} // namespace bayes_period
