#include "number_theory.hpp"
#include "test_utils.hpp"
#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

// FLINT is used as an independent oracle for moduli beyond native 64-bit products
#ifndef __GMP_DONT_USE_CXX_STREAM_OPS
#define __GMP_DONT_USE_CXX_STREAM_OPS 1
#endif
#include <flint/flint.h>
#include <flint/fmpz.h> // For fmpz_t, fmpz_init, fmpz_powm, fmpz_get_ui

using namespace bayes_period::number_theory;

namespace {

std::uint64_t
flint_powm(std::uint64_t base, std::uint64_t exponent, std::uint64_t modulus) {
    fmpz_t b, e, m, r;
    fmpz_init(b);
    fmpz_init(e);
    fmpz_init(m);
    fmpz_init(r);
    fmpz_set_ui(b, static_cast<ulong>(base));
    fmpz_set_ui(e, static_cast<ulong>(exponent));
    fmpz_set_ui(m, static_cast<ulong>(modulus));
    fmpz_powm(r, b, e, m);
    std::uint64_t out = static_cast<std::uint64_t>(fmpz_get_ui(r));
    fmpz_clear(b);
    fmpz_clear(e);
    fmpz_clear(m);
    fmpz_clear(r);
    return out;
}

} // namespace

TEST(NumberTheoryTest, GcdIgnoresSigns) {
    EXPECT_EQ(gcd(12, 18), 6);
    EXPECT_EQ(gcd(-12, 18), 6);
    EXPECT_EQ(gcd(0, 5), 5);
    EXPECT_EQ(gcd(0, 0), 0);
    EXPECT_EQ(gcd(17, 5), 1);
}

TEST(NumberTheoryTest, ModPowSmallModuli) {
    EXPECT_EQ(mod_pow(2, 10, 1000), 24);
    EXPECT_EQ(mod_pow(7, 0, 13), 1);
    EXPECT_EQ(mod_pow(2, 6, 21), 1);
    EXPECT_EQ(mod_pow(5, 3, 1), 0);  // everything is 0 mod 1
    EXPECT_EQ(mod_pow(-2, 3, 7), 6); // -8 = 6 (mod 7)
}

TEST(NumberTheoryTest, ModPowRejectsBadArguments) {
    EXPECT_THROW(mod_pow(2, 3, 0), std::invalid_argument);
    EXPECT_THROW(mod_pow(2, 3, -5), std::invalid_argument);
    EXPECT_THROW(mod_pow(2, -1, 7), std::invalid_argument);
}

TEST(NumberTheoryTest, ModPowLargeModuliMatchesFlint) {
    // Moduli above 2^32 would overflow a naive 64-bit square-and-multiply
    const std::vector<std::int64_t> moduli = { 4294967311LL, 1000000000039LL, 999999999989LL * 3 };
    const std::vector<std::int64_t> bases = { 2, 3, 123456789, 987654321012LL };
    const std::vector<std::int64_t> exponents = { 1, 65537, 1000000007, 4611686018427387903LL };

    for (std::int64_t m : moduli) {
        for (std::int64_t b : bases) {
            for (std::int64_t e : exponents) {
                auto expected = static_cast<std::int64_t>(flint_powm(static_cast<std::uint64_t>(b % m),
                                                                     static_cast<std::uint64_t>(e),
                                                                     static_cast<std::uint64_t>(m)));
                EXPECT_EQ(mod_pow(b, e, m), expected) << "b=" << b << " e=" << e << " m=" << m;
            }
        }
    }
}

TEST(NumberTheoryTest, EulerTotient) {
    EXPECT_EQ(euler_totient(1), 1);
    EXPECT_EQ(euler_totient(15), 8);
    EXPECT_EQ(euler_totient(21), 12);
    EXPECT_EQ(euler_totient(97), 96);
    EXPECT_EQ(euler_totient(100), 40);
    EXPECT_THROW(euler_totient(0), std::invalid_argument);
}

TEST(NumberTheoryTest, DivisorsAreSortedAndUnique) {
    EXPECT_EQ(divisors(1), (std::vector<std::int64_t>{ 1 }));
    EXPECT_EQ(divisors(12), (std::vector<std::int64_t>{ 1, 2, 3, 4, 6, 12 }));
    EXPECT_EQ(divisors(36), (std::vector<std::int64_t>{ 1, 2, 3, 4, 6, 9, 12, 18, 36 }));
    EXPECT_EQ(divisors(13), (std::vector<std::int64_t>{ 1, 13 }));
    EXPECT_THROW(divisors(-4), std::invalid_argument);
}

TEST(NumberTheoryTest, SmoothnessFavorsSmallPrimes) {
    EXPECT_NEAR(smoothness_score(1), 1.0, 1e-12);
    EXPECT_NEAR(smoothness_score(12), 1.2 * 1.2 * 1.2, 1e-12);
    EXPECT_NEAR(smoothness_score(11), 1.0 / std::sqrt(11.0), 1e-12);
    EXPECT_NEAR(smoothness_score(22), 1.2 / std::sqrt(11.0), 1e-12);
    EXPECT_GT(smoothness_score(16), smoothness_score(17));
}

TEST(NumberTheoryTest, MultiplicativeOrder) {
    EXPECT_EQ(multiplicative_order(2, 21), std::optional<std::int64_t>(6));
    EXPECT_EQ(multiplicative_order(7, 15), std::optional<std::int64_t>(4));
    EXPECT_EQ(multiplicative_order(2, 35), std::optional<std::int64_t>(12));
    EXPECT_EQ(multiplicative_order(5, 33), std::optional<std::int64_t>(10));
    EXPECT_FALSE(multiplicative_order(3, 21).has_value()); // not coprime
    EXPECT_FALSE(multiplicative_order(2, 1).has_value());
}

TEST(NumberTheoryTest, ContinuedFractionRecoversSmallDenominators) {
    // 42/256 = [0; 6, 10, 2]
    Convergent c = continued_fraction(42, 256, 20);
    EXPECT_EQ(c.numerator, 1);
    EXPECT_EQ(c.denominator, 6);

    c = continued_fraction(85, 256, 20);
    EXPECT_EQ(c.numerator, 1);
    EXPECT_EQ(c.denominator, 3);

    c = continued_fraction(213, 256, 20);
    EXPECT_EQ(c.numerator, 5);
    EXPECT_EQ(c.denominator, 6);

    c = continued_fraction(128, 256, 20);
    EXPECT_EQ(c.numerator, 1);
    EXPECT_EQ(c.denominator, 2);

    c = continued_fraction(0, 256, 20);
    EXPECT_EQ(c.numerator, 0);
    EXPECT_EQ(c.denominator, 1);
}

TEST(NumberTheoryTest, ContinuedFractionApproximationBound) {
    // |p/q - v/D| < 1/(q M), checked in exact integers as |p D - v q| M < D
    const std::int64_t D = 256;
    const std::int64_t M = 20;
    for (std::int64_t v = 0; v < D; ++v) {
        Convergent c = continued_fraction(v, D, M);
        ASSERT_GE(c.denominator, 1);
        ASSERT_LE(c.denominator, M);
        std::int64_t diff = c.numerator * D - v * c.denominator;
        if (diff < 0) diff = -diff;
        EXPECT_LT(diff * M, D) << "v=" << v << " -> " << c.numerator << "/" << c.denominator;
    }
}

TEST(NumberTheoryTest, ContinuedFractionTerms) {
    EXPECT_EQ(continued_fraction_terms(42, 256, 10), (std::vector<std::int64_t>{ 0, 6, 10, 2 }));
    EXPECT_EQ(continued_fraction_terms(42, 256, 2), (std::vector<std::int64_t>{ 0, 6 }));
    EXPECT_EQ(continued_fraction_terms(0, 64, 10), (std::vector<std::int64_t>{ 0 }));
    EXPECT_THROW(continued_fraction_terms(1, 0, 10), std::invalid_argument);
    EXPECT_THROW(continued_fraction(-1, 8, 4), std::invalid_argument);
    EXPECT_THROW(continued_fraction(1, 8, 0), std::invalid_argument);
}
