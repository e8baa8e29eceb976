#include <catch2/catch.hpp>
#include "integer_root.h"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include <gmpxx.h>

using namespace sqfree;

namespace {

mpz_class power(const mpz_class&base,unsigned long exponent) {
    mpz_class result;
    mpz_pow_ui(result.get_mpz_t(),base.get_mpz_t(),exponent);
    return result;
}

bool is_floor_root(const mpz_class&m,const mpz_class&n,unsigned long k) {
    return power(m,k)<=n&&n<power(m+1,k);
}

}

// ============================================================================
// Arbitrary-precision roots
// ============================================================================

TEST_CASE("integer_root known values", "[integer_root]") {
    REQUIRE(integer_root(10,2)==3);
    REQUIRE(integer_root(121,2)==11);
    REQUIRE(integer_root(120,2)==10);
    REQUIRE(integer_root(100,3)==4);
    REQUIRE(integer_root(125,3)==5);
    REQUIRE(integer_root(124,3)==4);
    REQUIRE(integer_root(1024,10)==2);
    REQUIRE(integer_root(1023,10)==1);
}

TEST_CASE("integer_root degenerate inputs", "[integer_root]") {
    for(long k=1;k<=12;++k) {
        REQUIRE(integer_root(0,k)==0);
        REQUIRE(integer_root(1,k)==1);
        REQUIRE(integer_root_bisect(0,k)==0);
        REQUIRE(integer_root_bisect(1,k)==1);
    }
    REQUIRE(integer_sqrt(0)==0);
    REQUIRE(integer_sqrt(1)==1);

    SECTION("first degree returns n") {
        REQUIRE(integer_root(987654321,1)==987654321);
        REQUIRE(integer_root_bisect(987654321,1)==987654321);
    }
}

TEST_CASE("integer_root rejects out-of-domain arguments", "[integer_root]") {
    REQUIRE_THROWS_AS(integer_root(-1,2),std::invalid_argument);
    REQUIRE_THROWS_AS(integer_root(16,0),std::invalid_argument);
    REQUIRE_THROWS_AS(integer_root(16,-3),std::invalid_argument);
    REQUIRE_THROWS_AS(integer_root_bisect(-1,2),std::invalid_argument);
    REQUIRE_THROWS_AS(integer_root_bisect(16,0),std::invalid_argument);
    REQUIRE_THROWS_AS(integer_sqrt(-4),std::invalid_argument);
    REQUIRE_THROWS_AS(integer_root_u64(16,0),std::invalid_argument);
}

TEST_CASE("integer_root bracket holds on small operands", "[integer_root]") {
    for(unsigned long n=0;n<=3000;++n) {
        mpz_class value(n);
        for(long k=1;k<=6;++k) {
            mpz_class newton=integer_root(value,k);
            REQUIRE(is_floor_root(newton,value,static_cast<unsigned long>(k)));
            REQUIRE(integer_root_bisect(value,k)==newton);
        }
        REQUIRE(integer_sqrt(value)==integer_root(value,2));
    }
}

TEST_CASE("integer_root agrees with mpz_root on random operands", "[integer_root]") {
    gmp_randclass rng(gmp_randinit_default);
    rng.seed(20240611UL);
    for(int trial=0;trial<200;++trial) {
        mpz_class n=rng.get_z_bits(64+trial*7);
        for(unsigned long k : {2UL,3UL,5UL,17UL}) {
            mpz_class expected;
            mpz_root(expected.get_mpz_t(),n.get_mpz_t(),k);
            mpz_class newton=integer_root(n,static_cast<long>(k));
            REQUIRE(newton==expected);
            REQUIRE(integer_root_bisect(n,static_cast<long>(k))==expected);
        }
        mpz_class expected_sqrt;
        mpz_sqrt(expected_sqrt.get_mpz_t(),n.get_mpz_t());
        REQUIRE(integer_sqrt(n)==expected_sqrt);
    }
}

TEST_CASE("integer_root on thousands of digits", "[integer_root]") {
    mpz_class ten(10);
    mpz_class big=power(ten,3000)+12345;

    SECTION("bracket holds") {
        for(long k : {2L,3L,7L,100L,997L}) {
            mpz_class root=integer_root(big,k);
            REQUIRE(is_floor_root(root,big,static_cast<unsigned long>(k)));
        }
    }

    SECTION("exact powers and their predecessors") {
        mpz_class base=power(ten,1000)+7;
        mpz_class square=base*base;
        REQUIRE(integer_root(square,2)==base);
        REQUIRE(integer_root(square-1,2)==base-1);
        REQUIRE(integer_sqrt(square)==base);
        REQUIRE(integer_sqrt(square-1)==base-1);

        mpz_class cube=power(base,3);
        REQUIRE(integer_root(cube,3)==base);
        REQUIRE(integer_root(cube-1,3)==base-1);
        REQUIRE(integer_root_bisect(cube-1,3)==base-1);
    }
}

// ============================================================================
// 64-bit fast path
// ============================================================================

TEST_CASE("integer_root_u64 matches the arbitrary-precision root", "[integer_root]") {
    const std::uint64_t max=std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t square32=0xFFFFFFFFULL*0xFFFFFFFFULL;
    std::uint64_t samples[]={0,1,2,3,4,8,15,16,17,99,100,101,
                             999999999999ULL,1000000000000ULL,
                             square32-1,square32,square32+1,
                             max-1,max};
    for(std::uint64_t n : samples) {
        mpz_class value(static_cast<unsigned long>(n));
        for(unsigned k=1;k<=8;++k) {
            REQUIRE(mpz_class(static_cast<unsigned long>(integer_root_u64(n,k)))==integer_root(value,static_cast<long>(k)));
        }
    }
    REQUIRE(integer_sqrt_u64(max)==0xFFFFFFFFULL);
    REQUIRE(integer_sqrt_u64(square32)==0xFFFFFFFFULL);
    REQUIRE(integer_sqrt_u64(square32-1)==0xFFFFFFFEULL);
}
