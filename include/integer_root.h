#pragma once

#include <cstdint>

#include <gmpxx.h>

namespace sqfree {

// Floor k-th root: the unique m with m^k <= n < (m+1)^k.
// Throws std::invalid_argument for n<0 or k<1.
mpz_class integer_root(const mpz_class&n,long k);

// Same contract as integer_root, found by bisection instead of Newton steps.
mpz_class integer_root_bisect(const mpz_class&n,long k);

mpz_class integer_sqrt(const mpz_class&n);

std::uint64_t integer_root_u64(std::uint64_t n,unsigned k);

std::uint64_t integer_sqrt_u64(std::uint64_t n);

}
