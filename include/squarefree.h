#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include <gmpxx.h>

namespace sqfree {

enum class CountMethod {
    Memoized,
    DynamicProgramming,
    Mobius,
    Sieve,
};

// Q(v) keyed by v; each key is written once.
using SquarefreeCache=std::map<mpz_class,mpz_class>;

// Q(x): squarefree integers in [1,x], Q(0)=0.
// All entry points throw std::invalid_argument for x<0.
mpz_class count_squarefree(const mpz_class&x,CountMethod method=CountMethod::DynamicProgramming);

mpz_class count_squarefree_memoized(const mpz_class&x,SquarefreeCache&cache);
mpz_class count_squarefree_memoized(const mpz_class&x);

mpz_class count_squarefree_dp(const mpz_class&x);

mpz_class count_squarefree_mobius(const mpz_class&x);

// Reference count from a full bitmap over [1,x]; O(x) memory.
std::uint64_t count_squarefree_sieve(std::uint64_t x);

// Q(0),Q(1),...,Q(limit) from one sieve pass.
std::vector<std::uint64_t>squarefree_prefix_counts(std::uint64_t limit);

// V(x) in ascending order: 0..isqrt(x), then the values floor(x/k^2) above isqrt(x).
std::vector<mpz_class>distinct_values(const mpz_class&x);

// Keeps the memo cache alive between queries that share sub-bounds.
class SquarefreeCounter {
public:
    mpz_class count(const mpz_class&x);

    std::size_t cache_size() const;
    void clear();

private:
    mutable std::mutex cache_mutex_;
    SquarefreeCache cache_;
};

}
