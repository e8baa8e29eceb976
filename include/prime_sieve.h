#pragma once

#include "segmenter.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include <gmpxx.h>

namespace sqfree {

struct SieveOptions {
    unsigned threads=0;            // 0 picks one per physical core
    std::size_t segment_bytes=0;   // 0 derives the block size from L2
};

struct SieveStats {
    unsigned threads=0;
    SegmentConfig segment{};
    std::size_t segments=0;
    std::size_t base_primes=0;
};

using PrimeSegmentCallback=std::function<void(const std::vector<std::uint64_t>&)>;

// Streams the primes <= n block by block, in ascending order.
SieveStats for_each_prime_segment(std::uint64_t n,const SieveOptions&options,const PrimeSegmentCallback&callback);

std::vector<std::uint64_t>sieve_primes(std::uint64_t n,const SieveOptions&options=SieveOptions{});

// Throws std::invalid_argument for n<0 and std::out_of_range past 64 bits.
std::vector<mpz_class>sieve_primes(const mpz_class&n);

std::uint64_t count_primes(std::uint64_t n,const SieveOptions&options=SieveOptions{},SieveStats*stats=nullptr);

}
