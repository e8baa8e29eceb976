#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sqfree {

// Strikes odd composites inside one block. Bit i of the block bitset stands
// for segment_low+2*i; a set bit means composite.
class SegmentMarker {
public:
    explicit SegmentMarker(const std::vector<std::uint64_t>&base_primes);

    void sieve_segment(std::uint64_t segment_low,std::uint64_t segment_high,std::vector<std::uint64_t>&bitset) const;

    std::size_t base_prime_count() const { return odd_primes_.size();}

    static std::uint64_t first_hit(std::uint64_t prime,std::uint64_t start);

private:
    std::vector<std::uint64_t>odd_primes_;
};

// Appends the unstruck values of a block to primes.
void collect_unmarked(const std::vector<std::uint64_t>&bitset,std::uint64_t segment_low,std::size_t bit_count,std::vector<std::uint64_t>&primes);

}
