#include "marker.h"

#include <algorithm>
#include <bit>
#include <limits>

namespace sqfree {
namespace {

std::size_t words_for_bits(std::size_t bits) {
    return (bits+63)/64;
}

}

std::uint64_t SegmentMarker::first_hit(std::uint64_t prime,std::uint64_t start) {
    std::uint64_t begin=prime*prime;
    if(begin<start) {
        begin=start;
    }
    std::uint64_t remainder=begin%prime;
    if(remainder) {
        if(begin>std::numeric_limits<std::uint64_t>::max()-(prime-remainder)) {
            return std::numeric_limits<std::uint64_t>::max();
        }
        begin+=prime-remainder;
    }
    if((begin&1ULL)==0) {
        if(begin>std::numeric_limits<std::uint64_t>::max()-prime) {
            return std::numeric_limits<std::uint64_t>::max();
        }
        begin+=prime;
    }
    return begin;
}

SegmentMarker::SegmentMarker(const std::vector<std::uint64_t>&base_primes) {
    odd_primes_.reserve(base_primes.size());
    for(std::uint64_t prime : base_primes) {
        if(prime<3) {
            continue;
        }
        odd_primes_.push_back(prime);
    }
}

void SegmentMarker::sieve_segment(std::uint64_t segment_low,std::uint64_t segment_high,std::vector<std::uint64_t>&bitset) const {
    if(segment_high<=segment_low) {
        bitset.clear();
        return;
    }
    std::size_t bit_count=static_cast<std::size_t>((segment_high-segment_low)>>1);
    bitset.assign(words_for_bits(bit_count),0);
    if(segment_low<=1&&bit_count>0) {
        bitset[0]|=1ULL;
    }

    for(std::uint64_t prime : odd_primes_) {
        // primes are ascending, so every later p^2 is past the block too
        if(prime>(segment_high-1)/prime) {
            break;
        }
        std::uint64_t step=prime*2ULL;
        std::uint64_t pos=first_hit(prime,segment_low);
        while(pos<segment_high) {
            std::size_t bit_index=static_cast<std::size_t>((pos-segment_low)>>1);
            bitset[bit_index/64]|=(1ULL<<(bit_index%64));
            if(pos>std::numeric_limits<std::uint64_t>::max()-step) {
                break;
            }
            pos+=step;
        }
    }

    if(bit_count%64!=0) {
        bitset.back()|=~((1ULL<<(bit_count%64))-1);
    }
}

void collect_unmarked(const std::vector<std::uint64_t>&bitset,std::uint64_t segment_low,std::size_t bit_count,std::vector<std::uint64_t>&primes) {
    std::size_t words=std::min(bitset.size(),words_for_bits(bit_count));
    for(std::size_t word=0;word<words;++word) {
        std::uint64_t open=~bitset[word];
        if(word==words-1&&bit_count%64!=0) {
            open&=(1ULL<<(bit_count%64))-1;
        }
        while(open) {
            unsigned bit=static_cast<unsigned>(std::countr_zero(open));
            primes.push_back(segment_low+2ULL*(word*64+bit));
            open&=open-1;
        }
    }
}

}
