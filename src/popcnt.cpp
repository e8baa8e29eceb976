#include "popcnt.h"

#include <bit>

namespace sqfree {

std::uint64_t count_zero_bits(const std::uint64_t*bits,std::size_t bit_count) noexcept {
    std::uint64_t set_bits=0;
    std::size_t words=bit_count/64;
    for(std::size_t w=0;w<words;++w) {
        set_bits+=static_cast<std::uint64_t>(std::popcount(bits[w]));
    }
    if(unsigned tail=static_cast<unsigned>(bit_count%64)) {
        set_bits+=static_cast<std::uint64_t>(std::popcount(bits[words]&((1ULL<<tail)-1)));
    }
    return bit_count-set_bits;
}

}
