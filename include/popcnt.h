#pragma once

#include <cstddef>
#include <cstdint>

namespace sqfree {

// Zero bits among the first bit_count bits of a word array; bits past
// bit_count in the last word are ignored.
std::uint64_t count_zero_bits(const std::uint64_t*bits,std::size_t bit_count) noexcept;

}
