#pragma once

#include <cstdint>
#include <vector>

namespace sqfree {

// Non-segmented odd-only Eratosthenes over [0,limit].
std::vector<std::uint64_t>simple_sieve(std::uint64_t limit);

}
