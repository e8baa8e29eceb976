#include "base_sieve.h"

#include "integer_root.h"

#include <limits>
#include <stdexcept>
#include <vector>

namespace sqfree {

std::vector<std::uint64_t>simple_sieve(std::uint64_t limit) {
    if(limit<2) {
        return {};
    }
    std::uint64_t size=limit/2+1;
    if(size>static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
        throw std::out_of_range("simple_sieve: limit too large for a flat sieve");
    }
    // index i stands for 2*i+1
    std::vector<bool>is_composite(static_cast<std::size_t>(size),false);
    is_composite[0]=true;
    std::uint64_t root=integer_sqrt_u64(limit);
    for(std::uint64_t p=3;p<=root;p+=2) {
        if(is_composite[p/2]) {
            continue;
        }
        for(std::uint64_t j=(p*p)/2;j<size;j+=p) {
            is_composite[j]=true;
        }
    }
    std::vector<std::uint64_t>primes;
    primes.push_back(2);
    for(std::uint64_t i=1;i<size&&(2*i+1)<=limit;++i) {
        if(!is_composite[i]) {
            primes.push_back(2*i+1);
        }
    }
    return primes;
}

}
