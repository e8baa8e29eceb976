#include "squarefree.h"

#include "base_sieve.h"
#include "integer_root.h"
#include "popcnt.h"
#include "prime_sieve.h"

#include <limits>
#include <stdexcept>
#include <string>

namespace sqfree {
namespace {

void check_bound(const mpz_class&x,const char*caller) {
    if(sgn(x)<0) {
        throw std::invalid_argument(std::string(caller)+": must have x >= 0");
    }
}

// Table sizes index by value, so they must fit in memory addressing.
std::size_t to_index(const mpz_class&value,const char*caller) {
    if(!value.fits_ulong_p()) {
        throw std::out_of_range(std::string(caller)+": bound too large");
    }
    unsigned long v=value.get_ui();
    if(v>=std::numeric_limits<std::size_t>::max()/sizeof(mpz_class)) {
        throw std::out_of_range(std::string(caller)+": bound too large");
    }
    return static_cast<std::size_t>(v);
}

mpz_class memoized_count(const mpz_class&x,SquarefreeCache&cache) {
    if(x<=1) {
        return x;
    }
    auto cached=cache.find(x);
    if(cached!=cache.end()) {
        return cached->second;
    }

    mpz_class root=integer_sqrt(x);
    // k in (isqrt(x/2),isqrt(x)] gives floor(x/k^2)==1
    mpz_class half_root=integer_sqrt(x/2);
    if(half_root<1) {
        half_root=1;
    }
    mpz_class result=x-(root-half_root);

    mpz_class k(2);
    mpz_class argument;
    for(;k<=half_root;++k) {
        argument=x/(k*k);
        result-=memoized_count(argument,cache);
    }
    cache.emplace(x,result);
    return result;
}

// Bit v-1 set when v is divisible by some p^2.
std::vector<std::uint64_t>square_divisor_bitmap(std::uint64_t x) {
    if(x/64>=static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max()/sizeof(std::uint64_t))) {
        throw std::out_of_range("square_divisor_bitmap: bound too large");
    }
    std::vector<std::uint64_t>bits(static_cast<std::size_t>((x+63)/64),0);
    for(std::uint64_t p : simple_sieve(integer_sqrt_u64(x))) {
        std::uint64_t square=p*p;
        for(std::uint64_t v=square;;v+=square) {
            std::uint64_t index=v-1;
            bits[static_cast<std::size_t>(index/64)]|=(1ULL<<(index%64));
            if(v>x-square) {
                break;
            }
        }
    }
    return bits;
}

}

mpz_class count_squarefree(const mpz_class&x,CountMethod method) {
    check_bound(x,"count_squarefree");
    switch(method) {
    case CountMethod::Memoized:
        return count_squarefree_memoized(x);
    case CountMethod::DynamicProgramming:
        return count_squarefree_dp(x);
    case CountMethod::Mobius:
        return count_squarefree_mobius(x);
    case CountMethod::Sieve:
        if(!x.fits_ulong_p()) {
            throw std::out_of_range("count_squarefree: sieve bound exceeds 64 bits");
        }
        return mpz_class(static_cast<unsigned long>(count_squarefree_sieve(x.get_ui())));
    }
    throw std::invalid_argument("count_squarefree: unknown method");
}

mpz_class count_squarefree_memoized(const mpz_class&x,SquarefreeCache&cache) {
    check_bound(x,"count_squarefree_memoized");
    return memoized_count(x,cache);
}

mpz_class count_squarefree_memoized(const mpz_class&x) {
    SquarefreeCache cache;
    return count_squarefree_memoized(x,cache);
}

mpz_class count_squarefree_dp(const mpz_class&x) {
    check_bound(x,"count_squarefree_dp");
    if(x<=1) {
        return x;
    }
    std::size_t root=to_index(integer_sqrt(x),"count_squarefree_dp");

    // small[v]=Q(v) for v<=isqrt(x)
    std::vector<std::uint64_t>small(root+1);
    std::uint64_t r=0;
    for(std::size_t v=0;v<=root;++v) {
        while((r+1)*(r+1)<=v) {
            ++r;
        }
        std::uint64_t q=v;
        for(std::uint64_t l=2;l<=r;++l) {
            q-=small[static_cast<std::size_t>(v/(l*l))];
        }
        small[v]=q;
    }

    // large[k]=Q(floor(x/k^2)) for every k whose quotient exceeds isqrt(x)
    mpz_class value;
    std::size_t large_count=0;
    for(unsigned long k=1;;++k) {
        value=x/k;
        value/=k;
        if(value<=root) {
            break;
        }
        large_count=k;
    }
    std::vector<mpz_class>large(large_count+1);
    mpz_class quotient;
    for(std::size_t k=large_count;k>=1;--k) {
        unsigned long uk=static_cast<unsigned long>(k);
        value=x/uk;
        value/=uk;
        mpz_class q=value;
        unsigned long lr=integer_sqrt(value).get_ui();
        for(unsigned long l=2;l<=lr;++l) {
            // floor(floor(x/k^2)/l^2)==floor(x/(kl)^2)
            if(l<=large_count/k) {
                q-=large[k*l];
            } else {
                quotient=value/l;
                quotient/=l;
                q-=static_cast<unsigned long>(small[static_cast<std::size_t>(quotient.get_ui())]);
            }
        }
        large[k]=q;
    }
    return large[1];
}

mpz_class count_squarefree_mobius(const mpz_class&x) {
    check_bound(x,"count_squarefree_mobius");
    if(x<=1) {
        return x;
    }
    std::size_t root=to_index(integer_sqrt(x),"count_squarefree_mobius");

    std::vector<mpz_class>terms(root+1);
    for(std::size_t d=1;d<=root;++d) {
        unsigned long ud=static_cast<unsigned long>(d);
        terms[d]=x/ud;
        terms[d]/=ud;
    }

    for(std::uint64_t p : sieve_primes(static_cast<std::uint64_t>(root))) {
        std::size_t step=static_cast<std::size_t>(p);
        for(std::size_t i=step;i<=root;i+=step) {
            mpz_neg(terms[i].get_mpz_t(),terms[i].get_mpz_t());
        }
        if(step>root/step) {
            continue;
        }
        std::size_t square=step*step;
        for(std::size_t i=square;i<=root;i+=square) {
            terms[i]=0;
        }
    }

    mpz_class total(0);
    for(std::size_t d=1;d<=root;++d) {
        total+=terms[d];
    }
    return total;
}

std::uint64_t count_squarefree_sieve(std::uint64_t x) {
    if(x==0) {
        return 0;
    }
    std::vector<std::uint64_t>bits=square_divisor_bitmap(x);
    return count_zero_bits(bits.data(),static_cast<std::size_t>(x));
}

std::vector<std::uint64_t>squarefree_prefix_counts(std::uint64_t limit) {
    if(limit>=std::numeric_limits<std::size_t>::max()/sizeof(std::uint64_t)) {
        throw std::out_of_range("squarefree_prefix_counts: limit too large");
    }
    std::vector<std::uint64_t>counts(static_cast<std::size_t>(limit)+1,0);
    if(limit==0) {
        return counts;
    }
    std::vector<std::uint64_t>bits=square_divisor_bitmap(limit);
    std::uint64_t running=0;
    for(std::uint64_t v=1;v<=limit;++v) {
        std::uint64_t index=v-1;
        if(!(bits[static_cast<std::size_t>(index/64)]&(1ULL<<(index%64)))) {
            ++running;
        }
        counts[static_cast<std::size_t>(v)]=running;
    }
    return counts;
}

std::vector<mpz_class>distinct_values(const mpz_class&x) {
    check_bound(x,"distinct_values");
    mpz_class root=integer_sqrt(x);
    std::size_t small_count=to_index(root,"distinct_values")+1;

    // floor(x/k^2) strictly decreases while it stays above isqrt(x)
    std::vector<mpz_class>large;
    mpz_class value;
    for(unsigned long k=1;;++k) {
        value=x/k;
        value/=k;
        if(value<=root) {
            break;
        }
        if(large.empty()||value<large.back()) {
            large.push_back(value);
        }
    }

    std::vector<mpz_class>values;
    values.reserve(small_count+large.size());
    for(std::size_t v=0;v<small_count;++v) {
        values.emplace_back(static_cast<unsigned long>(v));
    }
    values.insert(values.end(),large.rbegin(),large.rend());
    return values;
}

mpz_class SquarefreeCounter::count(const mpz_class&x) {
    check_bound(x,"SquarefreeCounter::count");
    std::lock_guard<std::mutex>lock(cache_mutex_);
    return memoized_count(x,cache_);
}

std::size_t SquarefreeCounter::cache_size() const {
    std::lock_guard<std::mutex>lock(cache_mutex_);
    return cache_.size();
}

void SquarefreeCounter::clear() {
    std::lock_guard<std::mutex>lock(cache_mutex_);
    cache_.clear();
}

}
