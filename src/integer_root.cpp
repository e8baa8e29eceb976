#include "integer_root.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace sqfree {
namespace {

void check_root_arguments(const mpz_class&n,long k,const char*caller) {
    if(sgn(n)<0) {
        throw std::invalid_argument(std::string(caller)+": must have n >= 0");
    }
    if(k<1) {
        throw std::invalid_argument(std::string(caller)+": must have k >= 1");
    }
}

// 2^(bitlen(n)/k+1) is never below the true root.
mpz_class root_upper_bound(const mpz_class&n,unsigned long k) {
    std::size_t bits=mpz_sizeinbase(n.get_mpz_t(),2);
    mpz_class bound(1);
    bound<<=static_cast<mp_bitcnt_t>(bits/k+1);
    return bound;
}

// v^k<=n without overflowing 64 bits.
bool power_le(std::uint64_t v,unsigned k,std::uint64_t n) {
    if(v==0) {
        return true;
    }
    std::uint64_t q=n;
    for(unsigned i=0;i<k;++i) {
        if(q<v) {
            return false;
        }
        q/=v;
    }
    return true;
}

}

mpz_class integer_root(const mpz_class&n,long k) {
    check_root_arguments(n,k,"integer_root");
    if(n<=1) {
        return n;
    }
    unsigned long uk=static_cast<unsigned long>(k);
    unsigned long km1=uk-1;
    mpz_class x=root_upper_bound(n,uk);
    mpz_class power;
    mpz_class y;
    for(;;) {
        mpz_pow_ui(power.get_mpz_t(),x.get_mpz_t(),km1);
        y=(km1*x+n/power)/uk;
        if(y>=x) {
            break;
        }
        x=y;
    }
    return x;
}

mpz_class integer_root_bisect(const mpz_class&n,long k) {
    check_root_arguments(n,k,"integer_root_bisect");
    if(n<=1) {
        return n;
    }
    unsigned long uk=static_cast<unsigned long>(k);
    mpz_class lo(0);
    mpz_class hi=root_upper_bound(n,uk);
    mpz_class mid;
    mpz_class power;
    while(lo<hi) {
        mid=(lo+hi+1)/2;
        mpz_pow_ui(power.get_mpz_t(),mid.get_mpz_t(),uk);
        if(power<=n) {
            lo=mid;
        } else {
            hi=mid-1;
        }
    }
    return lo;
}

mpz_class integer_sqrt(const mpz_class&n) {
    if(sgn(n)<0) {
        throw std::invalid_argument("integer_sqrt: must have n >= 0");
    }
    if(n<=1) {
        return n;
    }
    std::size_t bits=mpz_sizeinbase(n.get_mpz_t(),2);
    mpz_class hi(1);
    hi<<=static_cast<mp_bitcnt_t>((bits+1)/2);
    mpz_class lo=n/hi;
    while(lo<hi) {
        hi=(hi+lo)/2;
        lo=n/hi;
    }
    return hi;
}

std::uint64_t integer_root_u64(std::uint64_t n,unsigned k) {
    if(k<1) {
        throw std::invalid_argument("integer_root_u64: must have k >= 1");
    }
    if(n<=1||k==1) {
        return n;
    }
    long double root_ld=std::pow(static_cast<long double>(n),1.0L/static_cast<long double>(k));
    std::uint64_t root=static_cast<std::uint64_t>(root_ld);
    while(power_le(root+1,k,n)) {
        ++root;
    }
    while(!power_le(root,k,n)) {
        --root;
    }
    return root;
}

std::uint64_t integer_sqrt_u64(std::uint64_t n) {
    return integer_root_u64(n,2);
}

}
