#include "sqfree/api.h"

#include "integer_root.h"
#include "options.h"
#include "prime_sieve.h"
#include "squarefree.h"

#include <algorithm>
#include <cstring>
#include <exception>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

bool to_cpp_method(sqfree_count_method method,sqfree::CountMethod&out) {
    switch(method) {
    case SQFREE_METHOD_MEMOIZED:
        out=sqfree::CountMethod::Memoized;
        return true;
    case SQFREE_METHOD_DYNAMIC_PROGRAMMING:
        out=sqfree::CountMethod::DynamicProgramming;
        return true;
    case SQFREE_METHOD_MOBIUS:
        out=sqfree::CountMethod::Mobius;
        return true;
    case SQFREE_METHOD_SIEVE:
        out=sqfree::CountMethod::Sieve;
        return true;
    }
    return false;
}

// Runs body and maps the exception it throws onto a status code.
template<typename Body>
sqfree_status guarded(Body&&body) {
    try {
        body();
        return SQFREE_STATUS_SUCCESS;
    } catch(const std::invalid_argument&) {
        return SQFREE_STATUS_INVALID_ARGUMENT;
    } catch(const std::out_of_range&) {
        return SQFREE_STATUS_OUT_OF_RANGE;
    } catch(const std::bad_alloc&) {
        return SQFREE_STATUS_OUT_OF_RANGE;
    } catch(const std::exception&) {
        return SQFREE_STATUS_INTERNAL_ERROR;
    } catch(...) {
        return SQFREE_STATUS_INTERNAL_ERROR;
    }
}

char*copy_string(const std::string&value) {
    std::unique_ptr<char[]>buffer=std::make_unique<char[]>(value.size()+1);
    std::memcpy(buffer.get(),value.c_str(),value.size()+1);
    return buffer.release();
}

}

extern"C" int sqfree_run_cli(int argc,char**argv) {
    return sqfree::run_cli(argc,argv);
}

extern"C" sqfree_status sqfree_integer_root(const char*n,long k,char**out_value) {
    if(!n||!out_value) {
        return SQFREE_STATUS_INVALID_ARGUMENT;
    }
    *out_value=nullptr;
    return guarded([&] {
        mpz_class root=sqfree::integer_root(sqfree::parse_bound(n),k);
        *out_value=copy_string(root.get_str());
    });
}

extern"C" sqfree_status sqfree_count_squarefree(const char*x,sqfree_count_method method,char**out_value) {
    if(!x||!out_value) {
        return SQFREE_STATUS_INVALID_ARGUMENT;
    }
    *out_value=nullptr;
    sqfree::CountMethod cpp_method;
    if(!to_cpp_method(method,cpp_method)) {
        return SQFREE_STATUS_INVALID_ARGUMENT;
    }
    return guarded([&] {
        mpz_class count=sqfree::count_squarefree(sqfree::parse_bound(x),cpp_method);
        *out_value=copy_string(count.get_str());
    });
}

extern"C" sqfree_status sqfree_sieve_primes(std::uint64_t limit,unsigned threads,std::uint64_t**out_primes,std::size_t*out_count) {
    if(!out_primes||!out_count) {
        return SQFREE_STATUS_INVALID_ARGUMENT;
    }
    *out_primes=nullptr;
    *out_count=0;
    return guarded([&] {
        sqfree::SieveOptions options;
        options.threads=threads;
        auto primes=sqfree::sieve_primes(limit,options);
        if(primes.empty()) {
            return;
        }
        std::unique_ptr<std::uint64_t[]>buffer=std::make_unique<std::uint64_t[]>(primes.size());
        std::copy(primes.begin(),primes.end(),buffer.get());
        *out_count=primes.size();
        *out_primes=buffer.release();
    });
}

extern"C" sqfree_status sqfree_count_primes(std::uint64_t limit,unsigned threads,std::uint64_t*out_count) {
    if(!out_count) {
        return SQFREE_STATUS_INVALID_ARGUMENT;
    }
    *out_count=0;
    return guarded([&] {
        sqfree::SieveOptions options;
        options.threads=threads;
        *out_count=sqfree::count_primes(limit,options);
    });
}

extern"C" void sqfree_release_string(char*value) {
    delete[] value;
}

extern"C" void sqfree_release_u64_buffer(std::uint64_t*buffer) {
    delete[] buffer;
}

extern"C" const char*sqfree_status_string(sqfree_status status) {
    switch(status) {
    case SQFREE_STATUS_SUCCESS:
        return "success";
    case SQFREE_STATUS_INVALID_ARGUMENT:
        return "invalid argument";
    case SQFREE_STATUS_OUT_OF_RANGE:
        return "out of range";
    case SQFREE_STATUS_INTERNAL_ERROR:
        return "internal error";
    }
    return "unknown status";
}
