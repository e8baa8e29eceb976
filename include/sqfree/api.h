#pragma once

#include <cstddef>
#include <cstdint>

#if defined(_WIN32) && defined(SQFREE_DLL_EXPORT)
#  define SQFREE_API __declspec(dllexport)
#else
#  define SQFREE_API
#endif

#ifdef __cplusplus
extern"C" {
#endif

typedef enum sqfree_status {
    SQFREE_STATUS_SUCCESS=0,
    SQFREE_STATUS_INVALID_ARGUMENT=1,
    SQFREE_STATUS_OUT_OF_RANGE=2,
    SQFREE_STATUS_INTERNAL_ERROR=3
} sqfree_status;

typedef enum sqfree_count_method {
    SQFREE_METHOD_MEMOIZED=0,
    SQFREE_METHOD_DYNAMIC_PROGRAMMING=1,
    SQFREE_METHOD_MOBIUS=2,
    SQFREE_METHOD_SIEVE=3
} sqfree_count_method;

SQFREE_API int sqfree_run_cli(int argc,char**argv);

/* Big integers cross the boundary as decimal strings. Strings returned through
   out_value are owned by the caller and released with sqfree_release_string. */
SQFREE_API sqfree_status sqfree_integer_root(const char*n,long k,char**out_value);

SQFREE_API sqfree_status sqfree_count_squarefree(const char*x,sqfree_count_method method,char**out_value);

SQFREE_API sqfree_status sqfree_sieve_primes(std::uint64_t limit,unsigned threads,std::uint64_t**out_primes,std::size_t*out_count);

SQFREE_API sqfree_status sqfree_count_primes(std::uint64_t limit,unsigned threads,std::uint64_t*out_count);

SQFREE_API void sqfree_release_string(char*value);

SQFREE_API void sqfree_release_u64_buffer(std::uint64_t*buffer);

SQFREE_API const char*sqfree_status_string(sqfree_status status);

#ifdef __cplusplus
}
#endif

#undef SQFREE_API
