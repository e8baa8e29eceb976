#include <catch2/catch.hpp>
#include "base_sieve.h"
#include "cpu_info.h"
#include "marker.h"
#include "popcnt.h"
#include "prime_sieve.h"
#include "segmenter.h"

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <gmpxx.h>

using namespace sqfree;

namespace {

bool is_prime_trial(std::uint64_t n) {
    if(n<2) {
        return false;
    }
    for(std::uint64_t d=2;d*d<=n;++d) {
        if(n%d==0) {
            return false;
        }
    }
    return true;
}

std::vector<std::uint64_t>primes_by_trial(std::uint64_t n) {
    std::vector<std::uint64_t>primes;
    for(std::uint64_t v=2;v<=n;++v) {
        if(is_prime_trial(v)) {
            primes.push_back(v);
        }
    }
    return primes;
}

}

// ============================================================================
// Base sieve
// ============================================================================

TEST_CASE("simple_sieve small limits", "[sieve]") {
    REQUIRE(simple_sieve(0).empty());
    REQUIRE(simple_sieve(1).empty());
    REQUIRE(simple_sieve(2)==std::vector<std::uint64_t>{2});
    REQUIRE(simple_sieve(3)==std::vector<std::uint64_t>{2,3});
    REQUIRE(simple_sieve(30)==std::vector<std::uint64_t>{2,3,5,7,11,13,17,19,23,29});
    REQUIRE(simple_sieve(20000)==primes_by_trial(20000));
}

// ============================================================================
// Segmented sieve
// ============================================================================

TEST_CASE("sieve_primes known lists", "[sieve]") {
    REQUIRE(sieve_primes(std::uint64_t{0}).empty());
    REQUIRE(sieve_primes(std::uint64_t{1}).empty());
    REQUIRE(sieve_primes(std::uint64_t{2})==std::vector<std::uint64_t>{2});
    REQUIRE(sieve_primes(std::uint64_t{3})==std::vector<std::uint64_t>{2,3});
    REQUIRE(sieve_primes(std::uint64_t{30})==std::vector<std::uint64_t>{2,3,5,7,11,13,17,19,23,29});
}

TEST_CASE("sieve_primes matches trial division", "[sieve]") {
    SECTION("every bound up to 200") {
        std::vector<std::uint64_t>all=primes_by_trial(200);
        for(std::uint64_t n=0;n<=200;++n) {
            std::vector<std::uint64_t>expected;
            for(std::uint64_t p : all) {
                if(p<=n) {
                    expected.push_back(p);
                }
            }
            REQUIRE(sieve_primes(n)==expected);
        }
    }

    SECTION("one hundred thousand") {
        REQUIRE(sieve_primes(std::uint64_t{100000})==primes_by_trial(100000));
    }
}

TEST_CASE("sieve_primes is independent of blocks and threads", "[sieve]") {
    const std::uint64_t n=200000;
    std::vector<std::uint64_t>expected=simple_sieve(n);
    for(std::size_t segment : {std::size_t{128},std::size_t{1024},std::size_t{8192}}) {
        for(unsigned threads : {1u,2u,4u}) {
            SieveOptions options;
            options.threads=threads;
            options.segment_bytes=segment;
            INFO("segment="<<segment<<" threads="<<threads);
            REQUIRE(sieve_primes(n,options)==expected);
            REQUIRE(count_primes(n,options)==expected.size());
        }
    }
}

TEST_CASE("for_each_prime_segment delivers ascending blocks", "[sieve]") {
    SieveOptions options;
    options.threads=4;
    options.segment_bytes=128;
    std::vector<std::uint64_t>seen;
    std::size_t calls=0;
    SieveStats stats=for_each_prime_segment(100000,options,[&](const std::vector<std::uint64_t>&block) {
        ++calls;
        for(std::uint64_t p : block) {
            if(!seen.empty()) {
                REQUIRE(p>seen.back());
            }
            seen.push_back(p);
        }
    });
    REQUIRE(seen==primes_by_trial(100000));
    REQUIRE(calls==stats.segments+1);
    REQUIRE(stats.threads>=1);
    REQUIRE(stats.threads<=4);
    REQUIRE(stats.segment.segment_bytes==128);
}

TEST_CASE("for_each_prime_segment propagates callback errors", "[sieve]") {
    SieveOptions options;
    options.threads=2;
    options.segment_bytes=128;
    std::size_t calls=0;
    auto failing=[&](const std::vector<std::uint64_t>&) {
        if(++calls==3) {
            throw std::runtime_error("sink full");
        }
    };
    REQUIRE_THROWS_AS(for_each_prime_segment(100000,options,failing),std::runtime_error);
}

TEST_CASE("count_primes powers of ten", "[sieve]") {
    const std::uint64_t expected[]={4,25,168,1229,9592,78498,664579};
    std::uint64_t n=10;
    for(std::uint64_t pi : expected) {
        INFO("n="<<n);
        REQUIRE(count_primes(n)==pi);
        n*=10;
    }
    REQUIRE(count_primes(0)==0);
    REQUIRE(count_primes(1)==0);
    REQUIRE(count_primes(2)==1);

    SieveStats stats;
    REQUIRE(count_primes(100000000,SieveOptions{},&stats)==5761455);
    REQUIRE(stats.base_primes==1229);
    REQUIRE(stats.segments>=1);
}

TEST_CASE("sieve_primes big-integer overload", "[sieve]") {
    std::vector<mpz_class>primes=sieve_primes(mpz_class(30));
    REQUIRE(primes.size()==10);
    REQUIRE(primes.front()==2);
    REQUIRE(primes.back()==29);
    REQUIRE(sieve_primes(mpz_class(1)).empty());

    REQUIRE_THROWS_AS(sieve_primes(mpz_class(-1)),std::invalid_argument);
    mpz_class too_big;
    mpz_ui_pow_ui(too_big.get_mpz_t(),2,64);
    REQUIRE_THROWS_AS(sieve_primes(too_big),std::out_of_range);
}

// ============================================================================
// Blocks and marking
// ============================================================================

TEST_CASE("choose_segment_config sizes", "[segmenter]") {
    CpuInfo info;
    info.l2_bytes=1024*1024;

    SECTION("requested sizes are aligned and clamped") {
        REQUIRE(choose_segment_config(info,1000,1000000000ULL).segment_bytes==1024);
        REQUIRE(choose_segment_config(info,1,1000000000ULL).segment_bytes==128);
        REQUIRE(choose_segment_config(info,std::size_t{1}<<30,1000000000ULL).segment_bytes==(std::size_t{64}<<20));
    }

    SECTION("derived from L2") {
        SegmentConfig config=choose_segment_config(info,0,1000000000ULL);
        REQUIRE(config.segment_bytes==512*1024);
        REQUIRE(config.segment_bits==config.segment_bytes*8);
        REQUIRE(config.segment_span==config.segment_bits*2);
    }

    SECTION("short ranges keep the minimum block") {
        REQUIRE(choose_segment_config(info,0,100).segment_bytes==8*1024);
    }
}

TEST_CASE("SegmentWorkQueue covers the range", "[segmenter]") {
    CpuInfo info;
    SieveRange range{3,200001};
    SegmentConfig config=choose_segment_config(info,128,range.end-range.begin);
    std::size_t expected_segments=segment_count(range,config);
    REQUIRE(expected_segments==(200001-3+config.segment_span-1)/config.segment_span);

    SegmentWorkQueue queue(range,config);
    REQUIRE(queue.size()==expected_segments);
    SegmentBounds bounds{};
    std::uint64_t cursor=range.begin;
    std::size_t seen=0;
    while(queue.next(bounds)) {
        REQUIRE(bounds.index==seen);
        REQUIRE(bounds.low==cursor);
        REQUIRE(bounds.high>bounds.low);
        REQUIRE((bounds.low&1ULL)==1);
        cursor=bounds.high;
        ++seen;
    }
    REQUIRE(seen==expected_segments);
    REQUIRE(cursor==range.end);
    REQUIRE(segment_count(SieveRange{3,3},config)==0);
}

TEST_CASE("SegmentMarker first_hit", "[marker]") {
    REQUIRE(SegmentMarker::first_hit(3,3)==9);
    REQUIRE(SegmentMarker::first_hit(3,10)==15);
    REQUIRE(SegmentMarker::first_hit(5,100)==105);
    REQUIRE(SegmentMarker::first_hit(7,1)==49);
}

TEST_CASE("SegmentMarker strikes one block", "[marker]") {
    SegmentMarker marker(simple_sieve(15));
    REQUIRE(marker.base_prime_count()==5);

    std::vector<std::uint64_t>bitset;
    marker.sieve_segment(101,201,bitset);
    std::vector<std::uint64_t>primes;
    collect_unmarked(bitset,101,50,primes);

    std::vector<std::uint64_t>expected;
    for(std::uint64_t v=101;v<201;++v) {
        if(is_prime_trial(v)) {
            expected.push_back(v);
        }
    }
    REQUIRE(primes==expected);
    REQUIRE(count_zero_bits(bitset.data(),50)==expected.size());

    SECTION("the block holding one is struck at one") {
        marker.sieve_segment(1,31,bitset);
        primes.clear();
        collect_unmarked(bitset,1,15,primes);
        REQUIRE(primes==std::vector<std::uint64_t>{3,5,7,11,13,17,19,23,29});
    }
}

TEST_CASE("count_zero_bits", "[popcnt]") {
    std::uint64_t words[]={0,~0ULL,0x5ULL};
    REQUIRE(count_zero_bits(words,64)==64);
    REQUIRE(count_zero_bits(words,128)==64);
    REQUIRE(count_zero_bits(words,131)==65);
    REQUIRE(count_zero_bits(words,0)==0);
    std::uint64_t tail[]={0xFFFFFFFFFFFFFFF0ULL};
    REQUIRE(count_zero_bits(tail,6)==4);
}

// ============================================================================
// CPU detection
// ============================================================================

TEST_CASE("parse_cache_size", "[cpu]") {
    REQUIRE(parse_cache_size("48K")==49152);
    REQUIRE(parse_cache_size("2M\n")==2*1024*1024);
    REQUIRE(parse_cache_size("512")==512);
    REQUIRE(parse_cache_size("")==0);
    REQUIRE(parse_cache_size("abc")==0);
}

TEST_CASE("detect_cpu_info is sane", "[cpu]") {
    CpuInfo info=detect_cpu_info();
    REQUIRE(info.logical_cpus>=1);
    REQUIRE(info.physical_cpus>=1);
    REQUIRE(info.physical_cpus<=info.logical_cpus);
    REQUIRE(effective_thread_count(info)>=1);
}
