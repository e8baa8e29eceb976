#include "prime_sieve.h"

#include "base_sieve.h"
#include "cpu_info.h"
#include "integer_root.h"
#include "marker.h"
#include "popcnt.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace sqfree {
namespace {

struct SegmentResult {
    std::uint64_t count=0;
    std::vector<std::uint64_t>primes;
    std::atomic<bool>ready{false};
};

struct SieveLayout {
    SieveRange range{3,3};
    SegmentConfig config{};
    std::size_t segments=0;
    unsigned threads=1;
    std::vector<std::uint64_t>base_primes;
};

const CpuInfo&cached_cpu_info() {
    static const CpuInfo info=detect_cpu_info();
    return info;
}

SieveLayout plan_sieve(std::uint64_t n,const SieveOptions&options) {
    if(n>std::numeric_limits<std::uint64_t>::max()-2) {
        throw std::out_of_range("sieve bound too large");
    }
    SieveLayout layout;
    std::uint64_t odd_end=n+1;
    if((odd_end&1ULL)==0) {
        ++odd_end;
    }
    if(odd_end>3) {
        layout.range=SieveRange{3,odd_end};
    }
    std::uint64_t length=layout.range.length();

    const CpuInfo&info=cached_cpu_info();
    layout.config=choose_segment_config(info,options.segment_bytes,length);
    layout.segments=segment_count(layout.range,layout.config);

    unsigned threads=options.threads ? options.threads : effective_thread_count(info);
    if(layout.segments<threads) {
        threads=static_cast<unsigned>(std::max<std::size_t>(layout.segments,1));
    }
    layout.threads=std::max(threads,1u);

    layout.base_primes=simple_sieve(integer_sqrt_u64(n));
    return layout;
}

SieveStats make_stats(const SieveLayout&layout) {
    SieveStats stats;
    stats.threads=layout.threads;
    stats.segment=layout.config;
    stats.segments=layout.segments;
    stats.base_primes=layout.base_primes.size();
    return stats;
}

// Sieves every block of the layout. With a callback each block's primes are
// handed over in ascending block order on the calling thread; without one only
// the per-block counts are kept.
std::uint64_t run_segments(const SieveLayout&layout,const PrimeSegmentCallback*callback) {
    if(layout.segments==0) {
        return 0;
    }
    SegmentMarker marker(layout.base_primes);
    SegmentWorkQueue queue(layout.range,layout.config);

    std::vector<SegmentResult>results(layout.segments);
    std::mutex ready_mutex;
    std::condition_variable ready_cv;
    std::atomic<bool>stop{false};
    std::mutex error_mutex;
    std::exception_ptr error;

    auto record_error=[&](std::exception_ptr ex) {
        {
            std::lock_guard<std::mutex>lock(error_mutex);
            if(!error) {
                error=ex;
            }
        }
        stop.store(true,std::memory_order_relaxed);
        std::lock_guard<std::mutex>lock(ready_mutex);
        ready_cv.notify_all();
    };

    std::vector<std::thread>workers;
    workers.reserve(layout.threads);
    for(unsigned t=0;t<layout.threads;++t) {
        workers.emplace_back([&]() {
            try {
                std::vector<std::uint64_t>bitset;
                SegmentBounds bounds{};
                while(!stop.load(std::memory_order_relaxed)&&queue.next(bounds)) {
                    marker.sieve_segment(bounds.low,bounds.high,bitset);
                    std::size_t bit_count=static_cast<std::size_t>((bounds.high-bounds.low)>>1);
                    SegmentResult&res=results[bounds.index];
                    res.count=count_zero_bits(bitset.data(),bit_count);
                    if(callback) {
                        res.primes.reserve(static_cast<std::size_t>(res.count));
                        collect_unmarked(bitset,bounds.low,bit_count,res.primes);
                        {
                            std::lock_guard<std::mutex>lock(ready_mutex);
                            res.ready.store(true,std::memory_order_release);
                        }
                        ready_cv.notify_all();
                    }
                }
            } catch(...) {
                record_error(std::current_exception());
            }
        });
    }

    if(callback) {
        try {
            for(std::size_t next=0;next<results.size();++next) {
                SegmentResult&res=results[next];
                std::unique_lock<std::mutex>lock(ready_mutex);
                ready_cv.wait(lock,[&] {
                    return res.ready.load(std::memory_order_acquire)||
                           stop.load(std::memory_order_relaxed);
                });
                if(!res.ready.load(std::memory_order_acquire)) {
                    break;
                }
                std::vector<std::uint64_t>primes=std::move(res.primes);
                lock.unlock();
                (*callback)(primes);
            }
        } catch(...) {
            record_error(std::current_exception());
        }
    }

    for(auto&th : workers) {
        th.join();
    }
    if(error) {
        std::rethrow_exception(error);
    }

    std::uint64_t total=0;
    for(const auto&res : results) {
        total+=res.count;
    }
    return total;
}

}

SieveStats for_each_prime_segment(std::uint64_t n,const SieveOptions&options,const PrimeSegmentCallback&callback) {
    SieveLayout layout=plan_sieve(n,options);
    if(n>=2) {
        callback(std::vector<std::uint64_t>{2});
    }
    run_segments(layout,&callback);
    return make_stats(layout);
}

std::vector<std::uint64_t>sieve_primes(std::uint64_t n,const SieveOptions&options) {
    std::vector<std::uint64_t>primes;
    for_each_prime_segment(n,options,[&primes](const std::vector<std::uint64_t>&segment) {
        primes.insert(primes.end(),segment.begin(),segment.end());
    });
    return primes;
}

std::vector<mpz_class>sieve_primes(const mpz_class&n) {
    if(sgn(n)<0) {
        throw std::invalid_argument("sieve_primes: must have n >= 0");
    }
    if(!n.fits_ulong_p()) {
        throw std::out_of_range("sieve_primes: bound exceeds 64 bits");
    }
    std::uint64_t limit=static_cast<std::uint64_t>(n.get_ui());
    std::vector<mpz_class>primes;
    for_each_prime_segment(limit,SieveOptions{},[&primes](const std::vector<std::uint64_t>&segment) {
        for(std::uint64_t p : segment) {
            primes.emplace_back(static_cast<unsigned long>(p));
        }
    });
    return primes;
}

std::uint64_t count_primes(std::uint64_t n,const SieveOptions&options,SieveStats*stats) {
    SieveLayout layout=plan_sieve(n,options);
    std::uint64_t total=run_segments(layout,nullptr);
    if(n>=2) {
        ++total;
    }
    if(stats) {
        *stats=make_stats(layout);
    }
    return total;
}

}
