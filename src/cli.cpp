#include "options.h"

#include "cpu_info.h"
#include "integer_root.h"
#include "prime_sieve.h"
#include "squarefree.h"
#include "writer.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sqfree {
namespace {

// Past this the full-sieve reference is left out of --method all.
constexpr unsigned long kSieveCrossCheckLimit=1000000000UL;
constexpr std::uint64_t kStdoutWarningLimit=100000000ULL;

const char*method_name(CountMethod method) {
    switch(method) {
    case CountMethod::Memoized:
        return "memo";
    case CountMethod::DynamicProgramming:
        return "dp";
    case CountMethod::Mobius:
        return "mobius";
    case CountMethod::Sieve:
        return "sieve";
    }
    return "unknown";
}

void print_usage() {
    std::cout<<"squarefree --count X | --root N | --primes N [options]\n"
              <<"  --count X           Count squarefree integers in [1,X]\n"
              <<"  --method M          dp (default), memo, mobius, sieve, or all to cross-check\n"
              <<"  --root N            Floor k-th root of N\n"
              <<"  --degree K          Root degree for --root (default 2)\n"
              <<"  --primes N          Count primes up to N\n"
              <<"  --print             Print the primes instead of counting them\n"
              <<"  --out PATH          Write primes to file\n"
              <<"  --out-format FMT    Output format: text (default), binary\n"
              <<"  --threads N         Override sieve thread count\n"
              <<"  --segment BYTES     Override sieve block size\n"
              <<"  --time              Print elapsed time\n"
              <<"  --stats             Print configuration statistics\n";
}

std::uint64_t to_sieve_bound(const mpz_class&bound) {
    if(sgn(bound)<0) {
        throw std::invalid_argument("sieve_primes: must have n >= 0");
    }
    if(!bound.fits_ulong_p()) {
        throw std::out_of_range("sieve_primes: bound exceeds 64 bits");
    }
    return static_cast<std::uint64_t>(bound.get_ui());
}

void print_sieve_stats(const SieveStats&stats) {
    CpuInfo info=detect_cpu_info();
    std::cout<<"Threads: "<<stats.threads<<"\n";
    std::cout<<"Segment bytes: "<<stats.segment.segment_bytes<<"\n";
    std::cout<<"Segments: "<<stats.segments<<"\n";
    std::cout<<"Base primes: "<<stats.base_primes<<"\n";
    std::cout<<"L1d: "<<info.l1_data_bytes<<"  L2: "<<info.l2_bytes<<"\n";
}

void run_count(const Options&opts) {
    if(!opts.method_all) {
        std::cout<<count_squarefree(opts.bound,opts.method)<<"\n";
        if(opts.show_stats) {
            std::cout<<"Method: "<<method_name(opts.method)<<"\n";
            std::cout<<"isqrt(x): "<<integer_sqrt(opts.bound)<<"\n";
            std::cout<<"Distinct values: "<<distinct_values(opts.bound).size()<<"\n";
        }
        return;
    }

    std::vector<CountMethod>methods={CountMethod::DynamicProgramming,CountMethod::Memoized,CountMethod::Mobius};
    if(opts.bound<=kSieveCrossCheckLimit) {
        methods.push_back(CountMethod::Sieve);
    }
    mpz_class expected=count_squarefree(opts.bound,methods.front());
    for(std::size_t i=1;i<methods.size();++i) {
        mpz_class value=count_squarefree(opts.bound,methods[i]);
        if(value!=expected) {
            throw std::runtime_error(std::string("methods disagree: dp=")+expected.get_str()+
                                     " "+method_name(methods[i])+"="+value.get_str());
        }
    }
    std::cout<<expected<<"\n";
    if(opts.show_stats) {
        std::cout<<"Methods agreeing: "<<methods.size()<<"\n";
    }
}

void run_root(const Options&opts) {
    mpz_class root=integer_root(opts.bound,opts.degree);
    std::cout<<root<<"\n";
    if(opts.show_stats) {
        std::cout<<"Degree: "<<opts.degree<<"\n";
        std::cout<<"Bits: "<<mpz_sizeinbase(opts.bound.get_mpz_t(),2)<<"\n";
    }
}

void run_primes(const Options&opts) {
    std::uint64_t limit=to_sieve_bound(opts.bound);
    SieveOptions sieve_options;
    sieve_options.threads=opts.threads;
    sieve_options.segment_bytes=opts.segment_bytes;

    SieveStats stats;
    if(opts.print_primes) {
        if(opts.output_path.empty()&&limit>kStdoutWarningLimit) {
            std::fprintf(stderr,
"[sqfree] warning: writing primes to stdout may stall large outputs."
" Consider using --out <path>.\n");
        }
        PrimeWriter writer(opts.output_path,opts.output_format);
        stats=for_each_prime_segment(limit,sieve_options,[&writer](const std::vector<std::uint64_t>&primes) {
            writer.write_segment(primes);
        });
        writer.finish();
        if(!opts.output_path.empty()) {
            std::cout<<writer.values_written()<<"\n";
        }
    } else {
        std::cout<<count_primes(limit,sieve_options,&stats)<<"\n";
    }
    if(opts.show_stats) {
        print_sieve_stats(stats);
    }
}

}

int run_cli(int argc,char**argv) {
    try {
        Options opts=parse_options(argc,argv);
        if(opts.help) {
            print_usage();
            return 0;
        }
        if(opts.command==Command::None) {
            print_usage();
            return 1;
        }

        auto start_time=std::chrono::steady_clock::now();
        switch(opts.command) {
        case Command::CountSquarefree:
            run_count(opts);
            break;
        case Command::Root:
            run_root(opts);
            break;
        case Command::Primes:
            run_primes(opts);
            break;
        case Command::None:
            break;
        }
        auto end_time=std::chrono::steady_clock::now();

        if(opts.show_time) {
            auto elapsed=std::chrono::duration_cast<std::chrono::microseconds>(end_time-start_time).count();
            std::cout<<"Elapsed: "<<elapsed<<" us\n";
        }
        return 0;
    } catch(const std::exception&ex) {
        std::cerr<<"Error: "<<ex.what()<<"\n";
        return 1;
    }
}

}
