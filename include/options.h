#pragma once

#include "squarefree.h"
#include "writer.h"

#include <cstddef>
#include <string>

#include <gmpxx.h>

namespace sqfree {

enum class Command {
    None,
    CountSquarefree,
    Root,
    Primes,
};

struct Options {
    Command command=Command::None;
    mpz_class bound;
    long degree=2;
    CountMethod method=CountMethod::DynamicProgramming;
    bool method_all=false;              // run every method and compare
    bool print_primes=false;
    unsigned threads=0;
    std::size_t segment_bytes=0;
    std::string output_path;
    PrimeOutputFormat output_format=PrimeOutputFormat::Text;
    bool show_time=false;
    bool show_stats=false;
    bool help=false;
};

// Accepts decimal, 0x-prefixed hex, and AeB shorthand ("1e12"). A leading
// '-' is kept so the numeric routines can reject it.
mpz_class parse_bound(const std::string&value);

// Byte counts with an optional k/M/G suffix.
std::size_t parse_size(const std::string&value);

CountMethod parse_method(const std::string&value);

Options parse_options(int argc,char**argv);

int run_cli(int argc,char**argv);

}
