#include "options.h"

#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace sqfree {
namespace {

constexpr unsigned long kMaxDecimalExponent=1000000;

bool all_of_digits(const std::string&text,int base) {
    if(text.empty()) {
        return false;
    }
    for(char c : text) {
        unsigned char uc=static_cast<unsigned char>(c);
        if(base==16 ? !std::isxdigit(uc) : !std::isdigit(uc)) {
            return false;
        }
    }
    return true;
}

mpz_class parse_unsigned(const std::string&text,int base,const std::string&original) {
    if(!all_of_digits(text,base)) {
        throw std::invalid_argument("invalid integer: "+original);
    }
    mpz_class result;
    if(result.set_str(text,base)!=0) {
        throw std::invalid_argument("invalid integer: "+original);
    }
    return result;
}

std::string require_value(int argc,char**argv,int&i,const std::string&flag) {
    if(i+1>=argc) {
        throw std::invalid_argument(flag+" requires a value");
    }
    return argv[++i];
}

unsigned parse_threads(const std::string&value) {
    mpz_class threads=parse_bound(value);
    if(sgn(threads)<0||!threads.fits_uint_p()) {
        throw std::invalid_argument("invalid thread count: "+value);
    }
    return static_cast<unsigned>(threads.get_ui());
}

PrimeOutputFormat parse_output_format(const std::string&fmt) {
    if(fmt=="text") {
        return PrimeOutputFormat::Text;
    }
    if(fmt=="binary") {
        return PrimeOutputFormat::Binary;
    }
    throw std::invalid_argument("unsupported out-format: "+fmt);
}

void set_command(Options&opts,Command command,const std::string&value) {
    if(opts.command!=Command::None) {
        throw std::invalid_argument("only one of --count, --root, --primes may be given");
    }
    opts.command=command;
    opts.bound=parse_bound(value);
}

}

mpz_class parse_bound(const std::string&value) {
    if(value.empty()) {
        throw std::invalid_argument("invalid integer: "+value);
    }
    std::string text=value;
    bool negative=false;
    if(text[0]=='-'||text[0]=='+') {
        negative=text[0]=='-';
        text.erase(0,1);
    }

    mpz_class result;
    if(text.size()>2&&text[0]=='0'&&(text[1]=='x'||text[1]=='X')) {
        result=parse_unsigned(text.substr(2),16,value);
    } else {
        auto exp_pos=text.find_first_of("eE");
        if(exp_pos==std::string::npos) {
            result=parse_unsigned(text,10,value);
        } else {
            mpz_class mantissa=parse_unsigned(text.substr(0,exp_pos),10,value);
            mpz_class exponent=parse_unsigned(text.substr(exp_pos+1),10,value);
            if(!exponent.fits_ulong_p()||exponent.get_ui()>kMaxDecimalExponent) {
                throw std::out_of_range("exponent too large: "+value);
            }
            mpz_class scale;
            mpz_ui_pow_ui(scale.get_mpz_t(),10,exponent.get_ui());
            result=mantissa*scale;
        }
    }
    if(negative) {
        result=-result;
    }
    return result;
}

std::size_t parse_size(const std::string&value) {
    if(value.empty()) {
        throw std::invalid_argument("invalid size");
    }
    std::size_t digits=0;
    while(digits<value.size()&&std::isdigit(static_cast<unsigned char>(value[digits]))) {
        ++digits;
    }
    if(digits==0) {
        throw std::invalid_argument("invalid size: "+value);
    }
    std::uint64_t factor=1;
    if(digits<value.size()) {
        switch(value[digits]) {
        case'k':
        case'K':
            factor=1024;
            break;
        case'm':
        case'M':
            factor=1024*1024;
            break;
        case'g':
        case'G':
            factor=1024ull*1024ull*1024ull;
            break;
        default:
            throw std::invalid_argument("invalid size suffix: "+value);
        }
        if(digits+1!=value.size()) {
            throw std::invalid_argument("invalid size suffix: "+value);
        }
    }
    mpz_class base=parse_unsigned(value.substr(0,digits),10,value);
    mpz_class result=base*static_cast<unsigned long>(factor);
    if(!result.fits_ulong_p()||result.get_ui()>std::numeric_limits<std::size_t>::max()) {
        throw std::invalid_argument("size too large: "+value);
    }
    return static_cast<std::size_t>(result.get_ui());
}

CountMethod parse_method(const std::string&value) {
    if(value=="dp") {
        return CountMethod::DynamicProgramming;
    }
    if(value=="memo") {
        return CountMethod::Memoized;
    }
    if(value=="mobius") {
        return CountMethod::Mobius;
    }
    if(value=="sieve") {
        return CountMethod::Sieve;
    }
    throw std::invalid_argument("unsupported method: "+value);
}

Options parse_options(int argc,char**argv) {
    Options opts;
    for(int i=1;i<argc;++i) {
        std::string arg=argv[i];
        static const std::string out_format_prefix="--out-format=";

        if(arg=="--help"||arg=="-h") {
            opts.help=true;
            return opts;
        } else if(arg.rfind(out_format_prefix,0)==0) {
            opts.output_format=parse_output_format(arg.substr(out_format_prefix.size()));
        } else if(arg=="--count") {
            set_command(opts,Command::CountSquarefree,require_value(argc,argv,i,arg));
        } else if(arg=="--root") {
            set_command(opts,Command::Root,require_value(argc,argv,i,arg));
        } else if(arg=="--primes") {
            set_command(opts,Command::Primes,require_value(argc,argv,i,arg));
        } else if(arg=="--degree") {
            std::string value=require_value(argc,argv,i,arg);
            mpz_class degree=parse_bound(value);
            if(!degree.fits_slong_p()) {
                throw std::invalid_argument("invalid degree: "+value);
            }
            opts.degree=degree.get_si();
        } else if(arg=="--method") {
            std::string value=require_value(argc,argv,i,arg);
            if(value=="all") {
                opts.method_all=true;
            } else {
                opts.method=parse_method(value);
                opts.method_all=false;
            }
        } else if(arg=="--print") {
            opts.print_primes=true;
        } else if(arg=="--out") {
            opts.output_path=require_value(argc,argv,i,arg);
            opts.print_primes=true;
        } else if(arg=="--out-format") {
            opts.output_format=parse_output_format(require_value(argc,argv,i,arg));
        } else if(arg=="--threads") {
            opts.threads=parse_threads(require_value(argc,argv,i,arg));
        } else if(arg=="--segment") {
            opts.segment_bytes=parse_size(require_value(argc,argv,i,arg));
        } else if(arg=="--time") {
            opts.show_time=true;
        } else if(arg=="--stats") {
            opts.show_stats=true;
        } else {
            throw std::invalid_argument("unknown option: "+arg);
        }
    }
    return opts;
}

}
