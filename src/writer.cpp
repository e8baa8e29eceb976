#include "writer.h"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace sqfree {
namespace {

constexpr std::size_t kStreamBuffer=1u<<20;
constexpr std::size_t kMaxPendingBlocks=8;

void append_text(std::string&out,const std::vector<std::uint64_t>&primes) {
    char digits[24];
    for(std::uint64_t p : primes) {
        auto end=std::to_chars(digits,digits+sizeof(digits),p).ptr;
        out.append(digits,end);
        out.push_back('\n');
    }
}

void append_binary(std::string&out,const std::vector<std::uint64_t>&primes) {
    for(std::uint64_t p : primes) {
        for(int byte=0;byte<8;++byte) {
            out.push_back(static_cast<char>((p>>(8*byte))&0xFF));
        }
    }
}

std::runtime_error io_failure(const char*what) {
    return std::runtime_error(std::string(what)+": "+std::strerror(errno));
}

}

PrimeWriter::PrimeWriter(const std::string&path,PrimeOutputFormat format)
    : out_(stdout),owns_out_(!path.empty()),format_(format) {
    if(owns_out_) {
        out_=std::fopen(path.c_str(),"wb");
        if(!out_) {
            throw std::runtime_error("cannot open output file "+path);
        }
        if(std::setvbuf(out_,nullptr,_IOFBF,kStreamBuffer)!=0) {
            std::fclose(out_);
            throw std::runtime_error("cannot buffer output file "+path);
        }
    }
    drain_thread_=std::thread(&PrimeWriter::drain,this);
}

PrimeWriter::~PrimeWriter() {
    try {
        finish();
    } catch(const std::exception&ex) {
        std::fprintf(stderr,"[sqfree] warning: prime output incomplete: %s\n",ex.what());
    }
}

void PrimeWriter::write_segment(const std::vector<std::uint64_t>&primes) {
    if(primes.empty()) {
        return;
    }
    std::string block;
    if(format_==PrimeOutputFormat::Text) {
        block.reserve(primes.size()*12);
        append_text(block,primes);
    } else {
        block.reserve(primes.size()*8);
        append_binary(block,primes);
    }

    std::unique_lock<std::mutex>lock(mutex_);
    space_ready_.wait(lock,[&] { return pending_.size()<kMaxPendingBlocks||closing_;});
    if(failure_) {
        std::rethrow_exception(failure_);
    }
    if(closing_) {
        throw std::logic_error("write_segment after finish");
    }
    pending_.push_back(std::move(block));
    lock.unlock();
    work_ready_.notify_one();
    values_written_+=primes.size();
}

void PrimeWriter::finish() {
    if(finished_) {
        return;
    }
    finished_=true;
    {
        std::lock_guard<std::mutex>lock(mutex_);
        closing_=true;
    }
    work_ready_.notify_all();
    space_ready_.notify_all();
    drain_thread_.join();

    bool closed=owns_out_ ? std::fclose(out_)==0 : std::fflush(out_)==0;
    out_=nullptr;
    if(failure_) {
        std::rethrow_exception(failure_);
    }
    if(!closed) {
        throw io_failure("closing prime output");
    }
}

bool PrimeWriter::take_block(std::string&block) {
    std::unique_lock<std::mutex>lock(mutex_);
    work_ready_.wait(lock,[&] { return closing_||!pending_.empty();});
    if(pending_.empty()) {
        return false;
    }
    block=std::move(pending_.front());
    pending_.pop_front();
    lock.unlock();
    space_ready_.notify_one();
    return true;
}

void PrimeWriter::drain() {
    try {
        std::string block;
        while(take_block(block)) {
            emit(block);
        }
        if(std::fflush(out_)!=0) {
            throw io_failure("flushing prime output");
        }
    } catch(...) {
        std::lock_guard<std::mutex>lock(mutex_);
        failure_=std::current_exception();
        closing_=true;
        pending_.clear();
        space_ready_.notify_all();
    }
}

void PrimeWriter::emit(const std::string&block) {
    if(std::fwrite(block.data(),1,block.size(),out_)!=block.size()) {
        throw io_failure("writing prime output");
    }
}

}
