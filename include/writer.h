#pragma once

#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sqfree {

enum class PrimeOutputFormat {
    Text,     // one decimal value per line
    Binary,   // little-endian uint64 per value
};

// Encodes prime blocks on the caller's thread and writes them from a
// background thread through a bounded queue. An empty path means stdout.
// A failed write surfaces from the next write_segment or from finish.
class PrimeWriter {
public:
    PrimeWriter(const std::string&path,PrimeOutputFormat format);
    ~PrimeWriter();

    PrimeWriter(const PrimeWriter&)=delete;
    PrimeWriter&operator=(const PrimeWriter&)=delete;

    void write_segment(const std::vector<std::uint64_t>&primes);

    // Drains the queue and closes the file. Safe to call more than once.
    void finish();

    std::uint64_t values_written() const { return values_written_;}

private:
    bool take_block(std::string&block);
    void drain();
    void emit(const std::string&block);

    std::FILE*out_;
    bool owns_out_;
    PrimeOutputFormat format_;
    std::uint64_t values_written_=0;
    bool finished_=false;

    std::mutex mutex_;
    std::condition_variable work_ready_;
    std::condition_variable space_ready_;
    std::deque<std::string>pending_;
    bool closing_=false;
    std::exception_ptr failure_;

    std::thread drain_thread_;
};

}
