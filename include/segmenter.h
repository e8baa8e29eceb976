#pragma once

#include "cpu_info.h"

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace sqfree {

// Half-open range of odd candidates [begin,end); both ends odd.
struct SieveRange {
    std::uint64_t begin;
    std::uint64_t end;

    std::uint64_t length() const { return end>begin ? end-begin : 0;}
};

// One bit per odd number, so a block spans twice its bit count.
struct SegmentConfig {
    std::size_t segment_bytes;
    std::size_t segment_bits;
    std::uint64_t segment_span;
};

struct SegmentBounds {
    std::size_t index;
    std::uint64_t low;
    std::uint64_t high;
};

SegmentConfig choose_segment_config(const CpuInfo&info,std::size_t requested_segment_bytes,std::uint64_t range_length);

std::size_t segment_count(SieveRange range,const SegmentConfig&config);

// Hands out blocks in ascending order to any number of workers.
class SegmentWorkQueue {
public:
    SegmentWorkQueue(SieveRange range,const SegmentConfig&config);

    bool next(SegmentBounds&bounds);

    std::size_t size() const { return count_;}

private:
    SieveRange range_;
    std::uint64_t span_;
    std::size_t count_;
    std::atomic<std::size_t>next_index_;
};

}
