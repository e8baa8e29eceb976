#include "segmenter.h"

#include <algorithm>

namespace sqfree {
namespace {

constexpr std::size_t kMinDerivedBytes=8*1024;
constexpr std::size_t kMaxSegmentBytes=64u<<20;
constexpr std::size_t kByteGranule=128;

std::size_t round_to_granule(std::size_t bytes) {
    bytes=std::clamp(bytes,kByteGranule,kMaxSegmentBytes);
    return (bytes+kByteGranule-1)/kByteGranule*kByteGranule;
}

}

SegmentConfig choose_segment_config(const CpuInfo&info,std::size_t requested_segment_bytes,std::uint64_t range_length) {
    std::size_t bytes=0;
    if(requested_segment_bytes) {
        bytes=round_to_granule(requested_segment_bytes);
    } else {
        // half of L2 leaves room for the base primes
        bytes=std::max<std::size_t>((info.l2_bytes ? info.l2_bytes : 1024*1024)/2,kMinDerivedBytes);
        std::uint64_t covering=range_length/16+1;
        if(covering<bytes) {
            bytes=std::max(static_cast<std::size_t>(covering),kMinDerivedBytes);
        }
        bytes=round_to_granule(bytes);
    }
    return SegmentConfig{bytes,bytes*8,static_cast<std::uint64_t>(bytes)*16};
}

std::size_t segment_count(SieveRange range,const SegmentConfig&config) {
    if(config.segment_span==0) {
        return 0;
    }
    std::uint64_t length=range.length();
    return static_cast<std::size_t>(length/config.segment_span+(length%config.segment_span ? 1 : 0));
}

SegmentWorkQueue::SegmentWorkQueue(SieveRange range,const SegmentConfig&config)
    : range_(range),span_(config.segment_span),count_(segment_count(range,config)),next_index_(0) {}

bool SegmentWorkQueue::next(SegmentBounds&bounds) {
    std::size_t index=next_index_.fetch_add(1,std::memory_order_relaxed);
    if(index>=count_) {
        return false;
    }
    // index<count_ keeps index*span_ below the range length
    bounds.index=index;
    bounds.low=range_.begin+static_cast<std::uint64_t>(index)*span_;
    bounds.high=bounds.low+std::min(span_,range_.end-bounds.low);
    return true;
}

}
