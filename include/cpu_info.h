#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sqfree {

struct CpuInfo {
    unsigned logical_cpus=1;
    unsigned physical_cpus=1;
    std::size_t l1_data_bytes=32*1024;
    std::size_t l2_bytes=1024*1024;
    bool has_smt=false;
};

CpuInfo detect_cpu_info();

unsigned effective_thread_count(const CpuInfo&info);

// Parses sysfs cache sizes such as "48K" or "2M"; 0 when unreadable.
std::size_t parse_cache_size(std::string size_str);

}
