#include "cpu_info.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#if defined(__linux__)
#include <sched.h>
#endif

namespace sqfree {
namespace {

#if defined(__linux__)

const std::string kSysCpu="/sys/devices/system/cpu";

template<typename T>
bool read_sysfs(const std::string&path,T&value) {
    std::ifstream in(path);
    return static_cast<bool>(in>>value);
}

// CPUs this process may run on.
std::vector<int>allowed_cpus() {
    std::vector<int>cpus;
    cpu_set_t set;
    CPU_ZERO(&set);
    if(sched_getaffinity(0,sizeof(set),&set)==0) {
        for(int cpu=0;cpu<CPU_SETSIZE;++cpu) {
            if(CPU_ISSET(cpu,&set)) {
                cpus.push_back(cpu);
            }
        }
    }
    return cpus;
}

// Distinct (package,core) pairs among the given CPUs; 0 when topology is hidden.
unsigned count_cores(const std::vector<int>&cpus) {
    std::set<std::pair<int,int>>cores;
    for(int cpu : cpus) {
        std::string topology=kSysCpu+"/cpu"+std::to_string(cpu)+"/topology/";
        int core=0;
        if(!read_sysfs(topology+"core_id",core)) {
            return 0;
        }
        int package=0;
        if(!read_sysfs(topology+"physical_package_id",package)) {
            package=0;
        }
        cores.emplace(package,core);
    }
    return static_cast<unsigned>(cores.size());
}

// Number of CPUs in a sysfs list such as "0-3,8".
std::size_t count_cpu_list(const std::string&list) {
    std::size_t count=0;
    std::istringstream items(list);
    std::string item;
    while(std::getline(items,item,',')) {
        unsigned first=0;
        unsigned last=0;
        const char*begin=item.data();
        const char*end=item.data()+item.size();
        auto head=std::from_chars(begin,end,first);
        if(head.ec!=std::errc()) {
            continue;
        }
        last=first;
        if(head.ptr!=end&&*head.ptr=='-') {
            if(std::from_chars(head.ptr+1,end,last).ec!=std::errc()||last<first) {
                continue;
            }
        }
        count+=last-first+1;
    }
    return count;
}

void read_caches(CpuInfo&info) {
    std::string cache=kSysCpu+"/cpu0/cache/index";
    for(int index=0;index<8;++index) {
        std::string dir=cache+std::to_string(index)+"/";
        int level=0;
        std::string type;
        std::string size;
        if(!read_sysfs(dir+"level",level)||!read_sysfs(dir+"type",type)||!read_sysfs(dir+"size",size)) {
            continue;
        }
        std::size_t bytes=parse_cache_size(size);
        if(!bytes) {
            continue;
        }
        std::string shared;
        std::ifstream shared_file(dir+"shared_cpu_list");
        std::getline(shared_file,shared);
        std::size_t sharing=count_cpu_list(shared);
        // SMT siblings split one core's private cache
        if(info.has_smt&&sharing>1) {
            sharing/=2;
        }
        if(sharing>1) {
            bytes/=sharing;
        }

        if(level==1&&(type=="Data"||type=="data")) {
            info.l1_data_bytes=bytes;
        } else if(level==2&&type!="Instruction") {
            info.l2_bytes=bytes;
        }
    }
}

#endif

}

std::size_t parse_cache_size(std::string size_str) {
    while(!size_str.empty()&&std::isspace(static_cast<unsigned char>(size_str.back()))) {
        size_str.pop_back();
    }
    std::size_t unit=1;
    if(!size_str.empty()) {
        switch(size_str.back()) {
        case'K':
        case'k':
            unit=1024;
            break;
        case'M':
        case'm':
            unit=1024*1024;
            break;
        default:
            break;
        }
        if(unit!=1) {
            size_str.pop_back();
        }
    }
    std::size_t value=0;
    const char*end=size_str.data()+size_str.size();
    auto parsed=std::from_chars(size_str.data(),end,value);
    if(size_str.empty()||parsed.ec!=std::errc()||parsed.ptr!=end) {
        return 0;
    }
    if(value>std::numeric_limits<std::size_t>::max()/unit) {
        return 0;
    }
    return value*unit;
}

CpuInfo detect_cpu_info() {
    CpuInfo info;
    unsigned hardware=std::thread::hardware_concurrency();
    info.logical_cpus=hardware ? hardware : 1;
    info.physical_cpus=info.logical_cpus;
#if defined(__linux__)
    std::vector<int>cpus=allowed_cpus();
    if(!cpus.empty()) {
        info.logical_cpus=static_cast<unsigned>(cpus.size());
        unsigned cores=count_cores(cpus);
        info.physical_cpus=(cores&&cores<=info.logical_cpus) ? cores : info.logical_cpus;
    }
    info.has_smt=info.physical_cpus<info.logical_cpus;
    read_caches(info);
#endif
    return info;
}

unsigned effective_thread_count(const CpuInfo&info) {
    return std::max(info.physical_cpus ? info.physical_cpus : info.logical_cpus,1u);
}

}
