#include "tunnel/system_info.hpp"
#include "common/log.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/utsname.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

namespace sightlink::tunnel {

namespace {

std::optional<std::string> read_file(const char* path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// First non-loopback IPv4 address
std::string primary_ipv4() {
    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        return "127.0.0.1";
    }

    std::string result = "127.0.0.1";
    for (auto* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        char buf[INET_ADDRSTRLEN] = {};
        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            result = buf;
            break;
        }
    }
    freeifaddrs(list);
    return result;
}

std::string os_description() {
    struct utsname info {};
    if (uname(&info) != 0) {
        return "Unknown OS";
    }
    return std::string(info.sysname) + " " + info.release + " " + info.machine;
}

} // anonymous namespace

ProcSystemInfoCollector::ProcSystemInfoCollector(std::string gpu_model, std::string ip_override)
    : gpu_model_(std::move(gpu_model))
    , ip_override_(std::move(ip_override))
{
}

std::optional<ProcSystemInfoCollector::CpuTimes>
ProcSystemInfoCollector::parse_proc_stat(const std::string& content) {
    std::istringstream in(content);
    std::string label;
    in >> label;
    if (label != "cpu") {
        return std::nullopt;
    }

    // user nice system idle iowait irq softirq steal
    uint64_t values[8] = {};
    size_t count = 0;
    for (; count < 8 && (in >> values[count]); ++count) {
    }
    if (count < 4) {
        return std::nullopt;
    }

    CpuTimes times;
    times.idle = values[3] + (count > 4 ? values[4] : 0);
    for (size_t i = 0; i < count; ++i) {
        times.total += values[i];
    }
    return times;
}

std::optional<std::pair<uint64_t, uint64_t>>
ProcSystemInfoCollector::parse_meminfo(const std::string& content) {
    std::istringstream in(content);
    std::string key;
    uint64_t value = 0;
    std::optional<uint64_t> total;
    std::optional<uint64_t> available;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        if (!(fields >> key >> value)) continue;
        if (key == "MemTotal:") total = value;
        else if (key == "MemAvailable:") available = value;
    }
    if (!total || !available) {
        return std::nullopt;
    }
    return std::make_pair(*total, *available);
}

SystemInfo ProcSystemInfoCollector::collect() {
    SystemInfo info;
    info.cpu_cores = std::max(1u, std::thread::hardware_concurrency());
    info.os_info = os_description();
    info.ip = ip_override_.empty() ? primary_ipv4() : ip_override_;
    if (!gpu_model_.empty()) {
        info.gpu_model = gpu_model_;
    }

    if (auto stat = read_file("/proc/stat")) {
        if (auto now = parse_proc_stat(*stat)) {
            uint64_t idle = now->idle;
            uint64_t total = now->total;
            if (last_cpu_ && total > last_cpu_->total) {
                idle -= last_cpu_->idle;
                total -= last_cpu_->total;
            }
            if (total > 0) {
                info.cpu_usage = 100.0 * static_cast<double>(total - std::min(idle, total)) /
                                 static_cast<double>(total);
            }
            last_cpu_ = now;
        }
    } else {
        LOG_DEBUG("SystemInfo: /proc/stat unavailable");
    }

    if (auto meminfo = read_file("/proc/meminfo")) {
        if (auto mem = parse_meminfo(*meminfo)) {
            auto [total_kb, available_kb] = *mem;
            info.memory_total_mb = total_kb / 1024;
            if (total_kb > 0) {
                info.memory_usage = 100.0 * static_cast<double>(total_kb - std::min(available_kb, total_kb)) /
                                    static_cast<double>(total_kb);
            }
        }
    }

    return info;
}

} // namespace sightlink::tunnel
