#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace sightlink::tunnel {

// ============================================================================
// System Info
// ============================================================================

struct SystemInfo {
    double cpu_usage = 0.0;       // percent
    double memory_usage = 0.0;    // percent
    double gpu_usage = 0.0;       // percent
    std::string ip = "127.0.0.1";
    std::string os_info = "Unknown OS";
    uint32_t cpu_cores = 1;
    uint64_t memory_total_mb = 0;
    std::string gpu_model = "unknown";
};

// Sampled at heartbeat time
class SystemInfoCollector {
public:
    virtual ~SystemInfoCollector() = default;
    virtual SystemInfo collect() = 0;
};

// ============================================================================
// /proc based collector
// ============================================================================
// CPU usage is the busy share since the previous collect() (since boot on
// the first call). GPU usage stays 0.
class ProcSystemInfoCollector : public SystemInfoCollector {
public:
    explicit ProcSystemInfoCollector(std::string gpu_model = {}, std::string ip_override = {});

    SystemInfo collect() override;

    struct CpuTimes {
        uint64_t idle = 0;
        uint64_t total = 0;
    };

    // First "cpu" line of /proc/stat
    static std::optional<CpuTimes> parse_proc_stat(const std::string& content);
    // {MemTotal, MemAvailable} in kB
    static std::optional<std::pair<uint64_t, uint64_t>> parse_meminfo(const std::string& content);

private:
    std::string gpu_model_;
    std::string ip_override_;
    std::optional<CpuTimes> last_cpu_;
};

} // namespace sightlink::tunnel
