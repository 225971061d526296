#include <gtest/gtest.h>
#include "tunnel/system_info.hpp"

using namespace sightlink::tunnel;

TEST(SystemInfoTest, ParseProcStat) {
    auto times = ProcSystemInfoCollector::parse_proc_stat(
        "cpu  100 5 50 800 20 3 2 0 0 0\ncpu0 50 2 25 400 10 1 1 0 0 0\n");
    ASSERT_TRUE(times.has_value());
    EXPECT_EQ(times->idle, 820u);
    EXPECT_EQ(times->total, 980u);

    // Old kernels: only user nice system idle
    auto short_line = ProcSystemInfoCollector::parse_proc_stat("cpu 10 0 10 80\n");
    ASSERT_TRUE(short_line.has_value());
    EXPECT_EQ(short_line->idle, 80u);
    EXPECT_EQ(short_line->total, 100u);

    EXPECT_FALSE(ProcSystemInfoCollector::parse_proc_stat("intr 1 2 3\n").has_value());
    EXPECT_FALSE(ProcSystemInfoCollector::parse_proc_stat("cpu 1 2\n").has_value());
    EXPECT_FALSE(ProcSystemInfoCollector::parse_proc_stat("").has_value());
}

TEST(SystemInfoTest, ParseMeminfo) {
    auto mem = ProcSystemInfoCollector::parse_meminfo(
        "MemTotal:       16384000 kB\n"
        "MemFree:         1000000 kB\n"
        "MemAvailable:    8192000 kB\n"
        "Buffers:          100000 kB\n");
    ASSERT_TRUE(mem.has_value());
    EXPECT_EQ(mem->first, 16384000u);
    EXPECT_EQ(mem->second, 8192000u);

    EXPECT_FALSE(ProcSystemInfoCollector::parse_meminfo("MemTotal: 100 kB\n").has_value());
}

TEST(SystemInfoTest, CollectUsesOverrides) {
    ProcSystemInfoCollector collector("rtx-4090", "192.168.1.50");
    auto first = collector.collect();
    auto second = collector.collect();

    EXPECT_EQ(first.ip, "192.168.1.50");
    EXPECT_EQ(first.gpu_model, "rtx-4090");
    EXPECT_GE(first.cpu_cores, 1u);
    EXPECT_GE(second.cpu_usage, 0.0);
    EXPECT_LE(second.cpu_usage, 100.0);
    EXPECT_GE(second.memory_usage, 0.0);
    EXPECT_LE(second.memory_usage, 100.0);
    EXPECT_DOUBLE_EQ(second.gpu_usage, 0.0);
}
