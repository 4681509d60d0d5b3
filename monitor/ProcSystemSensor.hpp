/**
 * \file monitor/ProcSystemSensor.hpp
 * \brief \c ISensor backed by Linux procfs and statvfs.
 */
#pragma once

#include "ISensor.hpp"

#include <cstdint>
#include <istream>
#include <string>

namespace ProcSync {

/**
 * \brief Reads /proc/stat, /proc/meminfo, /proc/net/dev and statvfs(2).
 *
 * CPU usage is the busy share since the previous call, so the first reading
 * reports 0. Not thread-safe; owned by a single sampler thread.
 */
class ProcSystemSensor : public ISensor {
public:
    /** \brief Aggregate jiffy counters from the "cpu" line of /proc/stat. */
    struct CpuTimes {
        std::uint64_t total{0};
        std::uint64_t idle{0}; ///< idle + iowait
    };

    explicit ProcSystemSensor(std::string disk_path = "/");

    SampleEvent sample() override;

    /**
     * \brief Busy share between two readings, clamped to [0, 100].
     *
     * Returns 0 when \p prev is unset or the total did not advance; counters
     * that went backwards (hotplug, wrap) never yield a negative or >100 value.
     */
    static double cpu_busy_percent(const CpuTimes& prev, const CpuTimes& cur);

    /**
     * \brief Used memory in percent from /proc/meminfo text, clamped to [0, 100].
     * \throws std::system_error (SensorReadError) when MemTotal or MemAvailable is missing.
     */
    static double parse_memory_percent(std::istream& meminfo);

private:
    double read_cpu_percent();
    double read_memory_percent() const;
    double read_disk_percent() const;
    std::uint64_t read_network_bytes() const;

    std::string disk_path_;
    CpuTimes last_;
};

} // namespace ProcSync
