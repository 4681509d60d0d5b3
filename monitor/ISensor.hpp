/**
 * \file monitor/ISensor.hpp
 * \brief Source of instantaneous system resource readings.
 */
#pragma once

#include <cstdint>

namespace ProcSync {

/** \brief One reading of the host's resources. */
struct SampleEvent {
    double cpu_percent = 0.0;          ///< 0..100
    double memory_percent = 0.0;       ///< 0..100
    double disk_percent = 0.0;         ///< 0..100, usage of the root filesystem
    std::uint64_t network_bytes = 0;   ///< Cumulative bytes sent + received
};

/** \brief Resource sensor polled by \c SystemSampler. */
class ISensor {
public:
    virtual ~ISensor() = default;

    /**
     * \brief Take one reading.
     * \throws std::system_error (\c Errc::SensorReadError) or any \c std::exception on failure.
     */
    virtual SampleEvent sample() = 0;
};

} // namespace ProcSync
