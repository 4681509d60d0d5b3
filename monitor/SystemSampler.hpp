/**
 * \file monitor/SystemSampler.hpp
 * \brief Background loop polling an \c ISensor independently of the worker pool.
 */
#pragma once

#include "ISensor.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <thread>

namespace ProcSync {

/** \brief Sampling cadence and summary-logging rate. */
struct SamplerSettings {
    std::chrono::milliseconds interval{1000};
    double log_probability{0.1}; ///< Chance per tick of logging a summary line.
};

/**
 * \brief Periodically samples a sensor and hands each reading to a sink.
 *
 * A failing read is logged and the loop carries on with the next tick; the
 * sampler only ends when \c stop() is called.
 */
class SystemSampler {
public:
    using SampleSink = std::function<void(const SampleEvent&)>;

    SystemSampler(std::shared_ptr<ISensor> sensor,
                  std::shared_ptr<Logger> logger,
                  SampleSink sink,
                  SamplerSettings settings = {});
    ~SystemSampler();

    SystemSampler(const SystemSampler&) = delete;
    SystemSampler& operator=(const SystemSampler&) = delete;

    /** \brief Launch the sampling thread; no-op if already running. */
    void start();
    /** \brief Interrupt the current wait and join the thread. */
    void stop();

    bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }
    /** \brief Ticks executed so far, successful or not. */
    std::uint64_t tick_count() const noexcept { return ticks_.load(std::memory_order_relaxed); }
    std::uint64_t error_count() const noexcept { return errors_.load(std::memory_order_relaxed); }

private:
    void run();
    void sample_once(std::mt19937& rng);

    std::shared_ptr<ISensor> sensor_;
    std::shared_ptr<Logger> logger_;
    SampleSink sink_;
    SamplerSettings settings_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> ticks_{0};
    std::atomic<std::uint64_t> errors_{0};

    std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_requested_{false}; // Protected by mtx_
    std::thread thread_;
};

} // namespace ProcSync
