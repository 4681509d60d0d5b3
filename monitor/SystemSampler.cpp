#include "SystemSampler.hpp"
#include "processUtils.hpp"

#include <exception>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace ProcSync {

SystemSampler::SystemSampler(std::shared_ptr<ISensor> sensor,
                             std::shared_ptr<Logger> logger,
                             SampleSink sink,
                             SamplerSettings settings)
    : sensor_(std::move(sensor))
    , logger_(std::move(logger))
    , sink_(std::move(sink))
    , settings_(settings) {
    if (!sensor_) {
        throw std::invalid_argument("SystemSampler: sensor cannot be null");
    }
}

SystemSampler::~SystemSampler() {
    stop();
}

void SystemSampler::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&SystemSampler::run, this);
}

void SystemSampler::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
}

void SystemSampler::run() {
    ProcessUtils::set_current_thread_name("SystemSampler");
    std::mt19937 rng(std::random_device{}());

    std::unique_lock<std::mutex> lk(mtx_);
    while (!stop_requested_) {
        lk.unlock();
        sample_once(rng);
        lk.lock();
        cv_.wait_for(lk, settings_.interval, [this] { return stop_requested_; });
    }
}

void SystemSampler::sample_once(std::mt19937& rng) {
    ticks_.fetch_add(1, std::memory_order_relaxed);
    try {
        const SampleEvent sample = sensor_->sample();
        if (sink_) sink_(sample);

        std::uniform_real_distribution<double> chance(0.0, 1.0);
        if (logger_ && chance(rng) < settings_.log_probability) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1)
                << "System Stats - CPU: " << sample.cpu_percent
                << "%, Memory: " << sample.memory_percent
                << "%, Disk: " << sample.disk_percent << "%";
            logger_->info(oss.str());
        }
    } catch (const std::exception& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        if (logger_) logger_->error(std::string("System Monitor Error: ") + e.what());
    }
}

} // namespace ProcSync
