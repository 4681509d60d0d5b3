/**
 * \file analyzer/session/AnalyzerSession.cpp
 * \brief Implementation of the analyzer session controller.
 */
#include "AnalyzerSession.hpp"
#include "monitor/ProcSystemSensor.hpp"
#include "pool/priority/PrioritySetters.hpp"
#include <chrono>
#include <thread>

using namespace ProcSync;

AnalyzerSession::AnalyzerSession(const AnalyzerOptions& opts,
                                 std::shared_ptr<Logger> logger,
                                 std::shared_ptr<ISensor> sensor,
                                 std::shared_ptr<IWorkSimulator> simulator)
    : opts_(opts)
    , logger_(std::move(logger))
{
    auto setter = PrioritySetterFactory::create(opts_.priority_backend);
    if (logger_) logger_->info(std::string("Priority backend: ") + setter->backend_name());

    PoolSettings pool_settings;
    pool_settings.base_delay = opts_.base_delay;
    pool_settings.grace_period = opts_.grace;
    controller_ = std::make_unique<PoolController>(logger_, std::move(setter), std::move(simulator), pool_settings);

    if (!sensor) sensor = std::make_shared<ProcSystemSensor>();
    SamplerSettings sampler_settings;
    sampler_settings.interval = opts_.sample_interval;
    sampler_settings.log_probability = opts_.sample_log_probability;
    sampler_ = std::make_unique<SystemSampler>(
        std::move(sensor), logger_,
        [this](const SampleEvent& s) { on_sample(s); },
        sampler_settings);
}

AnalyzerSession::~AnalyzerSession() {
    shutdown();
}

void AnalyzerSession::start_monitor() {
    if (shutdown_requested_.load(std::memory_order_relaxed)) return;
    sampler_->start();
}

bool AnalyzerSession::run_headless() {
    if (!start_pool(opts_.count, opts_.speed, opts_.priority)) {
        return false;
    }

    const auto started = std::chrono::steady_clock::now();
    const bool capped = opts_.run_seconds > 0;
    const auto limit = std::chrono::seconds(opts_.run_seconds);

    bool finished = false;
    while (!shutdown_requested_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(opts_.tick);
        controller_->reconcile_tick();
        if (controller_->all_finished()) {
            finished = true;
            break;
        }
        if (capped && std::chrono::steady_clock::now() - started >= limit) {
            if (logger_) logger_->info("Run time limit reached");
            break;
        }
    }

    if (!finished) {
        controller_->stop();
    }
    controller_->reconcile_tick();

    int completed = 0;
    int terminated = 0;
    for (const auto& row : controller_->workers()) {
        if (row.state == WorkerState::Completed) ++completed;
        else if (row.state == WorkerState::Terminated) ++terminated;
    }
    if (logger_) {
        logger_->info("Summary: " + std::to_string(completed) + " completed, "
                      + std::to_string(terminated) + " terminated");
    }
    return finished;
}

bool AnalyzerSession::start_pool(int count, double speed, PriorityLevel priority) {
    if (shutdown_requested_.load(std::memory_order_relaxed)) return false;
    if (!controller_->start(count, speed, priority)) return false;
    std::lock_guard<std::mutex> lk(status_mtx_);
    last_count_ = count;
    last_priority_ = priority;
    return true;
}

bool AnalyzerSession::toggle_pause() {
    return controller_->toggle_pause();
}

void AnalyzerSession::stop_pool() {
    controller_->stop();
}

void AnalyzerSession::reconcile() {
    controller_->reconcile_tick();
}

void AnalyzerSession::shutdown() {
    if (shutdown_requested_.exchange(true, std::memory_order_acq_rel)) return;
    sampler_->stop();
    if (controller_->is_active()) {
        controller_->stop();
    }
}

std::vector<WorkerView> AnalyzerSession::GetWorkers() {
    return controller_->workers();
}

bool AnalyzerSession::IsPaused() {
    return controller_->is_paused();
}

std::string AnalyzerSession::GetStatusLine() {
    if (!controller_->is_active() || controller_->all_finished()) {
        return "Ready";
    }
    int count = 0;
    PriorityLevel priority = PriorityLevel::Normal;
    {
        std::lock_guard<std::mutex> lk(status_mtx_);
        count = last_count_;
        priority = last_priority_;
    }
    const std::string prefix = controller_->is_paused() ? "Paused " : "Running ";
    return prefix + std::to_string(count) + " processes | Priority: " + to_string(priority);
}

std::optional<SampleEvent> AnalyzerSession::GetLatestSample() {
    std::lock_guard<std::mutex> lk(samples_mtx_);
    if (samples_.empty()) return std::nullopt;
    return samples_.back();
}

std::vector<SampleEvent> AnalyzerSession::GetSampleHistory() {
    std::lock_guard<std::mutex> lk(samples_mtx_);
    return {samples_.begin(), samples_.end()};
}

int AnalyzerSession::GetNumberOfLogLines() {
    return logger_ ? logger_->get_number_of_lines() : 0;
}

std::vector<std::string> AnalyzerSession::GetLogLines(int start, int count) {
    return logger_ ? logger_->get_lines(start, count) : std::vector<std::string>{};
}

void AnalyzerSession::ClearLog() {
    if (!logger_) return;
    logger_->clear_lines();
    logger_->info("Log cleared");
}

void AnalyzerSession::on_sample(const SampleEvent& sample) {
    std::lock_guard<std::mutex> lk(samples_mtx_);
    samples_.push_back(sample);
    while (samples_.size() > kSampleHistory) {
        samples_.pop_front();
    }
}
