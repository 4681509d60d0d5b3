/**
 * \file analyzer/session/AnalyzerSession.hpp
 * \brief Central session controller implementing \c IAnalyzerService.
 */
#pragma once

#include "analyzer/AnalyzerOptions.hpp"
#include "analyzer/ui/IAnalyzerService.hpp"
#include "logger.hpp"
#include "monitor/SystemSampler.hpp"
#include "pool/controller/PoolController.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/** \brief Owns the pool controller and the system sampler for one analyzer run. */
class AnalyzerSession : public IAnalyzerService {
public:
    /// Samples retained for the dashboard charts.
    static constexpr std::size_t kSampleHistory = 60;

    /**
     * \brief Construct a session.
     * \param opts Pool, monitor and observer configuration.
     * \param logger Shared logger forwarded to the controller and sampler.
     * \param sensor Resource sensor; a \c ProcSystemSensor when null.
     * \param simulator Work performed per step; the default simulator when null.
     */
    AnalyzerSession(const AnalyzerOptions& opts,
                    std::shared_ptr<Logger> logger,
                    std::shared_ptr<ProcSync::ISensor> sensor = nullptr,
                    std::shared_ptr<ProcSync::IWorkSimulator> simulator = nullptr);
    ~AnalyzerSession() override;

    /** \brief Start background sampling. */
    void start_monitor();

    /**
     * \brief Run the pool without a UI.
     *
     * Starts the configured pool and reconciles every tick until every row is
     * terminal or \c run_seconds elapsed (0 = no limit), then stops.
     * \return true when every worker finished on its own.
     */
    bool run_headless();

    // IAnalyzerService interface
    bool start_pool(int count, double speed, ProcSync::PriorityLevel priority) override;
    bool toggle_pause() override;
    void stop_pool() override;
    void reconcile() override;
    void shutdown() override;

    std::vector<ProcSync::WorkerView> GetWorkers() override;
    bool IsPaused() override;
    std::string GetStatusLine() override;
    std::optional<ProcSync::SampleEvent> GetLatestSample() override;
    std::vector<ProcSync::SampleEvent> GetSampleHistory() override;

    int GetNumberOfLogLines() override;
    std::vector<std::string> GetLogLines(int start, int count) override;
    void ClearLog() override;

    const AnalyzerOptions& options() const { return opts_; }
    ProcSync::PoolController& controller() { return *controller_; }

private:
    void on_sample(const ProcSync::SampleEvent& sample);

    AnalyzerOptions opts_;
    std::shared_ptr<Logger> logger_;
    std::unique_ptr<ProcSync::PoolController> controller_;
    std::unique_ptr<ProcSync::SystemSampler> sampler_;

    std::mutex samples_mtx_;
    std::deque<ProcSync::SampleEvent> samples_; // Protected by samples_mtx_

    std::mutex status_mtx_;
    int last_count_{0};                                             // Protected by status_mtx_
    ProcSync::PriorityLevel last_priority_{ProcSync::PriorityLevel::Normal}; // Protected by status_mtx_

    std::atomic<bool> shutdown_requested_{false};
};
