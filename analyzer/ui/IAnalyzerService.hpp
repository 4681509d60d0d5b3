/**
 * \file analyzer/ui/IAnalyzerService.hpp
 * \brief Contract exposed by \c AnalyzerSession to UI components.
 */
#pragma once
#include "monitor/ISensor.hpp"
#include "pool/PoolTypes.hpp"
#include "pool/controller/WorkerView.hpp"
#include "processUtils.hpp"
#include <optional>
#include <string>
#include <vector>

/** \brief Service interface consumed by the analyzer UI and headless runner. */
class IAnalyzerService {
public:
    virtual ~IAnalyzerService() = default;
    // Pool control
    /** \brief Stop any running pool and start \p count workers. */
    virtual bool start_pool(int count, double speed, ProcSync::PriorityLevel priority) = 0;
    /** \brief Flip global pause; returns the new Pause value. */
    virtual bool toggle_pause() = 0;
    /** \brief Stop the running pool. */
    virtual void stop_pool() = 0;
    /** \brief Apply buffered worker events to the view. */
    virtual void reconcile() = 0;
    /** \brief Stop pool and sampler; the session is unusable afterwards. */
    virtual void shutdown() = 0;

    // View
    virtual std::vector<ProcSync::WorkerView> GetWorkers() = 0;
    virtual bool IsPaused() = 0;
    /** \brief "Ready", "Running N processes | Priority: P" or "Paused ...". */
    virtual std::string GetStatusLine() = 0;
    virtual std::optional<ProcSync::SampleEvent> GetLatestSample() = 0;
    /** \brief Most recent samples, oldest first. */
    virtual std::vector<ProcSync::SampleEvent> GetSampleHistory() = 0;

    // Log access
    /** \brief Retrieve total number of log lines available. */
    virtual int GetNumberOfLogLines() = 0;
    /**
     * \brief Fetch a slice of log lines for display.
     * \param start Zero-based offset within the log buffer.
     * \param count Maximum number of lines desired.
     */
    virtual std::vector<std::string> GetLogLines(int start, int count) = 0;
    virtual void ClearLog() = 0;

    /** \brief Capture current process resource usage metrics. */
    ProcessUsage GetProcessUsage() {
        return ProcessUtils::get_process_usage();
    }
};
