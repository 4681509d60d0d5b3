/**
 * \file pool/worker/WorkerTask.hpp
 * \brief One simulated worker running on its own thread.
 */
#pragma once

#include "pool/PoolTypes.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <thread>

namespace ProcSync {

class CoordinationSignals;
struct EventChannels;
class IPrioritySetter;
class IWorkSimulator;

/** \brief Static parameters of one worker. */
struct WorkerConfig {
    int id{0};                                            ///< 0..N-1 within a generation.
    PriorityLevel priority{PriorityLevel::Normal};        ///< Requested scheduling priority.
    double speed{1.0};                                    ///< Divides the per-step delay.
    std::chrono::milliseconds base_delay{50};             ///< Delay per step at 1x.
};

/**
 * \brief Worker thread that drives itself through
 *        Starting -> Running <-> Paused -> {Completed | Terminated}.
 *
 * The task holds only references to the signals, channels, priority setter and
 * simulator; the controller that owns them must keep them alive until
 * \c has_exited() is true and the task has been joined.
 */
class WorkerTask {
public:
    WorkerTask(WorkerConfig config,
               CoordinationSignals& signals,
               EventChannels& channels,
               IPrioritySetter& priority_setter,
               IWorkSimulator& simulator);
    ~WorkerTask();

    WorkerTask(const WorkerTask&) = delete;
    WorkerTask& operator=(const WorkerTask&) = delete;

    /** \brief Spawn the worker thread. */
    void start();

    /**
     * \brief Wait until the worker has left its run loop or \p deadline passes.
     * \return true if the worker has exited.
     */
    bool wait_exit_until(std::chrono::steady_clock::time_point deadline) const;

    /** \brief Non-blocking check that the run loop has returned. */
    bool has_exited() const;

    /** \brief Join the thread; only blocks if the worker is still running. */
    void join();

    int id() const noexcept { return config_.id; }
    const WorkerConfig& config() const noexcept { return config_; }
    WorkerState state() const noexcept { return state_.load(std::memory_order_acquire); }
    int progress() const noexcept { return progress_.load(std::memory_order_acquire); }

private:
    void run();
    void run_steps();
    /** \brief Report Paused and block; false when Stop ended the pause (worker is then Terminated). */
    bool hold_while_paused();
    void enter_state(WorkerState state, std::optional<double> duration_seconds = std::nullopt);
    void emit_log(std::string text);
    std::string label() const;

    WorkerConfig config_;
    CoordinationSignals& signals_;
    EventChannels& channels_;
    IPrioritySetter& priority_setter_;
    IWorkSimulator& simulator_;

    std::atomic<WorkerState> state_{WorkerState::Starting};
    std::atomic<int> progress_{0};
    std::chrono::steady_clock::time_point start_time_{};
    std::chrono::steady_clock::time_point end_time_{};

    std::promise<void> exited_;
    std::shared_future<void> exited_future_;
    std::thread thread_;
};

} // namespace ProcSync
