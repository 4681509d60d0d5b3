/**
 * \file pool/controller/PoolController.hpp
 * \brief Owns each worker generation and reconciles its events into a view table.
 */
#pragma once

#include "WorkerView.hpp"
#include "logger.hpp"
#include "pool/PoolTypes.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace ProcSync {

class IPrioritySetter;
class IWorkSimulator;
struct EventChannels;

/** \brief Timing knobs of the pool. */
struct PoolSettings {
    std::chrono::milliseconds base_delay{50};     ///< Per-step delay at 1x speed.
    std::chrono::milliseconds grace_period{1000}; ///< How long \c stop() waits before reclaiming.
};

/**
 * \brief Controller for the worker pool.
 *
 * Each \c start() builds a new generation: fresh Pause/Stop signals, fresh
 * event channels and \c count worker threads referencing them. The controller
 * is the only owner of that state; workers hold plain references.
 *
 * \c reconcile_tick() is meant to run periodically on one control thread. It
 * never waits on a channel: it drains whatever is buffered and returns.
 *
 * Terminal resolution: the first terminal state applied to a row is final.
 * \c stop() marks every row that has not been observed Completed as
 * Terminated and discards anything still queued, so a Completed event that
 * arrives after the stop is never applied.
 */
class PoolController {
public:
    /** \brief Called after each applied state change, outside the controller lock. */
    using StateListener = std::function<void(const WorkerView&)>;

    /**
     * \param logger Receives controller messages and forwarded worker log lines.
     * \param priority_setter Capability selected at startup and shared by all workers.
     * \param simulator Work performed per step; \c DefaultWorkSimulator when null.
     * \param settings Step delay and stop grace period.
     */
    PoolController(std::shared_ptr<Logger> logger,
                   std::shared_ptr<IPrioritySetter> priority_setter,
                   std::shared_ptr<IWorkSimulator> simulator = nullptr,
                   PoolSettings settings = {});
    ~PoolController();

    PoolController(const PoolController&) = delete;
    PoolController& operator=(const PoolController&) = delete;

    /**
     * \brief Stop any running generation and start \p count new workers.
     * \return false (with an error logged) when \p count is outside [1,32] or
     *         \p speed is not an offered choice; the current pool is untouched then.
     */
    bool start(int count, double speed, PriorityLevel priority);

    /**
     * \brief Flip the Pause flag of the running generation without waiting for workers.
     * \return The new Pause value; false when nothing is running.
     */
    bool toggle_pause();

    /**
     * \brief Stop the running generation.
     *
     * Records every row as Terminated unless Completed was already observed,
     * then waits up to the grace period for workers to exit, reclaims
     * stragglers and discards queued events. The wait happens outside the
     * controller lock, so \c reconcile_tick() and the view stay responsive.
     */
    void stop();

    /** \brief Drain progress, status and log channels into the view and the logger. */
    void reconcile_tick();

    /** \brief Ordered copy of the view table. */
    std::vector<WorkerView> workers() const;

    std::uint64_t generation() const;
    /** \brief A generation was started and has not been stopped yet. */
    bool is_active() const;
    bool is_paused() const;
    /** \brief Every row of the current table is Completed or Terminated. */
    bool all_finished() const;
    /** \brief No event is buffered in the current generation's channels. */
    bool channels_empty() const;
    /** \brief Generations parked with workers that missed the grace period. */
    std::size_t retired_generations() const;

    void set_state_listener(StateListener listener);

private:
    struct Generation;
    friend class PoolControllerTestPeer;

    std::unique_ptr<Generation> begin_stop_locked(std::vector<WorkerView>& transitions);
    void finish_stop(std::unique_ptr<Generation> gen);
    void terminate_open_rows_locked(std::vector<WorkerView>& transitions);
    EventChannels* current_channels_locked();
    void reap_retired_locked();
    void apply_progress_locked(int worker_id, int progress);
    void apply_status_locked(int worker_id, WorkerState state, std::optional<double> duration,
                             std::vector<WorkerView>& transitions);
    WorkerView* find_row_locked(int worker_id);
    void notify(const std::vector<WorkerView>& transitions);

    std::shared_ptr<Logger> logger_;
    std::shared_ptr<IPrioritySetter> priority_setter_;
    std::shared_ptr<IWorkSimulator> simulator_;
    PoolSettings settings_;

    mutable std::mutex mtx_;
    std::uint64_t generation_{0};
    bool running_{false};
    std::unique_ptr<Generation> current_;
    std::vector<std::unique_ptr<Generation>> retired_;
    std::vector<WorkerView> rows_;

    std::mutex listener_mtx_;
    StateListener listener_;
};

} // namespace ProcSync
