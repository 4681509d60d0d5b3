/**
 * \file pool/signals/CoordinationSignals.hpp
 * \brief Pause and Stop flags shared by one generation of workers and its controller.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ProcSync {

/** \brief Why an interruptible sleep returned. */
enum class WakeReason { Elapsed, Paused, Stopped };

/**
 * \brief Two independent level-triggered flags with a change notification.
 *
 * Readers may poll the flags at any time. Waiters block on a condition
 * variable that every set/clear notifies, so a paused worker wakes as soon
 * as either flag changes instead of spinning. Stop may be set while Pause is
 * set; nothing couples the two.
 */
class CoordinationSignals {
public:
    CoordinationSignals() = default;

    CoordinationSignals(const CoordinationSignals&) = delete;
    CoordinationSignals& operator=(const CoordinationSignals&) = delete;

    void set_pause(bool value);
    /** \brief Flip Pause and return the new value. */
    bool toggle_pause();
    void set_stop(bool value);
    /** \brief Clear both flags. */
    void reset();

    bool is_paused() const noexcept { return pause_.load(std::memory_order_acquire); }
    bool is_stop_requested() const noexcept { return stop_.load(std::memory_order_acquire); }

    /**
     * \brief Block while Pause is set.
     * \param recheck Upper bound between re-checks of the flags, in case a
     *        notification is missed.
     * \return true when the wait ended because Stop was set.
     */
    bool wait_while_paused(std::chrono::milliseconds recheck = std::chrono::milliseconds(100));

    /**
     * \brief Sleep for \p duration unless Pause or Stop is set first.
     *
     * Stop takes precedence when both flags are set. A flag already set on
     * entry returns immediately.
     */
    WakeReason sleep_unless_interrupted(std::chrono::steady_clock::duration duration);

private:
    void notify();

    std::atomic<bool> pause_{false};
    std::atomic<bool> stop_{false};

    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace ProcSync
