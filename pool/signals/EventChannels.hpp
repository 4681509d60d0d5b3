/**
 * \file pool/signals/EventChannels.hpp
 * \brief Event types emitted by workers and the per-generation channels carrying them.
 */
#pragma once

#include "NonBlockingThreadSafeQueue.hpp"
#include "pool/PoolTypes.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace ProcSync {

/** \brief A worker entered \c state. \c duration_seconds is set only for Completed. */
struct StatusEvent {
    int worker_id = -1;
    WorkerState state = WorkerState::Starting;
    PriorityLevel priority = PriorityLevel::Normal;
    std::optional<double> duration_seconds;
};

/** \brief A worker finished its \c progress-th step (0..100). */
struct ProgressEvent {
    int worker_id = -1;
    int progress = 0;
};

/** \brief Free-form log line; unstamped lines are stamped when reconciled. */
struct LogEvent {
    std::string text;
    std::optional<std::chrono::system_clock::time_point> timestamp;

    static LogEvent now(std::string text) {
        return LogEvent{std::move(text), std::chrono::system_clock::now()};
    }
};

/**
 * \brief The three multi-producer/single-consumer channels of one generation.
 *
 * Workers only push; the controller only drains. A fresh instance is built
 * for every generation so events can never cross from one run to the next.
 */
struct EventChannels {
    NonBlockingThreadSafeQueue<StatusEvent> status;
    NonBlockingThreadSafeQueue<ProgressEvent> progress;
    NonBlockingThreadSafeQueue<LogEvent> log;

    void clear() {
        status.clear();
        progress.clear();
        log.clear();
    }

    bool empty() const {
        return status.empty() && progress.empty() && log.empty();
    }
};

} // namespace ProcSync
