/**
 * \file pool/worker/WorkerTask.cpp
 * \brief Worker lifecycle loop: priority, pause handling, work steps, completion.
 */
#include "WorkerTask.hpp"
#include "WorkSimulator.hpp"
#include "pool/priority/IPrioritySetter.hpp"
#include "pool/signals/CoordinationSignals.hpp"
#include "pool/signals/EventChannels.hpp"
#include "processUtils.hpp"

#include <exception>
#include <iomanip>
#include <random>
#include <sstream>

namespace ProcSync {

namespace {

constexpr auto kPauseRecheck = std::chrono::milliseconds(100);

} // namespace

WorkerTask::WorkerTask(WorkerConfig config,
                       CoordinationSignals& signals,
                       EventChannels& channels,
                       IPrioritySetter& priority_setter,
                       IWorkSimulator& simulator)
    : config_(config)
    , signals_(signals)
    , channels_(channels)
    , priority_setter_(priority_setter)
    , simulator_(simulator)
    , exited_future_(exited_.get_future().share()) {}

WorkerTask::~WorkerTask() {
    join();
}

void WorkerTask::start() {
    thread_ = std::thread(&WorkerTask::run, this);
}

bool WorkerTask::wait_exit_until(std::chrono::steady_clock::time_point deadline) const {
    return exited_future_.wait_until(deadline) == std::future_status::ready;
}

bool WorkerTask::has_exited() const {
    return exited_future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void WorkerTask::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void WorkerTask::run() {
    ProcessUtils::set_current_thread_name("worker-" + std::to_string(config_.id));
    try {
        run_steps();
    } catch (const std::exception& e) {
        // A failing step ends this worker; the rest of the pool keeps going
        emit_log(label() + " failed: " + e.what());
        if (!is_terminal(state())) {
            enter_state(WorkerState::Terminated);
        }
    }
    exited_.set_value();
}

void WorkerTask::run_steps() {
    start_time_ = std::chrono::steady_clock::now();
    enter_state(WorkerState::Running);
    emit_log(label() + " started (Priority: " + to_string(config_.priority) +
             ", Speed: " + format_speed(config_.speed) + ")");

    if (auto ec = priority_setter_.set_priority(config_.priority)) {
        emit_log(label() + " priority setting failed (" + priority_setter_.backend_name() +
                 "): " + ec.message());
    }

    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> kind_dist(0, 2);
    const auto step_delay = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double, std::milli>(config_.base_delay.count() / config_.speed));

    while (progress() < kMaxProgress && !signals_.is_stop_requested()) {
        if (signals_.is_paused() && !hold_while_paused()) {
            return;
        }

        const auto kind = static_cast<WorkKind>(kind_dist(rng));
        simulator_.perform(kind);
        emit_log(label() + " performing " + to_string(kind) + " work");

        // Pause cuts the step delay short; the remainder is slept after resume
        bool stopped = false;
        auto remaining = step_delay;
        while (remaining > std::chrono::steady_clock::duration::zero()) {
            const auto slept_from = std::chrono::steady_clock::now();
            const WakeReason wake = signals_.sleep_unless_interrupted(remaining);
            if (wake == WakeReason::Elapsed) {
                break;
            }
            if (wake == WakeReason::Stopped) {
                stopped = true;
                break;
            }
            remaining -= std::chrono::steady_clock::now() - slept_from;
            if (signals_.is_paused() && !hold_while_paused()) {
                return;
            }
        }
        if (stopped) {
            break;
        }
        const int reached = progress_.fetch_add(1, std::memory_order_acq_rel) + 1;
        channels_.progress.push(ProgressEvent{config_.id, reached});
    }

    end_time_ = std::chrono::steady_clock::now();
    if (progress() >= kMaxProgress) {
        const double duration = std::chrono::duration<double>(end_time_ - start_time_).count();
        enter_state(WorkerState::Completed, duration);
        std::ostringstream oss;
        oss << label() << " completed in " << std::fixed << std::setprecision(2) << duration << " seconds";
        emit_log(oss.str());
    }
    // Stopped mid-run: the controller records Terminated for this worker
}

bool WorkerTask::hold_while_paused() {
    enter_state(WorkerState::Paused);
    emit_log(label() + " paused");
    if (signals_.wait_while_paused(kPauseRecheck)) {
        enter_state(WorkerState::Terminated);
        emit_log(label() + " terminated while paused");
        return false;
    }
    enter_state(WorkerState::Running);
    emit_log(label() + " resumed");
    return true;
}

void WorkerTask::enter_state(WorkerState state, std::optional<double> duration_seconds) {
    state_.store(state, std::memory_order_release);
    channels_.status.push(StatusEvent{config_.id, state, config_.priority, duration_seconds});
}

void WorkerTask::emit_log(std::string text) {
    channels_.log.push(LogEvent::now(std::move(text)));
}

std::string WorkerTask::label() const {
    return "Process " + std::to_string(config_.id);
}

} // namespace ProcSync
