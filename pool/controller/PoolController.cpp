/**
 * \file pool/controller/PoolController.cpp
 * \brief Generation lifecycle, stop/reclaim and event reconciliation.
 */
#include "PoolController.hpp"
#include "pool/PoolErrors.hpp"
#include "pool/priority/IPrioritySetter.hpp"
#include "pool/signals/CoordinationSignals.hpp"
#include "pool/signals/EventChannels.hpp"
#include "pool/worker/WorkSimulator.hpp"
#include "pool/worker/WorkerTask.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace ProcSync {

/** \brief Everything one run shares between its workers and the controller. */
struct PoolController::Generation {
    explicit Generation(std::uint64_t generation_id) : id(generation_id) {}

    ~Generation() {
        // Workers join in their destructors; make sure none is still waiting
        signals.set_stop(true);
        tasks.clear();
    }

    bool all_exited() const {
        return std::all_of(tasks.begin(), tasks.end(),
                           [](const std::unique_ptr<WorkerTask>& t) { return t->has_exited(); });
    }

    std::uint64_t id;
    CoordinationSignals signals;
    EventChannels channels;
    // Declared last so workers are joined before the signals and channels go away
    std::vector<std::unique_ptr<WorkerTask>> tasks;
};

PoolController::PoolController(std::shared_ptr<Logger> logger,
                               std::shared_ptr<IPrioritySetter> priority_setter,
                               std::shared_ptr<IWorkSimulator> simulator,
                               PoolSettings settings)
    : logger_(std::move(logger))
    , priority_setter_(std::move(priority_setter))
    , simulator_(std::move(simulator))
    , settings_(settings) {
    if (!logger_) {
        throw std::invalid_argument("PoolController: logger cannot be null");
    }
    if (!priority_setter_) {
        throw std::invalid_argument("PoolController: priority setter cannot be null");
    }
    if (!simulator_) {
        simulator_ = std::make_shared<DefaultWorkSimulator>();
    }
    logger_->info(std::string("PoolController: priority backend '") + priority_setter_->backend_name() + "'");
}

PoolController::~PoolController() {
    std::vector<WorkerView> transitions;
    std::unique_ptr<Generation> stopping;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping = begin_stop_locked(transitions);
    }
    finish_stop(std::move(stopping));

    // Stragglers have Stop set; wait for them rather than leave threads behind
    std::vector<std::unique_ptr<Generation>> retired;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        retired.swap(retired_);
    }
    retired.clear();
}

bool PoolController::start(int count, double speed, PriorityLevel priority) {
    if (count < kMinWorkers || count > kMaxWorkers) {
        logger_->error("PoolController: rejected start, process count " + std::to_string(count) +
                       " outside [" + std::to_string(kMinWorkers) + ", " + std::to_string(kMaxWorkers) + "]");
        return false;
    }
    if (!is_valid_speed(speed)) {
        logger_->error("PoolController: rejected start, unsupported speed " + format_speed(speed));
        return false;
    }

    std::vector<WorkerView> transitions;
    std::unique_ptr<Generation> previous;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        previous = begin_stop_locked(transitions);
    }
    finish_stop(std::move(previous));

    std::unique_ptr<Generation> failed;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (auto raced = begin_stop_locked(transitions)) {
            // A concurrent start slipped in while the previous run wound down
            raced->channels.clear();
            retired_.push_back(std::move(raced));
        }
        reap_retired_locked();

        auto gen = std::make_unique<Generation>(++generation_);
        rows_.clear();
        rows_.reserve(static_cast<size_t>(count));
        gen->tasks.reserve(static_cast<size_t>(count));
        for (int i = 0; i < count; ++i) {
            WorkerConfig cfg{i, priority, speed, settings_.base_delay};
            gen->tasks.push_back(std::make_unique<WorkerTask>(
                cfg, gen->signals, gen->channels, *priority_setter_, *simulator_));
            rows_.push_back(WorkerView{i, WorkerState::Starting, 0, speed, priority, std::nullopt, gen->id});
        }

        try {
            for (auto& task : gen->tasks) {
                task->start();
            }
            current_ = std::move(gen);
            running_ = true;
            logger_->info("Started " + std::to_string(count) + " processes (Speed: " + format_speed(speed) +
                          ", Priority: " + to_string(priority) + ")");
        } catch (const std::system_error& e) {
            logger_->error(std::string("PoolController: failed to spawn workers: ") + e.what());
            terminate_open_rows_locked(transitions);
            failed = std::move(gen);
        }
    }
    if (failed) {
        // Generation destructor stops and joins whatever did start
        failed.reset();
        notify(transitions);
        return false;
    }
    notify(transitions);
    return true;
}

bool PoolController::toggle_pause() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!current_ || !running_) {
        logger_->warning("PoolController: toggle pause ignored, no processes running");
        return false;
    }
    const bool paused = current_->signals.toggle_pause();
    logger_->info(paused ? "All processes paused" : "All processes resumed");
    return paused;
}

void PoolController::stop() {
    std::vector<WorkerView> transitions;
    std::unique_ptr<Generation> stopping;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping = begin_stop_locked(transitions);
    }
    notify(transitions);
    finish_stop(std::move(stopping));
}

std::unique_ptr<PoolController::Generation> PoolController::begin_stop_locked(std::vector<WorkerView>& transitions) {
    if (!current_ || !running_) {
        return nullptr;
    }
    running_ = false;
    logger_->info("Stopping all processes...");
    current_->signals.set_stop(true);
    // Rows are final from here on; nothing the workers still send is applied
    terminate_open_rows_locked(transitions);
    return std::move(current_);
}

void PoolController::finish_stop(std::unique_ptr<Generation> gen) {
    if (!gen) {
        return;
    }
    const auto deadline = std::chrono::steady_clock::now() + settings_.grace_period;
    std::size_t stragglers = 0;
    for (auto& task : gen->tasks) {
        if (task->wait_exit_until(deadline)) {
            task->join();
        } else {
            ++stragglers;
            logger_->warning("Process " + std::to_string(task->id()) + " did not exit within " +
                             std::to_string(settings_.grace_period.count()) + " ms: " +
                             make_error_code(Errc::ForcedTermination).message());
        }
    }

    gen->channels.clear();
    if (stragglers > 0) {
        // Park the whole generation: its Stop flag stays set and the
        // stragglers keep valid references until they are reaped
        std::lock_guard<std::mutex> lk(mtx_);
        retired_.push_back(std::move(gen));
    }
    logger_->info("All processes stopped");
}

void PoolController::terminate_open_rows_locked(std::vector<WorkerView>& transitions) {
    for (auto& row : rows_) {
        if (!is_terminal(row.state)) {
            row.state = WorkerState::Terminated;
            transitions.push_back(row);
        }
    }
}

EventChannels* PoolController::current_channels_locked() {
    return current_ ? &current_->channels : nullptr;
}

void PoolController::reap_retired_locked() {
    auto it = retired_.begin();
    while (it != retired_.end()) {
        if ((*it)->all_exited()) {
            logger_->info("PoolController: reclaimed generation " + std::to_string((*it)->id));
            it = retired_.erase(it);
        } else {
            ++it;
        }
    }
}

void PoolController::reconcile_tick() {
    std::vector<WorkerView> transitions;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        reap_retired_locked();
        if (!current_) {
            return;
        }

        // Progress before status: a Completed seen this tick always lands on
        // a row whose earlier progress is already applied
        for (const auto& ev : current_->channels.progress.drain()) {
            apply_progress_locked(ev.worker_id, ev.progress);
        }
        for (const auto& ev : current_->channels.status.drain()) {
            apply_status_locked(ev.worker_id, ev.state, ev.duration_seconds, transitions);
        }
        for (auto& ev : current_->channels.log.drain()) {
            logger_->log(LogLevel::Info, ev.text, ev.timestamp.value_or(std::chrono::system_clock::now()));
        }
    }
    notify(transitions);
}

WorkerView* PoolController::find_row_locked(int worker_id) {
    if (worker_id < 0 || worker_id >= static_cast<int>(rows_.size())) {
        return nullptr;
    }
    return &rows_[static_cast<size_t>(worker_id)];
}

void PoolController::apply_progress_locked(int worker_id, int progress) {
    WorkerView* row = find_row_locked(worker_id);
    if (!row || is_terminal(row->state)) {
        return;
    }
    // 100 is shown only together with Completed
    const int capped = std::clamp(progress, 0, kMaxProgress - 1);
    row->progress = std::max(row->progress, capped);
}

void PoolController::apply_status_locked(int worker_id, WorkerState state, std::optional<double> duration,
                                         std::vector<WorkerView>& transitions) {
    WorkerView* row = find_row_locked(worker_id);
    if (!row) {
        logger_->debug("PoolController: dropped status for unknown process " + std::to_string(worker_id));
        return;
    }
    if (is_terminal(row->state) || state == WorkerState::Starting) {
        return;
    }

    row->state = state;
    if (state == WorkerState::Completed) {
        row->progress = kMaxProgress;
        row->duration_seconds = duration;
    }
    transitions.push_back(*row);
}

void PoolController::notify(const std::vector<WorkerView>& transitions) {
    if (transitions.empty()) return;
    StateListener listener;
    {
        std::lock_guard<std::mutex> lk(listener_mtx_);
        listener = listener_;
    }
    if (!listener) return;
    for (const auto& row : transitions) {
        listener(row);
    }
}

std::vector<WorkerView> PoolController::workers() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return rows_;
}

std::uint64_t PoolController::generation() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return generation_;
}

bool PoolController::is_active() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return current_ && running_;
}

bool PoolController::is_paused() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return current_ && running_ && current_->signals.is_paused();
}

bool PoolController::all_finished() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return !rows_.empty() && std::all_of(rows_.begin(), rows_.end(),
                                         [](const WorkerView& row) { return is_terminal(row.state); });
}

bool PoolController::channels_empty() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return !current_ || current_->channels.empty();
}

std::size_t PoolController::retired_generations() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return retired_.size();
}

void PoolController::set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lk(listener_mtx_);
    listener_ = std::move(listener);
}

} // namespace ProcSync
