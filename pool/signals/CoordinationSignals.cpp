#include "CoordinationSignals.hpp"

namespace ProcSync {

void CoordinationSignals::set_pause(bool value) {
    pause_.store(value, std::memory_order_release);
    notify();
}

bool CoordinationSignals::toggle_pause() {
    // CAS loop so concurrent toggles never lose an update
    bool current = pause_.load(std::memory_order_acquire);
    while (!pause_.compare_exchange_weak(current, !current, std::memory_order_acq_rel)) {
    }
    notify();
    return !current;
}

void CoordinationSignals::set_stop(bool value) {
    stop_.store(value, std::memory_order_release);
    notify();
}

void CoordinationSignals::reset() {
    pause_.store(false, std::memory_order_release);
    stop_.store(false, std::memory_order_release);
    notify();
}

bool CoordinationSignals::wait_while_paused(std::chrono::milliseconds recheck) {
    std::unique_lock<std::mutex> lk(mtx_);
    while (is_paused() && !is_stop_requested()) {
        cv_.wait_for(lk, recheck);
    }
    return is_stop_requested();
}

WakeReason CoordinationSignals::sleep_unless_interrupted(std::chrono::steady_clock::duration duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_until(lk, deadline, [this] { return is_stop_requested() || is_paused(); });
    if (is_stop_requested()) return WakeReason::Stopped;
    if (is_paused()) return WakeReason::Paused;
    return WakeReason::Elapsed;
}

void CoordinationSignals::notify() {
    // Taking the lock orders the store before any waiter's predicate check
    { std::lock_guard<std::mutex> lk(mtx_); }
    cv_.notify_all();
}

} // namespace ProcSync
