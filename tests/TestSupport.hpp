/**
 * \file tests/TestSupport.hpp
 * \brief Fakes and polling helpers shared by the test suites.
 */
#pragma once

#include "logger.hpp"
#include "pool/priority/IPrioritySetter.hpp"
#include "pool/PoolErrors.hpp"
#include "pool/worker/WorkSimulator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ProcSync::test {

/// Work step that returns immediately so tests are bound only by the step delay.
class InstantWorkSimulator : public IWorkSimulator {
public:
    void perform(WorkKind) override { ++steps; }
    std::atomic<int> steps{0};
};

/// Work step that blocks every caller until \c release() is called.
class BlockingWorkSimulator : public IWorkSimulator {
public:
    void perform(WorkKind) override {
        std::unique_lock<std::mutex> lk(mtx_);
        ++entered;
        cv_.notify_all();
        cv_.wait(lk, [this] { return released_; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            released_ = true;
        }
        cv_.notify_all();
    }

    bool wait_entered(int count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, timeout, [&] { return entered >= count; });
    }

    int entered = 0; // Protected by mtx_

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    bool released_ = false;
};

/// Priority setter that records the requested levels and always succeeds.
class RecordingPrioritySetter : public IPrioritySetter {
public:
    const char* backend_name() const noexcept override { return "recording"; }
    std::error_code set_priority(PriorityLevel level) override {
        std::lock_guard<std::mutex> lk(mtx);
        levels.push_back(level);
        return result;
    }

    std::mutex mtx;
    std::vector<PriorityLevel> levels;
    std::error_code result;
};

/// Logger writing only to an in-memory sink.
inline std::shared_ptr<Logger> make_memory_logger(LogLevel level = LogLevel::Debug) {
    auto logger = std::make_shared<Logger>("Test");
    auto sink = std::make_shared<VectorSink>();
    sink->set_level(level);
    logger->add_sink(sink);
    return logger;
}

inline bool any_line_contains(const Logger& logger, const std::string& needle) {
    for (const auto& line : logger.get_lines()) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

/// Poll \p pred every few milliseconds until it holds or \p timeout elapses.
inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
                       const std::function<void()>& each_round = {}) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (each_round) each_round();
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (each_round) each_round();
    return pred();
}

} // namespace ProcSync::test
