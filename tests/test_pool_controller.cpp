#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "pool/controller/PoolController.hpp"
#include "pool/signals/EventChannels.hpp"

#include <algorithm>
#include <future>
#include <map>
#include <utility>

namespace ProcSync {

/// Pushes events straight into the running generation's channels.
class PoolControllerTestPeer {
public:
    template <typename Fn>
    static bool with_channels(PoolController& controller, Fn&& fn) {
        std::lock_guard<std::mutex> lk(controller.mtx_);
        EventChannels* channels = controller.current_channels_locked();
        if (!channels) return false;
        fn(*channels);
        return true;
    }
};

} // namespace ProcSync

using namespace ProcSync;
using namespace ProcSync::test;
using namespace std::chrono_literals;

namespace {

/// Records every applied transition and counts terminal ones per (generation, id).
struct TransitionLog {
    std::mutex mtx;
    std::vector<WorkerView> transitions;
    std::map<std::pair<std::uint64_t, int>, int> terminal_count;

    void record(const WorkerView& row) {
        std::lock_guard<std::mutex> lk(mtx);
        transitions.push_back(row);
        if (is_terminal(row.state)) ++terminal_count[{row.generation, row.id}];
    }

    int max_terminal_per_worker() {
        std::lock_guard<std::mutex> lk(mtx);
        int most = 0;
        for (const auto& [key, n] : terminal_count) most = std::max(most, n);
        return most;
    }

    size_t size() {
        std::lock_guard<std::mutex> lk(mtx);
        return transitions.size();
    }

    int terminal_of(WorkerState state) {
        std::lock_guard<std::mutex> lk(mtx);
        int n = 0;
        for (const auto& row : transitions) n += row.state == state;
        return n;
    }
};

class PoolControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger = make_memory_logger();
        setter = std::make_shared<RecordingPrioritySetter>();
        simulator = std::make_shared<InstantWorkSimulator>();
    }

    std::unique_ptr<PoolController> make_controller(std::chrono::milliseconds base_delay = 1ms,
                                                    std::chrono::milliseconds grace = 1000ms,
                                                    std::shared_ptr<IWorkSimulator> sim = nullptr) {
        PoolSettings settings;
        settings.base_delay = base_delay;
        settings.grace_period = grace;
        if (!sim) sim = simulator;
        auto controller = std::make_unique<PoolController>(logger, setter, sim, settings);
        controller->set_state_listener([this](const WorkerView& row) { transitions.record(row); });
        return controller;
    }

    bool run_until_finished(PoolController& controller, std::chrono::milliseconds timeout = 10s) {
        return eventually([&] { return controller.all_finished(); }, timeout,
                          [&] { controller.reconcile_tick(); });
    }

    static bool all_in(const std::vector<WorkerView>& rows, WorkerState state) {
        return std::all_of(rows.begin(), rows.end(), [state](const WorkerView& r) { return r.state == state; });
    }

    std::shared_ptr<Logger> logger;
    std::shared_ptr<RecordingPrioritySetter> setter;
    std::shared_ptr<InstantWorkSimulator> simulator;
    TransitionLog transitions;
};

} // namespace

TEST_F(PoolControllerTest, FourWorkersRunToCompletion)
{
    auto controller = make_controller();
    ASSERT_TRUE(controller->start(4, 1.0, PriorityLevel::Normal));
    ASSERT_TRUE(run_until_finished(*controller));

    auto rows = controller->workers();
    ASSERT_EQ(rows.size(), 4u);
    for (int i = 0; i < 4; ++i) {
        const auto& row = rows[static_cast<size_t>(i)];
        EXPECT_EQ(row.id, i);
        EXPECT_EQ(row.state, WorkerState::Completed);
        EXPECT_EQ(row.progress, 100);
        ASSERT_TRUE(row.duration_seconds.has_value());
        EXPECT_GT(*row.duration_seconds, 0.0);
        EXPECT_EQ(row.priority, PriorityLevel::Normal);
    }
    EXPECT_EQ(transitions.terminal_of(WorkerState::Completed), 4);
    EXPECT_TRUE(any_line_contains(*logger, "Started 4 processes (Speed: 1x, Priority: Normal)"));
    EXPECT_TRUE(any_line_contains(*logger, "Process 2 completed in"));
}

TEST_F(PoolControllerTest, EveryCountCompletesWithDistinctIds)
{
    auto controller = make_controller();
    for (int count : {1, 7, 32}) {
        ASSERT_TRUE(controller->start(count, 10.0, PriorityLevel::Low));
        ASSERT_TRUE(run_until_finished(*controller)) << "count " << count;

        auto rows = controller->workers();
        ASSERT_EQ(rows.size(), static_cast<size_t>(count));
        for (int i = 0; i < count; ++i) {
            EXPECT_EQ(rows[static_cast<size_t>(i)].id, i);
            EXPECT_EQ(rows[static_cast<size_t>(i)].state, WorkerState::Completed);
            EXPECT_EQ(rows[static_cast<size_t>(i)].progress, 100);
            EXPECT_GT(rows[static_cast<size_t>(i)].duration_seconds.value_or(0.0), 0.0);
        }
    }
    EXPECT_EQ(controller->generation(), 3u);
    EXPECT_EQ(transitions.max_terminal_per_worker(), 1);
}

TEST_F(PoolControllerTest, PauseThenResumeCompletes)
{
    auto controller = make_controller(5ms);
    ASSERT_TRUE(controller->start(2, 1.0, PriorityLevel::Normal));
    EXPECT_TRUE(controller->toggle_pause());
    EXPECT_TRUE(controller->is_paused());

    EXPECT_TRUE(eventually([&] { return all_in(controller->workers(), WorkerState::Paused); }, 200ms,
                           [&] { controller->reconcile_tick(); }));
    EXPECT_TRUE(any_line_contains(*logger, "All processes paused"));

    // Paused rows do not advance
    const auto frozen = controller->workers();
    std::this_thread::sleep_for(50ms);
    controller->reconcile_tick();
    const auto later = controller->workers();
    for (size_t i = 0; i < frozen.size(); ++i) {
        EXPECT_EQ(frozen[i].progress, later[i].progress);
    }

    EXPECT_FALSE(controller->toggle_pause());
    EXPECT_TRUE(any_line_contains(*logger, "All processes resumed"));
    ASSERT_TRUE(run_until_finished(*controller));
    EXPECT_TRUE(all_in(controller->workers(), WorkerState::Completed));
}

TEST_F(PoolControllerTest, PauseIsSeenMidStepAtSlowestSpeed)
{
    // 0.1x turns the 50 ms base delay into a 500 ms step
    auto controller = make_controller(50ms);
    ASSERT_TRUE(controller->start(2, 0.1, PriorityLevel::Normal));
    std::this_thread::sleep_for(30ms);

    ASSERT_TRUE(controller->toggle_pause());
    const auto paused_at = std::chrono::steady_clock::now();
    EXPECT_TRUE(eventually([&] { return all_in(controller->workers(), WorkerState::Paused); }, 200ms,
                           [&] { controller->reconcile_tick(); }));
    EXPECT_LT(std::chrono::steady_clock::now() - paused_at, 250ms);

    // The interrupted step is not counted until it has slept its full delay
    for (const auto& row : controller->workers()) {
        EXPECT_EQ(row.progress, 0) << "id " << row.id;
    }

    EXPECT_FALSE(controller->toggle_pause());
    EXPECT_TRUE(eventually([&] {
        const auto rows = controller->workers();
        return std::all_of(rows.begin(), rows.end(), [](const WorkerView& r) { return r.progress >= 1; });
    }, 2s, [&] { controller->reconcile_tick(); }));
    EXPECT_TRUE(all_in(controller->workers(), WorkerState::Running));
    controller->stop();
    EXPECT_TRUE(all_in(controller->workers(), WorkerState::Terminated));
}

TEST_F(PoolControllerTest, EarlyStopTerminatesAllAndRestartIsClean)
{
    auto controller = make_controller(5ms);
    ASSERT_TRUE(controller->start(8, 1.0, PriorityLevel::High));
    std::this_thread::sleep_for(10ms);
    controller->reconcile_tick();

    const auto before = std::chrono::steady_clock::now();
    controller->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1000ms);

    auto rows = controller->workers();
    ASSERT_EQ(rows.size(), 8u);
    EXPECT_TRUE(all_in(rows, WorkerState::Terminated));
    EXPECT_TRUE(controller->channels_empty());
    EXPECT_FALSE(controller->is_active());
    EXPECT_EQ(controller->retired_generations(), 0u);
    EXPECT_TRUE(any_line_contains(*logger, "All processes stopped"));

    controller->reconcile_tick();
    EXPECT_TRUE(all_in(controller->workers(), WorkerState::Terminated));

    const auto first_generation = controller->generation();
    ASSERT_TRUE(controller->start(8, 1.0, PriorityLevel::High));
    EXPECT_EQ(controller->generation(), first_generation + 1);
    for (const auto& row : controller->workers()) {
        EXPECT_EQ(row.generation, first_generation + 1);
        EXPECT_EQ(row.state, WorkerState::Starting);
        EXPECT_EQ(row.progress, 0);
    }

    controller->reconcile_tick();
    for (const auto& row : controller->workers()) {
        EXPECT_EQ(row.generation, first_generation + 1);
        EXPECT_NE(row.state, WorkerState::Terminated);
    }
    controller->stop();
}

TEST_F(PoolControllerTest, StopAtAnyPointLeavesOnlyTerminalRows)
{
    auto controller = make_controller();
    for (auto delay : {0ms, 3ms, 17ms, 40ms, 90ms, 150ms, 400ms}) {
        ASSERT_TRUE(controller->start(6, 1.0, PriorityLevel::Normal));
        const auto until = std::chrono::steady_clock::now() + delay;
        while (std::chrono::steady_clock::now() < until) {
            controller->reconcile_tick();
            std::this_thread::sleep_for(1ms);
        }
        controller->stop();
        for (const auto& row : controller->workers()) {
            EXPECT_TRUE(is_terminal(row.state)) << "delay " << delay.count() << " id " << row.id;
        }
        EXPECT_TRUE(controller->channels_empty());
    }
    EXPECT_EQ(transitions.max_terminal_per_worker(), 1);
}

TEST_F(PoolControllerTest, StopWinsOverUnreconciledCompletion)
{
    auto controller = make_controller();
    ASSERT_TRUE(controller->start(1, 10.0, PriorityLevel::Normal));

    // The worker finishes while nothing reconciles; its Completed sits in the channel
    std::this_thread::sleep_for(500ms);
    EXPECT_FALSE(controller->channels_empty());

    controller->stop();
    auto rows = controller->workers();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].state, WorkerState::Terminated);
    EXPECT_LT(rows[0].progress, 100);
    EXPECT_FALSE(rows[0].duration_seconds.has_value());

    controller->reconcile_tick();
    EXPECT_EQ(controller->workers()[0].state, WorkerState::Terminated);
    EXPECT_EQ(transitions.terminal_of(WorkerState::Completed), 0);
    EXPECT_EQ(transitions.terminal_of(WorkerState::Terminated), 1);
}

TEST_F(PoolControllerTest, ObservedCompletionSurvivesStop)
{
    auto controller = make_controller();
    ASSERT_TRUE(controller->start(3, 10.0, PriorityLevel::Normal));
    ASSERT_TRUE(run_until_finished(*controller));

    controller->stop();
    EXPECT_TRUE(all_in(controller->workers(), WorkerState::Completed));
    EXPECT_EQ(transitions.terminal_of(WorkerState::Terminated), 0);
    EXPECT_EQ(transitions.max_terminal_per_worker(), 1);
}

TEST_F(PoolControllerTest, NoWorkerRecordsTwoTerminalTransitionsNearCompletion)
{
    auto controller = make_controller();
    // Aim the stop at the tail of the run where Completed and Stop race
    for (int round = 0; round < 10; ++round) {
        ASSERT_TRUE(controller->start(4, 1.0, PriorityLevel::Normal));
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(100 + round * 3);
        while (std::chrono::steady_clock::now() < until) {
            controller->reconcile_tick();
            std::this_thread::sleep_for(1ms);
        }
        controller->stop();
        controller->reconcile_tick();
        for (const auto& row : controller->workers()) {
            EXPECT_TRUE(is_terminal(row.state));
            EXPECT_EQ(row.progress == 100, row.state == WorkerState::Completed);
        }
    }
    EXPECT_EQ(transitions.max_terminal_per_worker(), 1);
}

TEST_F(PoolControllerTest, DoubleToggleIsSteadyStateNoOp)
{
    auto controller = make_controller();
    ASSERT_TRUE(controller->start(3, 1.0, PriorityLevel::Normal));
    EXPECT_TRUE(controller->toggle_pause());
    EXPECT_FALSE(controller->toggle_pause());
    EXPECT_FALSE(controller->is_paused());

    ASSERT_TRUE(run_until_finished(*controller));
    EXPECT_TRUE(all_in(controller->workers(), WorkerState::Completed));
}

TEST_F(PoolControllerTest, ProgressIsMonotonicAndFullOnlyWhenCompleted)
{
    auto controller = make_controller(2ms);
    ASSERT_TRUE(controller->start(5, 1.0, PriorityLevel::Normal));

    std::vector<int> last(5, 0);
    bool ok = eventually([&] {
        controller->reconcile_tick();
        for (const auto& row : controller->workers()) {
            auto& prev = last[static_cast<size_t>(row.id)];
            EXPECT_GE(row.progress, prev) << "id " << row.id;
            EXPECT_EQ(row.progress == 100, row.state == WorkerState::Completed) << "id " << row.id;
            prev = row.progress;
        }
        return controller->all_finished();
    }, 10s);
    EXPECT_TRUE(ok);
}

TEST_F(PoolControllerTest, StragglersAreReclaimedAfterGracePeriod)
{
    auto blocking = std::make_shared<BlockingWorkSimulator>();
    auto controller = make_controller(1ms, 50ms, blocking);
    ASSERT_TRUE(controller->start(2, 1.0, PriorityLevel::Normal));
    ASSERT_TRUE(blocking->wait_entered(2, 2s));

    const auto before = std::chrono::steady_clock::now();
    controller->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1000ms);

    EXPECT_TRUE(all_in(controller->workers(), WorkerState::Terminated));
    EXPECT_EQ(controller->retired_generations(), 1u);
    EXPECT_FALSE(controller->is_active());
    EXPECT_TRUE(any_line_contains(*logger, "did not exit within 50 ms"));

    blocking->release();
    EXPECT_TRUE(eventually([&] { return controller->retired_generations() == 0; }, 2s,
                           [&] { controller->reconcile_tick(); }));
    EXPECT_TRUE(any_line_contains(*logger, "reclaimed generation 1"));
    EXPECT_TRUE(all_in(controller->workers(), WorkerState::Terminated));
}

TEST_F(PoolControllerTest, StopWaitDoesNotBlockReconcileOrView)
{
    auto blocking = std::make_shared<BlockingWorkSimulator>();
    auto controller = make_controller(1ms, 300ms, blocking);
    ASSERT_TRUE(controller->start(2, 1.0, PriorityLevel::Normal));
    ASSERT_TRUE(blocking->wait_entered(2, 2s));

    auto stopping = std::async(std::launch::async, [&] { controller->stop(); });
    ASSERT_TRUE(eventually([&] { return any_line_contains(*logger, "Stopping all processes"); }, 1s));
    ASSERT_EQ(stopping.wait_for(0ms), std::future_status::timeout);

    // The grace wait is still running; the control thread must not stall on it
    const auto before = std::chrono::steady_clock::now();
    controller->reconcile_tick();
    const auto rows = controller->workers();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 100ms);
    EXPECT_EQ(stopping.wait_for(0ms), std::future_status::timeout);
    EXPECT_TRUE(all_in(rows, WorkerState::Terminated));
    EXPECT_TRUE(eventually([&] { return transitions.terminal_of(WorkerState::Terminated) == 2; }, 1s));

    ASSERT_EQ(stopping.wait_for(2s), std::future_status::ready);
    stopping.get();
    EXPECT_TRUE(any_line_contains(*logger, "did not exit within 300 ms"));

    blocking->release();
    EXPECT_TRUE(eventually([&] { return controller->retired_generations() == 0; }, 2s,
                           [&] { controller->reconcile_tick(); }));
}

TEST_F(PoolControllerTest, EventsForUnknownIdsLeaveRowsUntouched)
{
    auto blocking = std::make_shared<BlockingWorkSimulator>();
    auto controller = make_controller(1ms, 1000ms, blocking);
    ASSERT_TRUE(controller->start(2, 1.0, PriorityLevel::Normal));
    ASSERT_TRUE(blocking->wait_entered(2, 2s));
    ASSERT_TRUE(eventually([&] { return all_in(controller->workers(), WorkerState::Running); }, 1s,
                           [&] { controller->reconcile_tick(); }));

    const auto before = controller->workers();
    const auto transitions_before = transitions.size();

    ASSERT_TRUE(PoolControllerTestPeer::with_channels(*controller, [](EventChannels& ch) {
        for (int bad_id : {-1, 2, 99}) {
            ch.progress.push(ProgressEvent{bad_id, 50});
            ch.status.push(StatusEvent{bad_id, WorkerState::Completed, PriorityLevel::Normal, 1.0});
        }
    }));
    controller->reconcile_tick();

    const auto after = controller->workers();
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i].id, before[i].id);
        EXPECT_EQ(after[i].state, before[i].state);
        EXPECT_EQ(after[i].progress, before[i].progress);
        EXPECT_EQ(after[i].duration_seconds, before[i].duration_seconds);
    }
    EXPECT_EQ(transitions.size(), transitions_before);
    EXPECT_TRUE(any_line_contains(*logger, "dropped status for unknown process -1"));
    EXPECT_TRUE(any_line_contains(*logger, "dropped status for unknown process 2"));
    EXPECT_TRUE(any_line_contains(*logger, "dropped status for unknown process 99"));
    EXPECT_TRUE(controller->channels_empty());

    blocking->release();
    controller->stop();
}

TEST_F(PoolControllerTest, StartWhileRunningReplacesGeneration)
{
    auto controller = make_controller(50ms);
    ASSERT_TRUE(controller->start(2, 1.0, PriorityLevel::Normal));
    ASSERT_TRUE(controller->start(3, 2.0, PriorityLevel::Low));

    EXPECT_EQ(controller->generation(), 2u);
    auto rows = controller->workers();
    ASSERT_EQ(rows.size(), 3u);
    for (const auto& row : rows) {
        EXPECT_EQ(row.generation, 2u);
        EXPECT_DOUBLE_EQ(row.speed, 2.0);
        EXPECT_EQ(row.priority, PriorityLevel::Low);
    }
    EXPECT_EQ(transitions.terminal_of(WorkerState::Terminated), 2);
    controller->stop();
}

TEST_F(PoolControllerTest, RejectsInvalidStartArguments)
{
    auto controller = make_controller();
    EXPECT_FALSE(controller->start(0, 1.0, PriorityLevel::Normal));
    EXPECT_FALSE(controller->start(33, 1.0, PriorityLevel::Normal));
    EXPECT_FALSE(controller->start(4, 3.0, PriorityLevel::Normal));
    EXPECT_EQ(controller->generation(), 0u);
    EXPECT_TRUE(controller->workers().empty());
    EXPECT_TRUE(any_line_contains(*logger, "rejected start"));

    EXPECT_FALSE(controller->toggle_pause());
    EXPECT_TRUE(any_line_contains(*logger, "toggle pause ignored"));
    controller->stop();
    controller->reconcile_tick();
}

TEST_F(PoolControllerTest, RejectsMissingCollaborators)
{
    EXPECT_THROW({ PoolController c(nullptr, setter); }, std::invalid_argument);
    EXPECT_THROW({ PoolController c(logger, nullptr); }, std::invalid_argument);
}

TEST_F(PoolControllerTest, ForwardsWorkerLogLines)
{
    auto controller = make_controller();
    ASSERT_TRUE(controller->start(1, 10.0, PriorityLevel::High));
    ASSERT_TRUE(run_until_finished(*controller));
    EXPECT_TRUE(any_line_contains(*logger, "Process 0 started (Priority: High, Speed: 10x)"));
    EXPECT_TRUE(any_line_contains(*logger, "Process 0 performing"));
}
