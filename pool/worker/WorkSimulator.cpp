#include "WorkSimulator.hpp"

#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

namespace ProcSync {

namespace {

constexpr int kCpuIterations = 100000;
constexpr std::size_t kScratchElements = 100000;
constexpr auto kIoDelay = std::chrono::milliseconds(10);

} // namespace

void DefaultWorkSimulator::perform(WorkKind kind) {
    switch (kind) {
        case WorkKind::Cpu: {
            volatile std::uint64_t sink = 0;
            for (int x = 0; x < kCpuIterations; ++x) {
                sink = sink + static_cast<std::uint64_t>(x) * static_cast<std::uint64_t>(x);
            }
            break;
        }
        case WorkKind::Memory: {
            std::vector<int> scratch(kScratchElements, 0);
            volatile int touch = scratch[kScratchElements / 2];
            (void)touch;
            break;
        }
        case WorkKind::Io:
            std::this_thread::sleep_for(kIoDelay);
            break;
    }
}

} // namespace ProcSync
