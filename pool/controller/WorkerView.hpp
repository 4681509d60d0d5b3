/**
 * \file pool/controller/WorkerView.hpp
 * \brief Reconciled per-worker row handed to observers.
 */
#pragma once

#include "pool/PoolTypes.hpp"

#include <cstdint>
#include <optional>

namespace ProcSync {

/** \brief Observer-facing snapshot of one worker, as of the last reconciliation. */
struct WorkerView {
    int id{0};
    WorkerState state{WorkerState::Starting};
    int progress{0};                         ///< 0..100; 100 only once Completed is observed.
    double speed{1.0};
    PriorityLevel priority{PriorityLevel::Normal};
    std::optional<double> duration_seconds;  ///< Set only when Completed.
    std::uint64_t generation{0};             ///< Run this row belongs to.
};

} // namespace ProcSync
