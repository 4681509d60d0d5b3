/**
 * \file pool/worker/WorkSimulator.hpp
 * \brief Performs one step of simulated work for a worker task.
 */
#pragma once

#include "pool/PoolTypes.hpp"

namespace ProcSync {

/** \brief Strategy executing one unit of work of a given kind; shared by all workers. */
class IWorkSimulator {
public:
    virtual ~IWorkSimulator() = default;

    /** \brief Run one unit of \p kind work on the calling thread. */
    virtual void perform(WorkKind kind) = 0;
};

/** \brief Default simulator: a squaring loop, a scratch allocation, or a short sleep. */
class DefaultWorkSimulator : public IWorkSimulator {
public:
    void perform(WorkKind kind) override;
};

} // namespace ProcSync
