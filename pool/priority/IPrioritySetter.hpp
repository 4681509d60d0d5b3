/**
 * \file pool/priority/IPrioritySetter.hpp
 * \brief Capability interface for applying a worker's scheduling priority.
 */
#pragma once

#include "pool/PoolTypes.hpp"

#include <system_error>

namespace ProcSync {

/**
 * \brief Best-effort priority setter for the calling thread.
 *
 * One implementation is selected at startup and shared by every worker, so
 * implementations must be safe to call concurrently from many threads.
 */
class IPrioritySetter {
public:
    virtual ~IPrioritySetter() = default;

    /** \brief Short backend name for logging. */
    [[nodiscard]] virtual const char* backend_name() const noexcept = 0;

    /**
     * \brief Apply \p level to the calling thread.
     * \return Empty on success; \c Errc::PriorityUnsupported or
     *         \c Errc::PriorityDenied otherwise. The caller keeps running at
     *         its default priority either way.
     */
    [[nodiscard]] virtual std::error_code set_priority(PriorityLevel level) = 0;
};

} // namespace ProcSync
