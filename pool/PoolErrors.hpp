/**
 * \file pool/PoolErrors.hpp
 * \brief Error codes reported by priority setters, sensors and the pool controller.
 */
#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace ProcSync {

/** \brief Failure kinds; none of them is fatal to the controller or observer. */
enum class Errc {
    PriorityUnsupported = 1, ///< Host offers no way to apply the requested priority.
    PriorityDenied,          ///< Host refused the change (e.g. missing privilege).
    SensorReadError,         ///< Resource sensor could not produce a sample.
    ForcedTermination,       ///< Worker did not exit within the stop grace period.
    InvalidArgument          ///< Caller supplied a value outside the accepted range.
};

const std::error_category& pool_category() noexcept;

inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), pool_category()};
}

} // namespace ProcSync

template <>
struct std::is_error_code_enum<ProcSync::Errc> : std::true_type {};
