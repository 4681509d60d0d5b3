/**
 * \file pool/priority/PrioritySetters.hpp
 * \brief Platform variants of \c IPrioritySetter and the startup factory.
 */
#pragma once

#include "IPrioritySetter.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace ProcSync {

/** \brief Reports every request as unsupported; used where no API exists. */
class NoopPriority : public IPrioritySetter {
public:
    const char* backend_name() const noexcept override { return "none"; }
    std::error_code set_priority(PriorityLevel level) override;
};

/** \brief Per-thread nice value via setpriority(2) (Linux only). */
class PosixNicePriority : public IPrioritySetter {
public:
    const char* backend_name() const noexcept override { return "posix"; }
    std::error_code set_priority(PriorityLevel level) override;

    /** \brief Nice value used for \p level (Low=19, Normal=10, High=0). */
    static int nice_value(PriorityLevel level) noexcept;
};

/** \brief SetThreadPriority on the calling thread (Windows only). */
class WindowsPriorityClass : public IPrioritySetter {
public:
    const char* backend_name() const noexcept override { return "windows"; }
    std::error_code set_priority(PriorityLevel level) override;
};

/** \brief Backend choice as given on the command line. */
enum class PriorityBackend { Auto, None, Posix, Windows };

std::optional<PriorityBackend> parse_priority_backend(std::string_view text);

/** \brief Builds the priority setter once at startup. */
class PrioritySetterFactory {
public:
    /** \brief Create the setter for \p backend; \c Auto picks the host's native variant. */
    static std::shared_ptr<IPrioritySetter> create(PriorityBackend backend = PriorityBackend::Auto);

private:
    PrioritySetterFactory() = delete;
};

} // namespace ProcSync
