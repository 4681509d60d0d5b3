#include "PrioritySetters.hpp"
#include "pool/PoolErrors.hpp"
#include "processUtils.hpp"

#include <cctype>
#include <cerrno>
#include <string>

#if defined(__linux__)
#include <sys/resource.h>
#include <sys/types.h>
#endif

namespace ProcSync {

std::error_code NoopPriority::set_priority(PriorityLevel) {
    return make_error_code(Errc::PriorityUnsupported);
}

int PosixNicePriority::nice_value(PriorityLevel level) noexcept {
    switch (level) {
        case PriorityLevel::Low:    return 19;
        case PriorityLevel::Normal: return 10;
        case PriorityLevel::High:   return 0;
    }
    return 10;
}

std::error_code PosixNicePriority::set_priority(PriorityLevel level) {
#if defined(__linux__)
    // On Linux PRIO_PROCESS with a thread id changes only that thread
    const auto tid = static_cast<id_t>(ProcessUtils::get_native_thread_id());
    if (::setpriority(PRIO_PROCESS, tid, nice_value(level)) == 0) {
        return {};
    }
    const int err = errno;
    if (err == EACCES || err == EPERM) {
        return make_error_code(Errc::PriorityDenied);
    }
    return std::error_code(err, std::system_category());
#else
    (void)level;
    return make_error_code(Errc::PriorityUnsupported);
#endif
}

std::error_code WindowsPriorityClass::set_priority(PriorityLevel level) {
#ifdef _WIN32
    int win_priority = THREAD_PRIORITY_NORMAL;
    switch (level) {
        case PriorityLevel::Low:    win_priority = THREAD_PRIORITY_IDLE; break;
        case PriorityLevel::Normal: win_priority = THREAD_PRIORITY_NORMAL; break;
        case PriorityLevel::High:   win_priority = THREAD_PRIORITY_HIGHEST; break;
    }
    if (::SetThreadPriority(::GetCurrentThread(), win_priority)) {
        return {};
    }
    return make_error_code(Errc::PriorityDenied);
#else
    (void)level;
    return make_error_code(Errc::PriorityUnsupported);
#endif
}

std::optional<PriorityBackend> parse_priority_backend(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (lower == "auto") return PriorityBackend::Auto;
    if (lower == "none" || lower == "noop") return PriorityBackend::None;
    if (lower == "posix" || lower == "nice") return PriorityBackend::Posix;
    if (lower == "windows") return PriorityBackend::Windows;
    return std::nullopt;
}

std::shared_ptr<IPrioritySetter> PrioritySetterFactory::create(PriorityBackend backend) {
    switch (backend) {
        case PriorityBackend::None:
            return std::make_shared<NoopPriority>();
        case PriorityBackend::Posix:
            return std::make_shared<PosixNicePriority>();
        case PriorityBackend::Windows:
            return std::make_shared<WindowsPriorityClass>();
        case PriorityBackend::Auto:
            break;
    }
#if defined(_WIN32)
    return std::make_shared<WindowsPriorityClass>();
#elif defined(__linux__)
    return std::make_shared<PosixNicePriority>();
#else
    return std::make_shared<NoopPriority>();
#endif
}

} // namespace ProcSync
