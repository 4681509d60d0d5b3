#include "PoolErrors.hpp"

namespace ProcSync {

namespace {

class PoolCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "proc-sync"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::PriorityUnsupported: return "scheduling priority not supported on this host";
            case Errc::PriorityDenied:      return "scheduling priority change denied";
            case Errc::SensorReadError:     return "resource sensor read failed";
            case Errc::ForcedTermination:   return "worker forcibly reclaimed after grace period";
            case Errc::InvalidArgument:     return "invalid argument";
        }
        return "unknown proc-sync error";
    }
};

} // namespace

const std::error_category& pool_category() noexcept {
    static const PoolCategory category;
    return category;
}

} // namespace ProcSync
