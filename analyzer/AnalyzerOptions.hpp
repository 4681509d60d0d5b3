/**
 * \file analyzer/AnalyzerOptions.hpp
 * \brief Shared option types and accessors for the analyzer process.
 */
#pragma once

#include "pool/PoolTypes.hpp"
#include "pool/priority/PrioritySetters.hpp"

#include <chrono>
#include <optional>
#include <string>

/** \brief Aggregated pool, monitor and observer configuration. */
struct AnalyzerOptions {
    int count{4};                                                      ///< Workers per generation.
    double speed{1.0};                                                 ///< One of the offered speed choices.
    ProcSync::PriorityLevel priority{ProcSync::PriorityLevel::Normal};
    std::chrono::milliseconds base_delay{50};                          ///< Step delay at 1x.
    std::chrono::milliseconds grace{1000};                             ///< Stop grace period.
    std::chrono::milliseconds tick{200};                               ///< Reconcile cadence.
    ProcSync::PriorityBackend priority_backend{ProcSync::PriorityBackend::Auto};
    std::chrono::milliseconds sample_interval{1000};
    double sample_log_probability{0.1};
    bool ui_enabled{true};
    int run_seconds{0};                                                ///< Headless cap, 0 = none.
};

/** \brief Helper API for accessing analyzer-specific CLI and config options. */
namespace analyzer_opts {
    std::optional<int> get_count();
    std::optional<std::string> get_speed();
    std::optional<std::string> get_priority();
    std::optional<int> get_base_delay_ms();
    std::optional<int> get_grace_ms();
    std::optional<int> get_tick_ms();
    std::optional<std::string> get_priority_backend();
    std::optional<int> get_sample_interval_ms();
    std::optional<double> get_sample_log_probability();
    std::optional<bool> get_ui_enabled();
    std::optional<int> get_run_seconds();

    /**
     * \brief Resolve the cached option values into a typed struct.
     * \throws std::invalid_argument when a value read from the config file is out of range.
     */
    AnalyzerOptions resolve();

    void register_options();
}
