/**
 * \file pool/PoolTypes.hpp
 * \brief Closed vocabulary shared by workers, controller and observers.
 */
#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace ProcSync {

/** \brief Lifecycle state of one worker task. */
enum class WorkerState {
    Starting,
    Running,
    Paused,
    Completed,
    Terminated
};

/** \brief Abstract scheduling priority requested for a worker. */
enum class PriorityLevel {
    Low,
    Normal,
    High
};

/** \brief Kind of simulated work performed in one step. */
enum class WorkKind {
    Cpu,
    Memory,
    Io
};

inline const char* to_string(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Starting:   return "Starting";
        case WorkerState::Running:    return "Running";
        case WorkerState::Paused:     return "Paused";
        case WorkerState::Completed:  return "Completed";
        case WorkerState::Terminated: return "Terminated";
    }
    return "Unknown";
}

inline const char* to_string(PriorityLevel level) noexcept {
    switch (level) {
        case PriorityLevel::Low:    return "Low";
        case PriorityLevel::Normal: return "Normal";
        case PriorityLevel::High:   return "High";
    }
    return "Unknown";
}

inline const char* to_string(WorkKind kind) noexcept {
    switch (kind) {
        case WorkKind::Cpu:    return "cpu";
        case WorkKind::Memory: return "memory";
        case WorkKind::Io:     return "io";
    }
    return "unknown";
}

/** \brief True for the two states a worker never leaves. */
inline bool is_terminal(WorkerState state) noexcept {
    return state == WorkerState::Completed || state == WorkerState::Terminated;
}

std::optional<PriorityLevel> parse_priority(std::string_view text);

/** \brief Speed multipliers offered to the user, slowest first. */
inline constexpr std::array<double, 7> kSpeedChoices{0.1, 0.25, 0.5, 1.0, 2.0, 5.0, 10.0};

/** \brief Whether \p speed is one of \c kSpeedChoices. */
bool is_valid_speed(double speed) noexcept;

/**
 * \brief Parse a speed label such as "0.25x" or "2".
 * \return The multiplier, or nullopt when the label is not one of the offered choices.
 */
std::optional<double> parse_speed(std::string_view text);

/** \brief Render a multiplier the way it is offered, e.g. "0.25x". */
std::string format_speed(double speed);

inline constexpr int kMinWorkers = 1;
inline constexpr int kMaxWorkers = 32;
inline constexpr int kMaxProgress = 100;

} // namespace ProcSync
