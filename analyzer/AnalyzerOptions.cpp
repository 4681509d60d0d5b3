/**
 * \file analyzer/AnalyzerOptions.cpp
 * \brief Implementation of analyzer CLI and configuration option helpers.
 */

#include "AnalyzerOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace analyzer_opts {

static std::optional<int> g_count;
static std::optional<std::string> g_speed;
static std::optional<std::string> g_priority;
static std::optional<int> g_base_delay_ms;
static std::optional<int> g_grace_ms;
static std::optional<int> g_tick_ms;
static std::optional<std::string> g_priority_backend;
static std::optional<int> g_sample_interval_ms;
static std::optional<double> g_sample_log_probability;
/// Cached UI toggle supplied by configuration providers.
static std::optional<bool> g_ui_enabled;
static std::optional<int> g_run_seconds;

std::optional<int> get_count() { return g_count; }
std::optional<std::string> get_speed() { return g_speed; }
std::optional<std::string> get_priority() { return g_priority; }
std::optional<int> get_base_delay_ms() { return g_base_delay_ms; }
std::optional<int> get_grace_ms() { return g_grace_ms; }
std::optional<int> get_tick_ms() { return g_tick_ms; }
std::optional<std::string> get_priority_backend() { return g_priority_backend; }
std::optional<int> get_sample_interval_ms() { return g_sample_interval_ms; }
std::optional<double> get_sample_log_probability() { return g_sample_log_probability; }
std::optional<bool> get_ui_enabled() { return g_ui_enabled; }
std::optional<int> get_run_seconds() { return g_run_seconds; }

namespace {

template <typename T>
T json_or(const nlohmann::json& j, const char* section, const char* key, T fallback) {
    if (!j.contains(section) || !j[section].is_object()) return fallback;
    const auto& s = j[section];
    if (!s.contains(key)) return fallback;
    try {
        return s[key].get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

/// Accepts "2", "2x", "0.25x"; rejects anything outside the offered speeds.
const CLI::Validator kSpeedValidator(
    [](std::string& value) -> std::string {
        if (!ProcSync::parse_speed(value)) {
            return "speed must be one of 0.1x, 0.25x, 0.5x, 1x, 2x, 5x, 10x";
        }
        return {};
    },
    "SPEED");

const CLI::Validator kPriorityValidator(
    [](std::string& value) -> std::string {
        if (!ProcSync::parse_priority(value)) return "priority must be Low, Normal or High";
        return {};
    },
    "PRIORITY");

} // namespace

void register_options() {
    procsync_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        g_count = json_or<int>(j, "pool", "count", 4);
        app.add_option("--count", g_count, "Number of worker processes (1-32)")
            ->check(CLI::Range(ProcSync::kMinWorkers, ProcSync::kMaxWorkers))
            ->group("Pool");

        g_speed = json_or<std::string>(j, "pool", "speed", "1x");
        app.add_option("--speed", g_speed, "Simulation speed: 0.1x|0.25x|0.5x|1x|2x|5x|10x")
            ->check(kSpeedValidator)
            ->group("Pool");

        g_priority = json_or<std::string>(j, "pool", "priority", "Normal");
        app.add_option("--priority", g_priority, "Worker priority: Low|Normal|High")
            ->check(kPriorityValidator)
            ->group("Pool");

        g_base_delay_ms = json_or<int>(j, "pool", "base_delay_ms", 50);
        app.add_option("--base-delay-ms", g_base_delay_ms, "Per-step delay at 1x speed")
            ->check(CLI::PositiveNumber)
            ->group("Pool");

        g_grace_ms = json_or<int>(j, "pool", "grace_ms", 1000);
        app.add_option("--grace-ms", g_grace_ms, "Stop grace period before reclaiming workers")
            ->check(CLI::NonNegativeNumber)
            ->group("Pool");

        g_tick_ms = json_or<int>(j, "pool", "tick_ms", 200);
        app.add_option("--tick-ms", g_tick_ms, "Reconcile period")
            ->check(CLI::PositiveNumber)
            ->group("Pool");

        g_priority_backend = json_or<std::string>(j, "pool", "priority_backend", "auto");
        app.add_option("--priority-backend", g_priority_backend, "Priority backend: auto|none|posix|windows")
            ->check(CLI::IsMember({"auto", "none", "posix", "windows"}))
            ->group("Pool");

        g_sample_interval_ms = json_or<int>(j, "monitor", "interval_ms", 1000);
        app.add_option("--sample-interval-ms", g_sample_interval_ms, "System sampling interval")
            ->check(CLI::PositiveNumber)
            ->group("Monitor");

        g_sample_log_probability = json_or<double>(j, "monitor", "log_probability", 0.1);
        app.add_option("--sample-log-probability", g_sample_log_probability, "Chance of logging each sample")
            ->check(CLI::Range(0.0, 1.0))
            ->group("Monitor");

        bool ui_default = true;
        if (j.contains("ui") && j["ui"].is_boolean()) {
            ui_default = j["ui"].get<bool>();
        }
        g_ui_enabled = ui_default;
        app.add_flag("--ui,!--noui", g_ui_enabled, "Enable or disable (--noui) the interactive terminal UI")
            ->group("Analyzer");

        int run_default = 0;
        if (j.contains("run_seconds") && j["run_seconds"].is_number_integer()) {
            run_default = j["run_seconds"].get<int>();
        }
        g_run_seconds = run_default;
        app.add_option("--run-seconds", g_run_seconds, "Headless run limit in seconds (0 = until all finish)")
            ->check(CLI::NonNegativeNumber)
            ->group("Analyzer");
    });
}

AnalyzerOptions resolve() {
    AnalyzerOptions opts;

    // Values from the config file bypass the CLI validators, so re-check here.
    opts.count = g_count.value_or(opts.count);
    if (opts.count < ProcSync::kMinWorkers || opts.count > ProcSync::kMaxWorkers) {
        throw std::invalid_argument("count must be between 1 and 32");
    }

    const auto speed = ProcSync::parse_speed(g_speed.value_or("1x"));
    if (!speed) throw std::invalid_argument("invalid speed: " + g_speed.value_or(""));
    opts.speed = *speed;

    const auto priority = ProcSync::parse_priority(g_priority.value_or("Normal"));
    if (!priority) throw std::invalid_argument("invalid priority: " + g_priority.value_or(""));
    opts.priority = *priority;

    const auto backend = ProcSync::parse_priority_backend(g_priority_backend.value_or("auto"));
    if (!backend) throw std::invalid_argument("invalid priority backend: " + g_priority_backend.value_or(""));
    opts.priority_backend = *backend;

    opts.base_delay = std::chrono::milliseconds(g_base_delay_ms.value_or(50));
    opts.grace = std::chrono::milliseconds(g_grace_ms.value_or(1000));
    opts.tick = std::chrono::milliseconds(g_tick_ms.value_or(200));
    opts.sample_interval = std::chrono::milliseconds(g_sample_interval_ms.value_or(1000));
    if (opts.base_delay.count() <= 0 || opts.tick.count() <= 0 || opts.sample_interval.count() <= 0
        || opts.grace.count() < 0) {
        throw std::invalid_argument("delays and intervals must be positive");
    }

    opts.sample_log_probability = g_sample_log_probability.value_or(0.1);
    if (opts.sample_log_probability < 0.0 || opts.sample_log_probability > 1.0) {
        throw std::invalid_argument("sample log probability must be within [0, 1]");
    }

    opts.ui_enabled = g_ui_enabled.value_or(true);
    opts.run_seconds = g_run_seconds.value_or(0);
    if (opts.run_seconds < 0) throw std::invalid_argument("run seconds cannot be negative");
    return opts;
}

} // namespace analyzer_opts

namespace {
    struct AnalyzerOptsAutoReg {
        AnalyzerOptsAutoReg() { analyzer_opts::register_options(); }
    } analyzer_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
