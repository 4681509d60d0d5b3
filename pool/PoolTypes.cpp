/**
 * \file pool/PoolTypes.cpp
 * \brief Parsing and formatting helpers for priorities and speed labels.
 */
#include "PoolTypes.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace ProcSync {

namespace {

std::string lower_copy(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    return lower;
}

} // namespace

std::optional<PriorityLevel> parse_priority(std::string_view text) {
    const auto lower = lower_copy(text);
    if (lower == "low") return PriorityLevel::Low;
    if (lower == "normal") return PriorityLevel::Normal;
    if (lower == "high") return PriorityLevel::High;
    return std::nullopt;
}

bool is_valid_speed(double speed) noexcept {
    return std::any_of(kSpeedChoices.begin(), kSpeedChoices.end(),
                       [speed](double choice) { return std::fabs(choice - speed) < 1e-9; });
}

std::optional<double> parse_speed(std::string_view text) {
    std::string trimmed = lower_copy(text);
    if (!trimmed.empty() && trimmed.back() == 'x') trimmed.pop_back();
    if (trimmed.empty()) return std::nullopt;

    char* end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (end == nullptr || *end != '\0') return std::nullopt;
    for (double choice : kSpeedChoices) {
        if (std::fabs(choice - value) < 1e-9) return choice;
    }
    return std::nullopt;
}

std::string format_speed(double speed) {
    std::ostringstream oss;
    oss << speed << 'x';
    return oss.str();
}

} // namespace ProcSync
