#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <unordered_map>

namespace loadgate {

/**
 * @brief Priority classes for admitted work
 *
 * Dispatch order is strict: every CRITICAL ticket leaves before any HIGH
 * ticket, and so on down to LOW. Classes are unweighted.
 *   CRITICAL = attendance writes
 *   HIGH     = attendance reads
 *   NORMAL   = analytics / reports (default)
 *   LOW      = everything else
 */
enum class PriorityLevel : uint8_t {
    CRITICAL = 0,
    HIGH = 1,
    NORMAL = 2,
    LOW = 3
};

inline constexpr size_t kPriorityLevelCount = 4;

/// Lane scan order used by the dispatcher
inline constexpr std::array<PriorityLevel, kPriorityLevelCount> kDispatchOrder = {
    PriorityLevel::CRITICAL,
    PriorityLevel::HIGH,
    PriorityLevel::NORMAL,
    PriorityLevel::LOW,
};

// String constants for priority level names
inline constexpr std::string_view kPriorityCritical = "critical";
inline constexpr std::string_view kPriorityHigh     = "high";
inline constexpr std::string_view kPriorityNormal   = "normal";
inline constexpr std::string_view kPriorityLow      = "low";

inline constexpr size_t priority_index(PriorityLevel priority) {
    return static_cast<size_t>(priority);
}

/**
 * @brief Check whether a string names a known priority class
 */
inline bool is_known_priority(std::string_view str) {
    return str == kPriorityCritical || str == kPriorityHigh ||
           str == kPriorityNormal || str == kPriorityLow;
}

/**
 * @brief Parse priority string to PriorityLevel enum (O(1) hash lookup)
 * @return PriorityLevel, defaults to NORMAL if unrecognized
 */
inline PriorityLevel parse_priority(std::string_view str) {
    static const std::unordered_map<std::string_view, PriorityLevel> kMap = {
        {kPriorityCritical, PriorityLevel::CRITICAL},
        {kPriorityHigh,     PriorityLevel::HIGH},
        {kPriorityNormal,   PriorityLevel::NORMAL},
        {kPriorityLow,      PriorityLevel::LOW},
    };
    const auto it = kMap.find(str);
    return (it != kMap.end()) ? it->second : PriorityLevel::NORMAL;
}

/**
 * @brief Convert PriorityLevel to string
 */
inline const char* priority_to_string(PriorityLevel priority) {
    switch (priority) {
        case PriorityLevel::CRITICAL: return "critical";
        case PriorityLevel::HIGH:     return "high";
        case PriorityLevel::NORMAL:   return "normal";
        case PriorityLevel::LOW:      return "low";
        default:                      return "normal";
    }
}

} // namespace loadgate
