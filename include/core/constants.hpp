#pragma once

#include <cstddef>
#include <string_view>

namespace agenda::constants {

// Reason / explanation text
namespace text {
inline constexpr std::string_view no_slot_matches = "no available time slot matches constraints";
inline constexpr std::string_view no_suitable_slot = "no suitable slot found";
inline constexpr std::string_view slot_collision = "assigned slot overlaps a meeting already committed to the host";
inline constexpr std::string_view outside_working_hours = "assigned slot lies outside working hours";
inline constexpr std::string_view daily_cap_reached = "host daily meeting limit reached";

inline constexpr std::string_view reason_expertise = "Host expertise matches request topics";
inline constexpr std::string_view reason_preferred_date = "Preferred date available";
inline constexpr std::string_view reason_preferred_type = "Host prefers this meeting type";

inline constexpr std::string_view hybrid_annealing_accepted = "Hybrid: quantum-inspired solution accepted";
inline constexpr std::string_view hybrid_classical = "Hybrid: classical solution (problem size or performance)";
inline constexpr std::string_view fallback_prefix = "Fallback to classical algorithm due to error";
} // namespace text

// Defaults taken from the event constraints contract
namespace defaults {
inline constexpr double importance_score = 50.0;
inline constexpr int buffer_minutes = 15;
inline constexpr int max_meetings_per_day = 8;
} // namespace defaults

// Limits
namespace limits {
inline constexpr std::size_t max_alternative_suggestions = 3;
inline constexpr int min_meeting_duration = 15;
inline constexpr int max_meeting_duration = 180;
inline constexpr int min_meetings_per_day = 1;
inline constexpr int max_meetings_per_day = 12;
inline constexpr int max_buffer_minutes = 60;
inline constexpr double min_importance = 0.0;
inline constexpr double max_importance = 100.0;
inline constexpr int minutes_per_day = 24 * 60;
inline constexpr long long max_timeout_ms = 24LL * 60 * 60 * 1000;
} // namespace limits

} // namespace agenda::constants
