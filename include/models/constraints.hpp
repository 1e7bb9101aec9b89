#pragma once

#include "core/constants.hpp"
#include "models/time_slot.hpp"
#include <nlohmann/json.hpp>

namespace agenda {

struct scheduling_constraints {
	type::date event_start{};
	type::date event_end{};
	int working_hours_start{}; // minutes since midnight
	int working_hours_end{};
	int meeting_duration_minutes{};
	int max_meetings_per_day{};
	int buffer_minutes{constants::defaults::buffer_minutes};

	[[nodiscard]] auto in_event_window(this const auto &self, type::date d) -> bool { return d >= self.event_start && d <= self.event_end; }

	// Malformed or contradictory values are fatal for a run.
	[[nodiscard]] auto validate() const -> std::expected<type::ok_t, type::error>;

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		return {{"eventStartDate", format_date(self.event_start)},
						{"eventEndDate", format_date(self.event_end)},
						{"workingHoursStart", format_clock(self.working_hours_start)},
						{"workingHoursEnd", format_clock(self.working_hours_end)},
						{"meetingDurationMinutes", self.meeting_duration_minutes},
						{"maxMeetingsPerDay", self.max_meetings_per_day},
						{"bufferMinutes", self.buffer_minutes}};
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> scheduling_constraints;
};

} // namespace agenda
