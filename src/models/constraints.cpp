#include "models/constraints.hpp"

#include <format>

namespace agenda {

namespace {
auto invalid(std::string_view msg) -> std::unexpected<type::error>
{
	return std::unexpected(type::error{type::error_kind::invalid_constraints, msg});
}

template <typename T>
auto unwrap(type::result<T> res, std::string_view field) -> T
{
	if (!res) {
		throw std::invalid_argument(std::format("{}: {}", field, res.error().what()));
	}
	return *res;
}
} // namespace

auto scheduling_constraints::validate() const -> std::expected<type::ok_t, type::error>
{
	using namespace constants::limits;

	if (!event_start.ok() || !event_end.ok()) {
		return invalid("event date range contains an invalid date");
	}

	if (event_start > event_end) {
		return invalid(std::format("event start {} is after event end {}", format_date(event_start), format_date(event_end)));
	}

	if (working_hours_start < 0 || working_hours_end > minutes_per_day) {
		return invalid("working hours must lie within a single day");
	}

	if (working_hours_start >= working_hours_end) {
		return invalid(std::format("working hours start {} must be before end {}", format_clock(working_hours_start), format_clock(working_hours_end)));
	}

	if (meeting_duration_minutes < min_meeting_duration || meeting_duration_minutes > max_meeting_duration) {
		return invalid(std::format("meeting duration must be between {} and {} minutes", min_meeting_duration, max_meeting_duration));
	}

	if (meeting_duration_minutes > working_hours_end - working_hours_start) {
		return invalid("meeting duration exceeds the working-hour window");
	}

	if (max_meetings_per_day < min_meetings_per_day || max_meetings_per_day > constants::limits::max_meetings_per_day) {
		return invalid(std::format("max meetings per day must be between {} and {}", min_meetings_per_day, constants::limits::max_meetings_per_day));
	}

	if (buffer_minutes < 0 || buffer_minutes > max_buffer_minutes) {
		return invalid(std::format("buffer minutes must be between 0 and {}", max_buffer_minutes));
	}

	return type::ok_t{};
}

auto scheduling_constraints::from_json(const nlohmann::json &j) -> scheduling_constraints
{
	return {.event_start = unwrap(parse_date(j.at("eventStartDate").get<std::string>()), "eventStartDate"),
					.event_end = unwrap(parse_date(j.at("eventEndDate").get<std::string>()), "eventEndDate"),
					.working_hours_start = unwrap(parse_clock(j.at("workingHoursStart").get<std::string>()), "workingHoursStart"),
					.working_hours_end = unwrap(parse_clock(j.at("workingHoursEnd").get<std::string>()), "workingHoursEnd"),
					.meeting_duration_minutes = j.at("meetingDurationMinutes").get<int>(),
					.max_meetings_per_day = j.at("maxMeetingsPerDay").get<int>(),
					.buffer_minutes = j.value("bufferMinutes", constants::defaults::buffer_minutes)};
}

} // namespace agenda
