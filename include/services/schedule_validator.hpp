#pragma once

#include "services/scheduling_strategy.hpp"

#include <span>
#include <string>
#include <vector>

namespace agenda {

struct validation_report {
	bool ok{true};
	std::vector<std::string> errors; // one line per violated invariant instance

	auto add(std::string msg) -> void
	{
		ok = false;
		errors.push_back(std::move(msg));
	}
};

// Re-checks a finished schedule against the run's hard rules.
class schedule_validator {
public:
	[[nodiscard]] static auto check_all(const scheduling_problem &problem, std::span<const meeting_assignment> assignments,
																			std::span<const unscheduled_request> unscheduled) -> validation_report;

private:
	// every request id exactly once across assignments and unscheduled
	static auto check_partition(const scheduling_problem &problem, std::span<const meeting_assignment> assignments,
															std::span<const unscheduled_request> unscheduled, validation_report &report) -> void;

	static auto check_double_booking(std::span<const meeting_assignment> assignments, validation_report &report) -> void;

	static auto check_daily_caps(const scheduling_problem &problem, std::span<const meeting_assignment> assignments, validation_report &report) -> void;

	// working hours and a non-blocked availability entry covering the slot
	static auto check_slot_bounds(const scheduling_problem &problem, std::span<const meeting_assignment> assignments, validation_report &report) -> void;
};

} // namespace agenda
