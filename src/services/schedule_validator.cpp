#include "services/feasibility.hpp"
#include "services/schedule_validator.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <unordered_map>

namespace agenda {

auto schedule_validator::check_all(const scheduling_problem &problem, std::span<const meeting_assignment> assignments,
																	 std::span<const unscheduled_request> unscheduled) -> validation_report
{
	validation_report report;
	check_partition(problem, assignments, unscheduled, report);
	check_double_booking(assignments, report);
	check_daily_caps(problem, assignments, report);
	check_slot_bounds(problem, assignments, report);
	return report;
}

auto schedule_validator::check_partition(const scheduling_problem &problem, std::span<const meeting_assignment> assignments,
																				 std::span<const unscheduled_request> unscheduled, validation_report &report) -> void
{
	std::unordered_map<std::string, int> seen;
	for (const auto &r : problem.requests()) {
		seen.emplace(r.id, 0);
	}

	auto mark = [&](const std::string &id) {
		auto it = seen.find(id);
		if (it == seen.end()) {
			report.add(std::format("output references unknown request {}", id));
			return;
		}
		++it->second;
	};

	for (const auto &a : assignments) {
		mark(a.request_id);
	}
	for (const auto &u : unscheduled) {
		mark(u.request_id);
	}

	for (const auto &r : problem.requests()) {
		if (const int n = seen.at(r.id); n != 1) {
			report.add(std::format("request {} appears {} times in the output", r.id, n));
		}
	}
}

auto schedule_validator::check_double_booking(std::span<const meeting_assignment> assignments, validation_report &report) -> void
{
	std::map<std::string, std::vector<const meeting_assignment *>> by_host;
	for (const auto &a : assignments) {
		by_host[a.host_id].push_back(&a);
	}

	for (const auto &[host_id, list] : by_host) {
		for (std::size_t i = 0; i < list.size(); ++i) {
			for (std::size_t j = i + 1; j < list.size(); ++j) {
				if (overlaps(list[i]->slot, list[j]->slot)) {
					report.add(std::format("host {} double-booked: {} and {} at {}", host_id, list[i]->request_id, list[j]->request_id, describe(list[j]->slot)));
				}
			}
		}
	}
}

auto schedule_validator::check_daily_caps(const scheduling_problem &problem, std::span<const meeting_assignment> assignments, validation_report &report) -> void
{
	std::map<std::pair<std::string, std::string>, int> per_day;
	for (const auto &a : assignments) {
		++per_day[{a.host_id, format_date(a.slot.date)}];
	}

	const auto &index = problem.index();
	for (const auto &[key, count] : per_day) {
		const auto &[host_id, day] = key;
		auto handle = index.find(host_id);
		if (!handle) {
			continue; // reported by check_slot_bounds
		}

		if (const int cap = index.host_at(*handle).daily_cap(problem.constraints().max_meetings_per_day); count > cap) {
			report.add(std::format("host {} has {} meetings on {}, limit {}", host_id, count, day, cap));
		}
	}
}

auto schedule_validator::check_slot_bounds(const scheduling_problem &problem, std::span<const meeting_assignment> assignments, validation_report &report) -> void
{
	const auto &index = problem.index();

	for (const auto &a : assignments) {
		// the index holds active hosts only
		auto handle = index.find(a.host_id);
		if (!handle) {
			report.add(std::format("request {} assigned to unknown or inactive host {}", a.request_id, a.host_id));
			continue;
		}
		const auto &owner = index.host_at(*handle);

		if (!within_working_hours(a.slot, problem.constraints())) {
			report.add(std::format("request {} at {} is outside working hours", a.request_id, describe(a.slot)));
		}

		const bool offered = std::ranges::any_of(owner.availability, [&](const host_availability &day) {
			return !day.blocked && day.date == a.slot.date &&
						 std::ranges::any_of(day.slots, [&](const time_slot &s) { return s.date == a.slot.date && s.start <= a.slot.start && a.slot.end <= s.end; });
		});
		if (!offered) {
			report.add(std::format("request {} at {} is not offered by host {}", a.request_id, describe(a.slot), a.host_id));
		}
	}
}

} // namespace agenda
