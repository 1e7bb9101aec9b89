#include "core/constants.hpp"
#include "services/feasibility.hpp"

#include <algorithm>

namespace agenda {

auto overlaps(const time_slot &a, const time_slot &b, int buffer_minutes) -> bool
{
	if (a.date != b.date) {
		return false;
	}
	return !(a.end + buffer_minutes <= b.start || b.end + buffer_minutes <= a.start);
}

auto within_working_hours(const time_slot &slot, const scheduling_constraints &constraints) -> bool
{
	return slot.start >= constraints.working_hours_start && slot.end <= constraints.working_hours_end;
}

auto under_daily_cap(const host &h, type::date date, std::span<const time_slot> committed, int global_cap) -> bool
{
	const auto on_date = std::ranges::count_if(committed, [&](const time_slot &s) { return s.date == date; });
	return on_date < h.daily_cap(global_cap);
}

auto describe(infeasibility reason) -> std::string_view
{
	switch (reason) {
	case infeasibility::none:
		return "feasible";
	case infeasibility::conflict:
		return constants::text::slot_collision;
	case infeasibility::outside_working_hours:
		return constants::text::outside_working_hours;
	case infeasibility::daily_cap:
		return constants::text::daily_cap_reached;
	}
	return "unknown";
}

auto schedule_book::conflicts(host_handle h, const time_slot &slot, int buffer_minutes) const -> bool
{
	return std::ranges::any_of(committed_[h], [&](const time_slot &existing) { return overlaps(existing, slot, buffer_minutes); });
}

auto schedule_book::check(host_handle h, const host &owner, const time_slot &slot, const scheduling_constraints &constraints, int buffer_minutes) const
		-> infeasibility
{
	if (conflicts(h, slot, buffer_minutes)) {
		return infeasibility::conflict;
	}
	if (!within_working_hours(slot, constraints)) {
		return infeasibility::outside_working_hours;
	}
	if (!under_daily_cap(owner, slot.date, committed_[h], constraints.max_meetings_per_day)) {
		return infeasibility::daily_cap;
	}
	return infeasibility::none;
}

auto schedule_book::total_committed() const -> std::size_t
{
	std::size_t n = 0;
	for (const auto &slots : committed_) {
		n += slots.size();
	}
	return n;
}

} // namespace agenda
