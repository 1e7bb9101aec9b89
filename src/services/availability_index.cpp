#include "core/logger.hpp"
#include "services/availability_index.hpp"

#include <algorithm>
#include <numeric>

namespace agenda {

auto availability_index::build(std::span<const host> hosts, const scheduling_constraints &constraints) -> availability_index
{
	availability_index index;
	index.entries_.reserve(hosts.size());

	for (const auto &h : hosts) {
		if (!h.active) {
			continue;
		}

		entry e{.source = &h, .slots = {}};
		for (const auto &day : h.availability) {
			if (day.blocked) {
				continue;
			}

			for (const auto &slot : day.slots) {
				if (slot.date != day.date) {
					log::warn("host {}: slot {} listed under {}, skipped", h.id, describe(slot), format_date(day.date));
					continue;
				}
				if (!constraints.in_event_window(slot.date)) {
					continue;
				}

				auto owned = slot;
				owned.host_id = h.id;
				e.slots.push_back(std::move(owned));
			}
		}
		index.entries_.push_back(std::move(e));
	}

	return index;
}

auto availability_index::find(std::string_view host_id) const -> std::optional<host_handle>
{
	auto it = std::ranges::find_if(entries_, [&](const entry &e) { return e.source->id == host_id; });
	if (it == entries_.end()) {
		return std::nullopt;
	}
	return static_cast<host_handle>(std::distance(entries_.begin(), it));
}

auto availability_index::handles_with_slots() const -> std::vector<host_handle>
{
	std::vector<host_handle> out;
	for (host_handle h = 0; h < entries_.size(); ++h) {
		if (!entries_[h].slots.empty()) {
			out.push_back(h);
		}
	}
	return out;
}

auto availability_index::total_slots() const -> std::size_t
{
	return std::accumulate(entries_.begin(), entries_.end(), std::size_t{0}, [](std::size_t acc, const entry &e) { return acc + e.slots.size(); });
}

auto availability_index::first_slots(std::size_t count) const -> std::vector<time_slot>
{
	std::vector<time_slot> out;
	for (const auto &e : entries_) {
		for (const auto &slot : e.slots) {
			if (out.size() >= count) {
				return out;
			}
			out.push_back(slot);
		}
	}
	return out;
}

} // namespace agenda
