#pragma once

#include "models/constraints.hpp"
#include "models/host.hpp"
#include "services/availability_index.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace agenda {

// Same date and intersecting [start, end). A positive buffer also rejects
// slots closer than `buffer_minutes` to each other.
[[nodiscard]] auto overlaps(const time_slot &a, const time_slot &b, int buffer_minutes = 0) -> bool;

[[nodiscard]] auto within_working_hours(const time_slot &slot, const scheduling_constraints &constraints) -> bool;

// Fewer than the host's daily limit already committed on `date`.
[[nodiscard]] auto under_daily_cap(const host &h, type::date date, std::span<const time_slot> committed, int global_cap) -> bool;

enum class infeasibility { none, conflict, outside_working_hours, daily_cap };

[[nodiscard]] auto describe(infeasibility reason) -> std::string_view;

// Slots committed to each host during one run, indexed by host handle.
class schedule_book {
public:
	explicit schedule_book(std::size_t host_count) : committed_(host_count) {}

	[[nodiscard]] auto committed(host_handle h) const -> std::span<const time_slot> { return committed_[h]; }

	[[nodiscard]] auto conflicts(host_handle h, const time_slot &slot, int buffer_minutes = 0) const -> bool;

	// First violated rule for placing `slot` on host `h`, or none.
	[[nodiscard]] auto check(host_handle h, const host &owner, const time_slot &slot, const scheduling_constraints &constraints, int buffer_minutes = 0) const
			-> infeasibility;

	auto commit(host_handle h, time_slot slot) -> void { committed_[h].push_back(std::move(slot)); }

	[[nodiscard]] auto total_committed() const -> std::size_t;

private:
	std::vector<std::vector<time_slot>> committed_;
};

} // namespace agenda
