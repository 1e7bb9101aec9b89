#pragma once

#include "models/constraints.hpp"
#include "models/host.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace agenda {

// Dense per-run index of an active host
using host_handle = std::size_t;

class availability_index {
public:
	// Active hosts only, in input order. Blocked days and dates outside the
	// event window contribute no slots.
	[[nodiscard]] static auto build(std::span<const host> hosts, const scheduling_constraints &constraints) -> availability_index;

	[[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
	[[nodiscard]] auto empty() const -> bool { return entries_.empty(); }

	[[nodiscard]] auto host_at(host_handle h) const -> const host & { return *entries_[h].source; }
	[[nodiscard]] auto slots(host_handle h) const -> std::span<const time_slot> { return entries_[h].slots; }

	[[nodiscard]] auto find(std::string_view host_id) const -> std::optional<host_handle>;

	// Handles of hosts offering at least one slot
	[[nodiscard]] auto handles_with_slots() const -> std::vector<host_handle>;
	[[nodiscard]] auto total_slots() const -> std::size_t;

	// First `count` slots in index order, regardless of what is already booked.
	[[nodiscard]] auto first_slots(std::size_t count) const -> std::vector<time_slot>;

private:
	struct entry {
		const host *source{};
		std::vector<time_slot> slots;
	};

	std::vector<entry> entries_;
};

} // namespace agenda
