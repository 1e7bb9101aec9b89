#pragma once

#include "core/config.hpp"
#include "services/feasibility.hpp"
#include "services/scheduling_strategy.hpp"

#include <optional>

namespace agenda {

class greedy_solver final : public scheduling_strategy {
public:
	explicit greedy_solver(greedy_config config = {}, bool enforce_buffer = false) : config_{config}, enforce_buffer_{enforce_buffer} {}

	[[nodiscard]] auto name() const -> std::string_view override { return "greedy constraint satisfaction"; }
	[[nodiscard]] auto algorithm() const -> scheduler_algorithm override { return scheduler_algorithm::classical; }

	// Deterministic: importance-ordered single pass, first best candidate wins ties.
	[[nodiscard]] auto solve(const scheduling_problem &problem, const run_control &control) -> std::expected<strategy_outcome, type::error> override;

	[[nodiscard]] auto score(const meeting_request &request, const host &h, const time_slot &slot) const -> double;

	[[nodiscard]] static auto expertise_matches(const meeting_request &request, const host &h) -> bool;

private:
	greedy_config config_;
	bool enforce_buffer_;

	struct candidate {
		host_handle handle{};
		std::size_t slot_index{};
		double score{};
	};

	[[nodiscard]] auto find_best(const meeting_request &request, const scheduling_problem &problem, const schedule_book &book) const -> std::optional<candidate>;
	[[nodiscard]] auto rationale(const meeting_request &request, const host &h, const time_slot &slot, double score) const -> std::string;
};

} // namespace agenda
