#pragma once

#include "core/config.hpp"
#include "services/feasibility.hpp"
#include "services/scheduling_strategy.hpp"

#include <optional>
#include <random>
#include <vector>

namespace agenda {

struct slot_ref {
	host_handle host{};
	std::size_t slot{}; // index into the host's indexed slots

	[[nodiscard]] auto operator==(const slot_ref &) const -> bool = default;
};

// Request index -> chosen slot; nullopt when nothing could be drawn.
using slot_mapping = std::vector<std::optional<slot_ref>>;

struct annealing_stats {
	int iterations{};
	double initial_objective{};
	double best_objective{};
	double final_temperature{};
	bool cancelled{false};
	std::vector<double> best_trace{}; // best objective after each iteration
};

struct annealing_run {
	slot_mapping best;
	annealing_stats stats;
};

class annealing_solver final : public scheduling_strategy {
public:
	explicit annealing_solver(annealing_config config = {}, bool enforce_buffer = false) : config_{config}, enforce_buffer_{enforce_buffer} {}

	[[nodiscard]] auto name() const -> std::string_view override { return "simulated annealing"; }
	[[nodiscard]] auto algorithm() const -> scheduler_algorithm override { return scheduler_algorithm::quantum; }

	// Seeds a fresh engine from the config (entropy when the seed is 0).
	[[nodiscard]] auto solve(const scheduling_problem &problem, const run_control &control) -> std::expected<strategy_outcome, type::error> override;

	// The search itself, driven by the caller's engine.
	[[nodiscard]] auto anneal(const scheduling_problem &problem, std::mt19937_64 &rng, const run_control &control = {}) const -> annealing_run;

	// Sum of importance (+ preferred-date bonus) of distinct (host, date, start)
	// keys, minus the collision penalty for every repeated key.
	[[nodiscard]] auto objective(const scheduling_problem &problem, const slot_mapping &mapping) const -> double;

	// Commit mapped slots in request order; anything infeasible becomes unscheduled.
	[[nodiscard]] auto to_outcome(const scheduling_problem &problem, const annealing_run &run) const -> strategy_outcome;

private:
	annealing_config config_;
	bool enforce_buffer_;
};

} // namespace agenda
