#pragma once

#include "core/config.hpp"
#include "services/scheduling_strategy.hpp"

#include <memory>

namespace agenda {

/**
 * @brief
 * Picks the solver for a run (classical, annealing or hybrid), applies the
 * hybrid quality rule and owns the single classical fallback. Only invalid
 * input is returned as an error; solver failures become a classical result.
 */
class scheduler_service {
public:
	explicit scheduler_service(scheduler_config config = {});
	scheduler_service(scheduler_config config, std::unique_ptr<scheduling_strategy> classical, std::unique_ptr<scheduling_strategy> metaheuristic);

	[[nodiscard]] auto optimize(const schedule_request &request, const run_control &control = {}) -> std::expected<schedule_result, type::error>;


private:
	scheduler_config config_;
	std::unique_ptr<scheduling_strategy> classical_;
	std::unique_ptr<scheduling_strategy> metaheuristic_;

	struct attempt {
		strategy_outcome outcome;
		scheduler_algorithm used;
	};

	// The strategy whose run produced the error
	struct failure {
		type::error error;
		const scheduling_strategy *failed{};
	};

	[[nodiscard]] auto dispatch(scheduler_algorithm requested, const scheduling_problem &problem, const run_control &control) -> std::expected<attempt, failure>;
	[[nodiscard]] auto hybrid(const scheduling_problem &problem, const run_control &control) -> std::expected<attempt, failure>;

	// Exceptions leaving a strategy are reported as solver failures.
	[[nodiscard]] static auto run_strategy(scheduling_strategy &strategy, const scheduling_problem &problem, const run_control &control)
			-> std::expected<strategy_outcome, type::error>;
};

} // namespace agenda
