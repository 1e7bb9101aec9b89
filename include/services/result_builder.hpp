#pragma once

#include "core/config.hpp"
#include "services/scheduling_strategy.hpp"

#include <span>

namespace agenda {

class result_builder {
public:
	// Attach metrics (including re-validated violation count) to a strategy outcome.
	[[nodiscard]] static auto build(const scheduling_problem &problem, strategy_outcome outcome, scheduler_algorithm used, const metrics_config &config)
			-> schedule_result;

	[[nodiscard]] static auto metrics(const scheduling_problem &problem, std::span<const meeting_assignment> assignments,
																		std::span<const unscheduled_request> unscheduled, const metrics_config &config) -> scheduler_metrics;

	// Mean over active hosts of assigned / (availability days x slots-per-day constant)
	[[nodiscard]] static auto average_utilization(const scheduling_problem &problem, std::span<const meeting_assignment> assignments,
																								const metrics_config &config) -> double;
};

} // namespace agenda
