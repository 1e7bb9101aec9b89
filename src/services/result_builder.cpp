#include "core/logger.hpp"
#include "services/result_builder.hpp"
#include "services/schedule_validator.hpp"

#include <algorithm>
#include <numeric>

namespace agenda {

auto result_builder::average_utilization(const scheduling_problem &problem, std::span<const meeting_assignment> assignments, const metrics_config &config)
		-> double
{
	const auto &index = problem.index();
	if (index.empty()) {
		return 0.0;
	}

	double sum = 0.0;
	for (host_handle h = 0; h < index.size(); ++h) {
		const auto &owner = index.host_at(h);
		const double capacity = static_cast<double>(owner.availability.size()) * config.utilization_slots_per_day;
		if (capacity <= 0.0) {
			continue;
		}

		const auto assigned = std::ranges::count(assignments, owner.id, &meeting_assignment::host_id);
		sum += static_cast<double>(assigned) / capacity;
	}
	return sum / static_cast<double>(index.size());
}

auto result_builder::metrics(const scheduling_problem &problem, std::span<const meeting_assignment> assignments,
														 std::span<const unscheduled_request> unscheduled, const metrics_config &config) -> scheduler_metrics
{
	const auto report = schedule_validator::check_all(problem, assignments, unscheduled);
	for (const auto &e : report.errors) {
		log::error("constraint violation: {}", e);
	}

	return {.total_requests = problem.requests().size(),
					.scheduled_count = assignments.size(),
					.unscheduled_count = unscheduled.size(),
					.total_score = std::accumulate(assignments.begin(), assignments.end(), 0.0, [](double acc, const meeting_assignment &a) { return acc + a.score; }),
					.average_host_utilization = average_utilization(problem, assignments, config),
					.constraint_violations = report.errors.size()};
}

auto result_builder::build(const scheduling_problem &problem, strategy_outcome outcome, scheduler_algorithm used, const metrics_config &config) -> schedule_result
{
	schedule_result result;
	result.metrics = metrics(problem, outcome.assignments, outcome.unscheduled, config);
	result.assignments = std::move(outcome.assignments);
	result.unscheduled = std::move(outcome.unscheduled);
	result.algorithm_used = used;
	result.explanation = std::move(outcome.explanation);
	return result;
}

} // namespace agenda
