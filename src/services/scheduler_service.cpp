#include "core/constants.hpp"
#include "core/logger.hpp"
#include "services/annealing_solver.hpp"
#include "services/greedy_solver.hpp"
#include "services/result_builder.hpp"
#include "services/scheduler_service.hpp"

#include <chrono>
#include <format>

namespace agenda {

scheduler_service::scheduler_service(scheduler_config config)
		: config_{config}, classical_{std::make_unique<greedy_solver>(config.greedy, config.enforce_buffer)},
			metaheuristic_{std::make_unique<annealing_solver>(config.annealing, config.enforce_buffer)}
{}

scheduler_service::scheduler_service(scheduler_config config, std::unique_ptr<scheduling_strategy> classical, std::unique_ptr<scheduling_strategy> metaheuristic)
		: config_{std::move(config)}, classical_{std::move(classical)}, metaheuristic_{std::move(metaheuristic)}
{}

auto scheduler_service::run_strategy(scheduling_strategy &strategy, const scheduling_problem &problem, const run_control &control)
		-> std::expected<strategy_outcome, type::error>
{
	try {
		return strategy.solve(problem, control);
	} catch (const std::exception &e) {
		return std::unexpected(type::error{type::error_kind::solver_failure, std::format("{} threw: {}", strategy.name(), e.what())});
	}
}

auto scheduler_service::hybrid(const scheduling_problem &problem, const run_control &control) -> std::expected<attempt, failure>
{
	const auto total = problem.requests().size();

	if (total <= config_.hybrid.max_requests && problem.hosts().size() <= config_.hybrid.max_hosts) {
		auto annealed = run_strategy(*metaheuristic_, problem, control);
		if (!annealed) {
			return std::unexpected(failure{.error = annealed.error(), .failed = metaheuristic_.get()});
		}

		const auto scheduled = annealed->assignments.size();
		const double ratio = total > 0 ? static_cast<double>(scheduled) / static_cast<double>(total) : 0.0;
		if (ratio > config_.hybrid.acceptance_ratio) {
			annealed->explanation = std::format("{} ({}/{} scheduled)", constants::text::hybrid_annealing_accepted, scheduled, total);
			return attempt{.outcome = std::move(*annealed), .used = metaheuristic_->algorithm()};
		}
		log::info("Hybrid: annealing scheduled {}/{}, not above {:.0f}%, switching to classical", scheduled, total, config_.hybrid.acceptance_ratio * 100.0);
	}

	auto classical = run_strategy(*classical_, problem, control);
	if (!classical) {
		return std::unexpected(failure{.error = classical.error(), .failed = classical_.get()});
	}
	classical->explanation = std::format("{}: {}", constants::text::hybrid_classical, classical->explanation);
	return attempt{.outcome = std::move(*classical), .used = classical_->algorithm()};
}

auto scheduler_service::dispatch(scheduler_algorithm requested, const scheduling_problem &problem, const run_control &control) -> std::expected<attempt, failure>
{
	switch (requested) {
	case scheduler_algorithm::classical:
		if (auto out = run_strategy(*classical_, problem, control)) {
			return attempt{.outcome = std::move(*out), .used = classical_->algorithm()};
		}
		else {
			return std::unexpected(failure{.error = out.error(), .failed = classical_.get()});
		}
	case scheduler_algorithm::quantum:
		if (auto out = run_strategy(*metaheuristic_, problem, control)) {
			return attempt{.outcome = std::move(*out), .used = metaheuristic_->algorithm()};
		}
		else {
			return std::unexpected(failure{.error = out.error(), .failed = metaheuristic_.get()});
		}
	case scheduler_algorithm::hybrid:
		return hybrid(problem, control);
	}
	return std::unexpected(failure{.error = type::error{type::error_kind::invalid_input, "unknown scheduling algorithm"}, .failed = nullptr});
}

auto scheduler_service::optimize(const schedule_request &request, const run_control &control) -> std::expected<schedule_result, type::error>
{
	const auto started = std::chrono::steady_clock::now();

	if (auto valid = validate_request(request); !valid) {
		log::error("Rejected scheduling request: {}", valid.error().what());
		return std::unexpected(valid.error());
	}

	log::info("Starting optimization with algorithm: {}", algorithm_name(request.algorithm));
	log::info("Requests: {}, Hosts: {}", request.requests.size(), request.hosts.size());

	const scheduling_problem problem{request};
	auto status = run_status::succeeded;

	auto solved = dispatch(request.algorithm, problem, control);
	if (!solved) {
		const auto &cause = solved.error().error;

		// a failing classical solver has nothing left to fall back to
		if (solved.error().failed == classical_.get()) {
			log::error("Classical solver failed: {}", cause.what());
			return std::unexpected(type::error{type::error_kind::solver_failure, cause.what()});
		}
		if (solved.error().failed == nullptr) {
			return std::unexpected(cause);
		}

		log::error("Scheduling error ({}), falling back to classical", cause.what());
		auto fallback = run_strategy(*classical_, problem, control);
		if (!fallback) {
			log::error("Classical fallback failed: {}", fallback.error().what());
			return std::unexpected(type::error{type::error_kind::solver_failure, std::format("classical fallback failed: {}", fallback.error().what())});
		}

		fallback->explanation = std::format("{}: {}", constants::text::fallback_prefix, cause.what());
		solved = attempt{.outcome = std::move(*fallback), .used = classical_->algorithm()};
		status = run_status::failed_fallback;
	}

	auto result = result_builder::build(problem, std::move(solved->outcome), solved->used, config_.metrics);
	result.status = status;
	result.computation_time_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

	log::info("Optimization complete: {} assigned, {} unscheduled via {} in {:.1f} ms", result.assignments.size(), result.unscheduled.size(),
						algorithm_name(result.algorithm_used), result.computation_time_ms);
	return result;
}

} // namespace agenda
