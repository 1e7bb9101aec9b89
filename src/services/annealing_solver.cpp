#include "core/constants.hpp"
#include "core/logger.hpp"
#include "services/annealing_solver.hpp"

#include <cmath>
#include <format>
#include <set>
#include <tuple>

namespace agenda {

auto annealing_solver::objective(const scheduling_problem &problem, const slot_mapping &mapping) const -> double
{
	const auto requests = problem.requests();
	const auto &index = problem.index();

	double total = 0.0;
	std::set<std::tuple<host_handle, long long, int>> used;

	for (std::size_t i = 0; i < mapping.size(); ++i) {
		if (!mapping[i]) {
			continue;
		}

		const auto &slot = index.slots(mapping[i]->host)[mapping[i]->slot];
		const auto day = static_cast<long long>(std::chrono::sys_days{slot.date}.time_since_epoch().count());

		if (!used.emplace(mapping[i]->host, day, slot.start).second) {
			total -= config_.collision_penalty;
			continue;
		}

		total += requests[i].importance_score;
		if (requests[i].prefers(slot.date)) {
			total += config_.preferred_date_bonus;
		}
	}
	return total;
}

auto annealing_solver::anneal(const scheduling_problem &problem, std::mt19937_64 &rng, const run_control &control) const -> annealing_run
{
	const auto &index = problem.index();
	const std::size_t n = problem.requests().size();
	const auto hosts_with_slots = index.handles_with_slots();

	annealing_run run{.best = slot_mapping(n), .stats = {}};
	run.stats.final_temperature = config_.initial_temperature;

	if (n == 0 || hosts_with_slots.empty()) {
		return run;
	}

	auto draw = [&]() -> slot_ref {
		std::uniform_int_distribution<std::size_t> pick_host(0, hosts_with_slots.size() - 1);
		const host_handle h = hosts_with_slots[pick_host(rng)];
		std::uniform_int_distribution<std::size_t> pick_slot(0, index.slots(h).size() - 1);
		return {.host = h, .slot = pick_slot(rng)};
	};

	slot_mapping current(n);
	for (auto &m : current) {
		m = draw();
	}

	double current_score = objective(problem, current);
	run.best = current;
	run.stats.initial_objective = current_score;
	run.stats.best_objective = current_score;

	std::uniform_int_distribution<std::size_t> pick_request(0, n - 1);
	std::uniform_real_distribution<double> unit(0.0, 1.0);

	double temperature = config_.initial_temperature;
	int iterations = 0;

	while (temperature > config_.min_temperature && iterations < config_.max_iterations) {
		if (control.should_stop()) {
			run.stats.cancelled = true;
			break;
		}

		// Move one request to a fresh random slot, undo if rejected
		const std::size_t moved = pick_request(rng);
		const auto previous = current[moved];
		current[moved] = draw();

		const double neighbor_score = objective(problem, current);
		const double delta = neighbor_score - current_score;

		if (delta > 0 || unit(rng) < std::exp(delta / temperature)) {
			current_score = neighbor_score;
			if (current_score > run.stats.best_objective) {
				run.best = current;
				run.stats.best_objective = current_score;
			}
		}
		else {
			current[moved] = previous;
		}

		temperature *= config_.cooling_rate;
		++iterations;
		run.stats.best_trace.push_back(run.stats.best_objective);
	}

	run.stats.iterations = iterations;
	run.stats.final_temperature = temperature;
	return run;
}

auto annealing_solver::to_outcome(const scheduling_problem &problem, const annealing_run &run) const -> strategy_outcome
{
	const auto requests = problem.requests();
	const auto &index = problem.index();
	const auto &constraints = problem.constraints();
	const int buffer = enforce_buffer_ ? constraints.buffer_minutes : 0;

	strategy_outcome out;
	schedule_book book(index.size());

	for (std::size_t i = 0; i < requests.size(); ++i) {
		const auto &request = requests[i];
		const auto &ref = run.best[i];

		if (!ref) {
			out.unscheduled.push_back({.request_id = request.id, .reason = std::string(constants::text::no_suitable_slot), .alternatives = {}});
			continue;
		}

		const auto &owner = index.host_at(ref->host);
		const auto &slot = index.slots(ref->host)[ref->slot];

		if (auto why = book.check(ref->host, owner, slot, constraints, buffer); why != infeasibility::none) {
			out.unscheduled.push_back({.request_id = request.id, .reason = std::string(describe(why)), .alternatives = {}});
			continue;
		}

		book.commit(ref->host, slot);
		out.assignments.push_back({.request_id = request.id,
															 .host_id = owner.id,
															 .slot = slot,
															 .score = request.importance_score,
															 .rationale = std::format("Quantum-inspired assignment to {} (score: {})", owner.display_name(), request.importance_score)});
	}

	out.explanation = std::format("Simulated annealing optimization: {} iterations, best objective {}{}", run.stats.iterations, run.stats.best_objective,
																run.stats.cancelled ? " (stopped early)" : "");
	return out;
}

auto annealing_solver::solve(const scheduling_problem &problem, const run_control &control) -> std::expected<strategy_outcome, type::error>
{
	log::info("Running simulated annealing: {} requests, {} active hosts", problem.requests().size(), problem.index().size());

	std::mt19937_64 rng{config_.seed ? config_.seed : std::random_device{}()};
	auto run = anneal(problem, rng, control);

	if (!std::isfinite(run.stats.best_objective)) {
		return std::unexpected(type::error{type::error_kind::solver_failure, "annealing objective is not finite"});
	}

	if (run.stats.cancelled) {
		log::warn("Simulated annealing stopped after {} iterations, keeping best so far", run.stats.iterations);
	}
	log::info("Simulated annealing: {} iterations, score: {}", run.stats.iterations, run.stats.best_objective);

	return to_outcome(problem, run);
}

} // namespace agenda
