#include "core/constants.hpp"
#include "services/annealing_solver.hpp"
#include "services/schedule_validator.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <stop_token>

namespace agenda {
namespace {

using namespace fixtures;

auto seeded(std::uint64_t seed) -> annealing_config
{
	annealing_config c;
	c.seed = seed;
	return c;
}

TEST(AnnealingSolverTest, ObjectivePenalisesRepeatedSlotKeys)
{
	schedule_request req;
	req.constraints = make_constraints();
	auto first = make_request("a", 60);
	first.preferred_dates = {day(10)};
	req.requests = {first, make_request("b", 40)};
	req.hosts = {make_host("h", {open_day(10, half_hours(10, 2))})};

	const scheduling_problem problem{req};
	const annealing_solver solver;

	const slot_mapping apart{slot_ref{.host = 0, .slot = 0}, slot_ref{.host = 0, .slot = 1}};
	const slot_mapping together{slot_ref{.host = 0, .slot = 0}, slot_ref{.host = 0, .slot = 0}};
	const slot_mapping partial{std::nullopt, slot_ref{.host = 0, .slot = 1}};

	EXPECT_DOUBLE_EQ(solver.objective(problem, apart), 60 + 15 + 40);
	EXPECT_DOUBLE_EQ(solver.objective(problem, together), 60 + 15 - 100);
	EXPECT_DOUBLE_EQ(solver.objective(problem, partial), 40);
}

TEST(AnnealingSolverTest, BestObjectiveNeverDecreases)
{
	const auto req = make_request_set(10, 3, 4);
	const scheduling_problem problem{req};
	const annealing_solver solver{seeded(7)};

	std::mt19937_64 rng{7};
	const auto run = solver.anneal(problem, rng);

	ASSERT_FALSE(run.stats.best_trace.empty());
	EXPECT_GE(run.stats.best_trace.front(), run.stats.initial_objective);
	for (std::size_t i = 1; i < run.stats.best_trace.size(); ++i) {
		EXPECT_GE(run.stats.best_trace[i], run.stats.best_trace[i - 1]);
	}
	EXPECT_DOUBLE_EQ(run.stats.best_trace.back(), run.stats.best_objective);
	EXPECT_DOUBLE_EQ(solver.objective(problem, run.best), run.stats.best_objective);
}

TEST(AnnealingSolverTest, DefaultScheduleStopsWhenTemperatureDropsBelowOne)
{
	const auto req = make_request_set(5, 2, 3);
	const scheduling_problem problem{req};
	const annealing_solver solver;

	std::mt19937_64 rng{1};
	const auto run = solver.anneal(problem, rng);

	// 1000 * 0.95^k falls below 1 after 135 steps
	EXPECT_EQ(run.stats.iterations, 135);
	EXPECT_EQ(run.stats.best_trace.size(), 135U);
	EXPECT_LE(run.stats.final_temperature, 1.0);
	EXPECT_FALSE(run.stats.cancelled);
}

TEST(AnnealingSolverTest, IterationCapBoundsTheSearch)
{
	annealing_config config;
	config.cooling_rate = 0.999;
	config.max_iterations = 50;

	const auto req = make_request_set(5, 2, 3);
	const scheduling_problem problem{req};
	const annealing_solver solver{config};

	std::mt19937_64 rng{3};
	EXPECT_EQ(solver.anneal(problem, rng).stats.iterations, 50);
}

TEST(AnnealingSolverTest, SameSeedReproducesTheSameSchedule)
{
	const auto req = make_request_set(8, 3, 3);
	const scheduling_problem problem{req};
	annealing_solver solver{seeded(42)};

	auto first = solver.solve(problem, {});
	auto second = solver.solve(problem, {});

	ASSERT_TRUE(first.has_value());
	ASSERT_TRUE(second.has_value());
	EXPECT_EQ(first->assignments, second->assignments);
	EXPECT_EQ(first->explanation, second->explanation);
}

TEST(AnnealingSolverTest, StopRequestReturnsInitialMapping)
{
	const auto req = make_request_set(6, 2, 3);
	const scheduling_problem problem{req};
	const annealing_solver solver;

	std::stop_source source;
	source.request_stop();
	const run_control control{.deadline = std::nullopt, .stop = source.get_token()};

	std::mt19937_64 rng{11};
	const auto run = solver.anneal(problem, rng, control);

	EXPECT_TRUE(run.stats.cancelled);
	EXPECT_EQ(run.stats.iterations, 0);
	EXPECT_DOUBLE_EQ(run.stats.best_objective, run.stats.initial_objective);
	for (const auto &m : run.best) {
		EXPECT_TRUE(m.has_value());
	}
}

TEST(AnnealingSolverTest, ExpiredDeadlineStillYieldsValidOutcome)
{
	const auto req = make_request_set(6, 2, 3);
	const scheduling_problem problem{req};
	annealing_solver solver{seeded(5)};

	const run_control control{.deadline = std::chrono::steady_clock::now() - std::chrono::seconds{1}, .stop = {}};
	auto out = solver.solve(problem, control);

	ASSERT_TRUE(out.has_value());
	EXPECT_EQ(out->assignments.size() + out->unscheduled.size(), 6U);
	EXPECT_NE(out->explanation.find("stopped early"), std::string::npos);
	EXPECT_TRUE(schedule_validator::check_all(problem, out->assignments, out->unscheduled).ok);
}

TEST(AnnealingSolverTest, ConversionDropsCollidingAndInfeasibleSlots)
{
	schedule_request req;
	req.constraints = make_constraints();
	req.requests = {make_request("a", 30), make_request("b", 90), make_request("c", 50), make_request("d", 50)};
	req.hosts = {make_host("h", {open_day(10, {slot(10, "09:00", "09:30"), slot(10, "09:15", "09:45"), slot(10, "19:00", "19:30")})})};

	const scheduling_problem problem{req};
	const annealing_solver solver;

	annealing_run run;
	run.best = {slot_ref{.host = 0, .slot = 0}, slot_ref{.host = 0, .slot = 1}, slot_ref{.host = 0, .slot = 2}, std::nullopt};

	const auto out = solver.to_outcome(problem, run);

	ASSERT_EQ(out.assignments.size(), 1U);
	EXPECT_EQ(out.assignments[0].request_id, "a");
	EXPECT_DOUBLE_EQ(out.assignments[0].score, 30);

	ASSERT_EQ(out.unscheduled.size(), 3U);
	EXPECT_EQ(out.unscheduled[0].request_id, "b");
	EXPECT_EQ(out.unscheduled[0].reason, std::string(describe(infeasibility::conflict)));
	EXPECT_EQ(out.unscheduled[1].reason, std::string(describe(infeasibility::outside_working_hours)));
	EXPECT_EQ(out.unscheduled[2].reason, "no suitable slot found");
}

TEST(AnnealingSolverTest, NoSlotsAnywhereLeavesEverythingUnmapped)
{
	auto req = make_request_set(3, 2, 0);
	const scheduling_problem problem{req};
	annealing_solver solver{seeded(9)};

	auto out = solver.solve(problem, {});

	ASSERT_TRUE(out.has_value());
	EXPECT_TRUE(out->assignments.empty());
	EXPECT_EQ(out->unscheduled.size(), 3U);
}

TEST(AnnealingSolverTest, RandomRunsNeverDoubleBook)
{
	const auto req = make_request_set(10, 3, 3);
	const scheduling_problem problem{req};

	for (std::uint64_t seed = 1; seed <= 20; ++seed) {
		annealing_solver solver{seeded(seed)};
		auto out = solver.solve(problem, {});
		ASSERT_TRUE(out.has_value());

		const auto report = schedule_validator::check_all(problem, out->assignments, out->unscheduled);
		EXPECT_TRUE(report.ok) << "seed " << seed << ": " << (report.errors.empty() ? "" : report.errors.front());
	}
}

TEST(AnnealingSolverTest, TimeoutMustBePositiveAndBounded)
{
	for (long long bad : {0LL, -5LL, constants::limits::max_timeout_ms + 1, std::numeric_limits<long long>::max()}) {
		auto control = run_control::with_timeout(bad);
		ASSERT_FALSE(control.has_value()) << bad;
		EXPECT_EQ(control.error().kind, type::error_kind::invalid_input);
	}

	auto control = run_control::with_timeout(60'000);
	ASSERT_TRUE(control.has_value());
	ASSERT_TRUE(control->deadline.has_value());
	EXPECT_FALSE(control->should_stop());
	EXPECT_GT(*control->deadline, std::chrono::steady_clock::now() + std::chrono::seconds{30});
}

} // namespace
} // namespace agenda
