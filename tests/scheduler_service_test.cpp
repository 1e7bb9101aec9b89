#include "services/scheduler_service.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace agenda {
namespace {

using namespace fixtures;

// Service wired to two scripted strategies whose call counts stay observable.
struct scripted_service {
	scripted_strategy *classical;
	scripted_strategy *metaheuristic;
	std::unique_ptr<scheduler_service> service;

	scripted_service(std::size_t classical_count, std::size_t annealing_count, scripted_strategy::mode annealing_mode = scripted_strategy::mode::schedule,
									 scripted_strategy::mode classical_mode = scripted_strategy::mode::schedule)
	{
		auto c = std::make_unique<scripted_strategy>(scheduler_algorithm::classical, classical_count, classical_mode);
		auto m = std::make_unique<scripted_strategy>(scheduler_algorithm::quantum, annealing_count, annealing_mode);
		classical = c.get();
		metaheuristic = m.get();
		service = std::make_unique<scheduler_service>(scheduler_config{}, std::move(c), std::move(m));
	}
};

TEST(SchedulerServiceTest, HybridKeepsAnnealingResultAboveThreshold)
{
	auto req = make_request_set(10, 3, 4);
	req.algorithm = scheduler_algorithm::hybrid;

	scripted_service s{10, 9};
	auto result = s.service->optimize(req);

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->algorithm_used, scheduler_algorithm::quantum);
	EXPECT_EQ(result->status, run_status::succeeded);
	EXPECT_EQ(result->metrics.scheduled_count, 9U);
	EXPECT_EQ(result->explanation, "Hybrid: quantum-inspired solution accepted (9/10 scheduled)");
	EXPECT_EQ(s.metaheuristic->calls(), 1);
	EXPECT_EQ(s.classical->calls(), 0);
}

TEST(SchedulerServiceTest, HybridFallsBackToClassicalBelowThreshold)
{
	auto req = make_request_set(10, 3, 4);

	scripted_service s{10, 5};
	auto result = s.service->optimize(req);

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->algorithm_used, scheduler_algorithm::classical);
	EXPECT_EQ(result->status, run_status::succeeded);
	EXPECT_EQ(result->metrics.scheduled_count, 10U);
	EXPECT_EQ(result->explanation, "Hybrid: classical solution (problem size or performance): scripted outcome");
	EXPECT_EQ(s.metaheuristic->calls(), 1);
	EXPECT_EQ(s.classical->calls(), 1);
}

TEST(SchedulerServiceTest, HybridThresholdIsStrict)
{
	auto req = make_request_set(10, 3, 4);

	scripted_service s{10, 7};
	auto result = s.service->optimize(req);

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->algorithm_used, scheduler_algorithm::classical);
	EXPECT_EQ(s.classical->calls(), 1);
}

TEST(SchedulerServiceTest, LargeProblemsSkipAnnealing)
{
	scripted_service many_requests{51, 51};
	auto result = many_requests.service->optimize(make_request_set(51, 2, 4));
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->algorithm_used, scheduler_algorithm::classical);
	EXPECT_EQ(many_requests.metaheuristic->calls(), 0);

	scripted_service many_hosts{5, 5};
	result = many_hosts.service->optimize(make_request_set(5, 11, 1));
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->algorithm_used, scheduler_algorithm::classical);
	EXPECT_EQ(many_hosts.metaheuristic->calls(), 0);
}

TEST(SchedulerServiceTest, FailingAnnealingFallsBackOnce)
{
	auto req = make_request_set(4, 2, 2);
	req.algorithm = scheduler_algorithm::quantum;

	scripted_service s{4, 0, scripted_strategy::mode::fail};
	auto result = s.service->optimize(req);

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->status, run_status::failed_fallback);
	EXPECT_EQ(result->algorithm_used, scheduler_algorithm::classical);
	EXPECT_EQ(result->explanation, "Fallback to classical algorithm due to error: scripted failure");
	EXPECT_EQ(result->metrics.scheduled_count, 4U);
	EXPECT_EQ(s.classical->calls(), 1);
}

TEST(SchedulerServiceTest, ThrowingAnnealingIsReportedAsFailure)
{
	auto req = make_request_set(4, 2, 2);

	scripted_service s{4, 0, scripted_strategy::mode::raise};
	auto result = s.service->optimize(req);

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->status, run_status::failed_fallback);
	EXPECT_TRUE(result->explanation.starts_with("Fallback to classical algorithm due to error"));
	EXPECT_NE(result->explanation.find("scripted exception"), std::string::npos);
}

TEST(SchedulerServiceTest, ClassicalFailureIsAnError)
{
	auto req = make_request_set(4, 2, 2);
	req.algorithm = scheduler_algorithm::classical;

	scripted_service s{4, 4, scripted_strategy::mode::schedule, scripted_strategy::mode::fail};
	auto result = s.service->optimize(req);

	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, type::error_kind::solver_failure);
	EXPECT_EQ(s.classical->calls(), 1);
	EXPECT_EQ(s.metaheuristic->calls(), 0);
}

TEST(SchedulerServiceTest, FallbackFailureIsAnError)
{
	auto req = make_request_set(4, 2, 2);

	scripted_service s{4, 4, scripted_strategy::mode::fail, scripted_strategy::mode::fail};
	auto result = s.service->optimize(req);

	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, type::error_kind::solver_failure);
	EXPECT_EQ(s.classical->calls(), 1);
}

TEST(SchedulerServiceTest, HybridNeverRerunsFailedClassical)
{
	// too large for annealing, so classical is the first and only solver
	scripted_service large{0, 0, scripted_strategy::mode::schedule, scripted_strategy::mode::fail};
	auto result = large.service->optimize(make_request_set(51, 2, 4));

	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, type::error_kind::solver_failure);
	EXPECT_EQ(large.classical->calls(), 1);
	EXPECT_EQ(large.metaheuristic->calls(), 0);

	// annealing below the threshold hands over to classical, which fails
	scripted_service rejected{0, 5, scripted_strategy::mode::schedule, scripted_strategy::mode::raise};
	result = rejected.service->optimize(make_request_set(10, 3, 4));

	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, type::error_kind::solver_failure);
	EXPECT_EQ(rejected.classical->calls(), 1);
	EXPECT_EQ(rejected.metaheuristic->calls(), 1);
}

TEST(SchedulerServiceTest, InvalidConstraintsNeverReachTheSolvers)
{
	auto req = make_request_set(4, 2, 2);
	req.constraints.meeting_duration_minutes = 10;

	scripted_service s{4, 4};
	auto result = s.service->optimize(req);

	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, type::error_kind::invalid_constraints);
	EXPECT_EQ(s.classical->calls(), 0);
	EXPECT_EQ(s.metaheuristic->calls(), 0);
}

TEST(SchedulerServiceTest, DuplicateRequestIdsAreInvalidInput)
{
	auto req = make_request_set(3, 1, 4);
	req.requests[2].id = "r0";

	scheduler_service service;
	auto result = service.optimize(req);

	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, type::error_kind::invalid_input);
}

TEST(SchedulerServiceTest, EmptyInputGivesEmptyResult)
{
	schedule_request req;
	req.constraints = make_constraints();

	scheduler_service service;
	for (auto algo : {scheduler_algorithm::classical, scheduler_algorithm::quantum, scheduler_algorithm::hybrid}) {
		req.algorithm = algo;
		auto result = service.optimize(req);

		ASSERT_TRUE(result.has_value());
		EXPECT_TRUE(result->assignments.empty());
		EXPECT_TRUE(result->unscheduled.empty());
		EXPECT_EQ(result->metrics.total_requests, 0U);
		EXPECT_DOUBLE_EQ(result->metrics.success_rate(), 0.0);
		EXPECT_DOUBLE_EQ(result->metrics.average_host_utilization, 0.0);
		EXPECT_EQ(result->status, run_status::succeeded);
	}
}

TEST(SchedulerServiceTest, MetricsReflectTheAssignments)
{
	auto req = make_request_set(3, 1, 2);
	req.algorithm = scheduler_algorithm::classical;
	req.requests[0].importance_score = 80;

	scheduler_service service;
	auto result = service.optimize(req);

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->metrics.total_requests, 3U);
	EXPECT_EQ(result->metrics.scheduled_count, 2U);
	EXPECT_EQ(result->metrics.unscheduled_count, 1U);
	EXPECT_DOUBLE_EQ(result->metrics.total_score, 130.0);
	// one availability day at 4 slots per day
	EXPECT_DOUBLE_EQ(result->metrics.average_host_utilization, 0.5);
	EXPECT_EQ(result->metrics.constraint_violations, 0U);
	EXPECT_GE(result->computation_time_ms, 0.0);
}

TEST(SchedulerServiceTest, RealHybridRunsStayConsistent)
{
	auto req = make_request_set(12, 3, 3);

	for (std::uint64_t seed = 1; seed <= 10; ++seed) {
		scheduler_config config;
		config.annealing.seed = seed;
		scheduler_service service{config};

		auto result = service.optimize(req);
		ASSERT_TRUE(result.has_value());
		EXPECT_EQ(result->metrics.constraint_violations, 0U) << "seed " << seed;
		EXPECT_EQ(result->assignments.size() + result->unscheduled.size(), 12U);
		EXPECT_EQ(result->status, run_status::succeeded);
	}
}

TEST(SchedulerServiceTest, ResultSerialisesWithWireNames)
{
	auto req = make_request_set(2, 1, 1);
	req.algorithm = scheduler_algorithm::classical;

	scheduler_service service;
	auto result = service.optimize(req);
	ASSERT_TRUE(result.has_value());

	const auto j = result->to_json();
	EXPECT_EQ(j.at("algorithmUsed"), "classical");
	EXPECT_EQ(j.at("status"), "succeeded");
	EXPECT_EQ(j.at("assignments").size(), 1U);
	EXPECT_EQ(j.at("assignments")[0].at("requestId"), "r0");
	EXPECT_EQ(j.at("assignments")[0].at("timeSlot").at("startTime"), "09:00");
	EXPECT_EQ(j.at("unscheduled")[0].at("alternativeSuggestions").size(), 1U);
	EXPECT_EQ(j.at("metrics").at("scheduledCount"), 1);
}

} // namespace
} // namespace agenda
