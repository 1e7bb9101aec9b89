#include "models/constraints.hpp"
#include "models/schedule.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace agenda {
namespace {

using namespace fixtures;

auto kind_of(const scheduling_constraints &c) -> std::optional<type::error_kind>
{
	auto res = c.validate();
	if (res) {
		return std::nullopt;
	}
	return res.error().kind;
}

TEST(ConstraintsTest, AcceptsTypicalEvent)
{
	EXPECT_TRUE(make_constraints().validate().has_value());

	auto single_day = make_constraints();
	single_day.event_end = single_day.event_start;
	EXPECT_TRUE(single_day.validate().has_value());
}

TEST(ConstraintsTest, RejectsContradictoryRanges)
{
	auto c = make_constraints();
	c.event_start = day(15);
	EXPECT_EQ(kind_of(c), type::error_kind::invalid_constraints);

	c = make_constraints();
	c.working_hours_start = 18 * 60;
	c.working_hours_end = 8 * 60;
	EXPECT_EQ(kind_of(c), type::error_kind::invalid_constraints);

	c = make_constraints();
	c.working_hours_end = c.working_hours_start;
	EXPECT_EQ(kind_of(c), type::error_kind::invalid_constraints);
}

TEST(ConstraintsTest, RejectsOutOfRangeLimits)
{
	auto c = make_constraints();
	c.meeting_duration_minutes = 181;
	EXPECT_EQ(kind_of(c), type::error_kind::invalid_constraints);

	c = make_constraints();
	c.max_meetings_per_day = 0;
	EXPECT_EQ(kind_of(c), type::error_kind::invalid_constraints);

	c = make_constraints();
	c.max_meetings_per_day = 13;
	EXPECT_EQ(kind_of(c), type::error_kind::invalid_constraints);

	c = make_constraints();
	c.buffer_minutes = 61;
	EXPECT_EQ(kind_of(c), type::error_kind::invalid_constraints);

	c = make_constraints();
	c.working_hours_start = 9 * 60;
	c.working_hours_end = 9 * 60 + 20;
	EXPECT_EQ(kind_of(c), type::error_kind::invalid_constraints);
}

TEST(ConstraintsTest, EventWindowIsInclusive)
{
	const auto c = make_constraints();
	EXPECT_TRUE(c.in_event_window(day(10)));
	EXPECT_TRUE(c.in_event_window(day(14)));
	EXPECT_FALSE(c.in_event_window(day(9)));
	EXPECT_FALSE(c.in_event_window(day(15)));
}

TEST(ConstraintsTest, RequestValidationChecksIdsAndScores)
{
	auto req = make_request_set(2, 2, 1);
	EXPECT_TRUE(validate_request(req).has_value());

	auto bad_score = req;
	bad_score.requests[0].importance_score = 101;
	ASSERT_FALSE(validate_request(bad_score).has_value());
	EXPECT_EQ(validate_request(bad_score).error().kind, type::error_kind::invalid_input);

	auto nan_score = req;
	nan_score.requests[1].importance_score = std::numeric_limits<double>::quiet_NaN();
	EXPECT_FALSE(validate_request(nan_score).has_value());

	auto dup_host = req;
	dup_host.hosts[1].id = "h0";
	EXPECT_FALSE(validate_request(dup_host).has_value());

	auto reversed_slot = req;
	reversed_slot.hosts[0].availability[0].slots[0] = slot(10, "10:00", "09:00");
	EXPECT_FALSE(validate_request(reversed_slot).has_value());

	// constraint problems are reported before request problems
	auto both = bad_score;
	both.constraints.buffer_minutes = -1;
	ASSERT_FALSE(validate_request(both).has_value());
	EXPECT_EQ(validate_request(both).error().kind, type::error_kind::invalid_constraints);
}

} // namespace
} // namespace agenda
