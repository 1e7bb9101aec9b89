#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include "models/schedule.hpp"
#include "services/availability_index.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace agenda {

// Caller-imposed deadline / cancellation, polled by long-running searches.
struct run_control {
	std::optional<std::chrono::steady_clock::time_point> deadline{};
	std::stop_token stop{};

	[[nodiscard]] auto should_stop() const -> bool
	{
		if (stop.stop_requested()) {
			return true;
		}
		return deadline && std::chrono::steady_clock::now() >= *deadline;
	}

	// Deadline `timeout_ms` from now; non-positive or over-long timeouts are rejected.
	[[nodiscard]] static auto with_timeout(long long timeout_ms) -> std::expected<run_control, type::error>
	{
		if (timeout_ms <= 0 || timeout_ms > constants::limits::max_timeout_ms) {
			return std::unexpected(type::error{type::error_kind::invalid_input,
																				 std::format("timeout must be between 1 and {} ms, got {}", constants::limits::max_timeout_ms, timeout_ms)});
		}
		return run_control{.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds{timeout_ms}, .stop = {}};
	}
};

// Read-only view of one run's input plus the availability index built for it.
class scheduling_problem {
public:
	explicit scheduling_problem(const schedule_request &request)
			: request_{request}, index_{availability_index::build(request.hosts, request.constraints)}
	{}

	[[nodiscard]] auto requests() const -> std::span<const meeting_request> { return request_.requests; }
	[[nodiscard]] auto hosts() const -> std::span<const host> { return request_.hosts; }
	[[nodiscard]] auto constraints() const -> const scheduling_constraints & { return request_.constraints; }
	[[nodiscard]] auto index() const -> const availability_index & { return index_; }

private:
	const schedule_request &request_;
	availability_index index_;
};

// Raw solver output before metrics are attached.
struct strategy_outcome {
	std::vector<meeting_assignment> assignments;
	std::vector<unscheduled_request> unscheduled;
	std::string explanation;
};

/**
 * @brief
 * A solver that maps a problem to assignments or reports why it could not.
 * Out-of-process or hardware-backed solvers plug in behind this interface.
 */
class scheduling_strategy {
public:
	virtual ~scheduling_strategy() = default;

	[[nodiscard]] virtual auto name() const -> std::string_view = 0;
	[[nodiscard]] virtual auto algorithm() const -> scheduler_algorithm = 0;
	[[nodiscard]] virtual auto solve(const scheduling_problem &problem, const run_control &control) -> std::expected<strategy_outcome, type::error> = 0;
};

} // namespace agenda
