#pragma once

#include "models/constraints.hpp"
#include "models/host.hpp"
#include "models/meeting_request.hpp"
#include "models/time_slot.hpp"
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agenda {

enum class scheduler_algorithm { classical, quantum, hybrid };

[[nodiscard]] auto algorithm_name(scheduler_algorithm a) -> std::string_view;
[[nodiscard]] auto parse_algorithm(std::string_view name) -> std::optional<scheduler_algorithm>;

// Terminal state of one run
enum class run_status { succeeded, failed_fallback };

[[nodiscard]] auto status_name(run_status s) -> std::string_view;

struct schedule_request {
	std::vector<meeting_request> requests;
	std::vector<host> hosts;
	scheduling_constraints constraints;
	scheduler_algorithm algorithm{scheduler_algorithm::hybrid};

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json reqs = nlohmann::json::array();
		for (const auto &r : self.requests) {
			reqs.push_back(r.to_json());
		}
		nlohmann::json hs = nlohmann::json::array();
		for (const auto &h : self.hosts) {
			hs.push_back(h.to_json());
		}
		return {{"requests", std::move(reqs)}, {"hosts", std::move(hs)}, {"constraints", self.constraints.to_json()}, {"algorithm", algorithm_name(self.algorithm)}};
	}
};

// Constraints first (invalid_constraints), then request/host data (invalid_input).
[[nodiscard]] auto validate_request(const schedule_request &request) -> std::expected<type::ok_t, type::error>;

struct meeting_assignment {
	std::string request_id;
	std::string host_id;
	time_slot slot;
	double score{};
	std::string rationale;

	[[nodiscard]] auto operator==(const meeting_assignment &) const -> bool = default;

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		return {{"requestId", self.request_id}, {"hostId", self.host_id}, {"timeSlot", self.slot.to_json()}, {"score", self.score}, {"explanation", self.rationale}};
	}
};

struct unscheduled_request {
	std::string request_id;
	std::string reason;
	std::vector<time_slot> alternatives;

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json alts = nlohmann::json::array();
		for (const auto &s : self.alternatives) {
			alts.push_back(s.to_json());
		}
		return {{"requestId", self.request_id}, {"reason", self.reason}, {"alternativeSuggestions", std::move(alts)}};
	}
};

struct scheduler_metrics {
	std::size_t total_requests{};
	std::size_t scheduled_count{};
	std::size_t unscheduled_count{};
	double total_score{};
	double average_host_utilization{};
	std::size_t constraint_violations{};

	[[nodiscard]] auto success_rate(this const auto &self) -> double
	{
		return self.total_requests > 0 ? static_cast<double>(self.scheduled_count) / static_cast<double>(self.total_requests) : 0.0;
	}

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		return {{"totalRequests", self.total_requests},
						{"scheduledCount", self.scheduled_count},
						{"unscheduledCount", self.unscheduled_count},
						{"totalImportanceScore", self.total_score},
						{"averageHostUtilization", self.average_host_utilization},
						{"constraintViolations", self.constraint_violations}};
	}
};

struct schedule_result {
	std::vector<meeting_assignment> assignments;
	std::vector<unscheduled_request> unscheduled;
	scheduler_metrics metrics;
	scheduler_algorithm algorithm_used{scheduler_algorithm::classical};
	run_status status{run_status::succeeded};
	double computation_time_ms{};
	std::string explanation;

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json as = nlohmann::json::array();
		for (const auto &a : self.assignments) {
			as.push_back(a.to_json());
		}
		nlohmann::json us = nlohmann::json::array();
		for (const auto &u : self.unscheduled) {
			us.push_back(u.to_json());
		}
		return {{"assignments", std::move(as)},
						{"unscheduled", std::move(us)},
						{"metrics", self.metrics.to_json()},
						{"algorithmUsed", algorithm_name(self.algorithm_used)},
						{"status", status_name(self.status)},
						{"computationTimeMs", self.computation_time_ms},
						{"explanation", self.explanation}};
	}
};

} // namespace agenda
