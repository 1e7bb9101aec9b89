#include "core/constants.hpp"
#include "core/utils.hpp"
#include "models/schedule.hpp"

#include <cmath>
#include <format>
#include <unordered_set>

namespace agenda {

auto algorithm_name(scheduler_algorithm a) -> std::string_view
{
	switch (a) {
	case scheduler_algorithm::classical:
		return "classical";
	case scheduler_algorithm::quantum:
		return "quantum";
	case scheduler_algorithm::hybrid:
		return "hybrid";
	}
	return "unknown";
}

auto parse_algorithm(std::string_view name) -> std::optional<scheduler_algorithm>
{
	const auto lower = util::to_lower(name);
	if (lower == "classical")
		return scheduler_algorithm::classical;
	if (lower == "quantum")
		return scheduler_algorithm::quantum;
	if (lower == "hybrid")
		return scheduler_algorithm::hybrid;
	return std::nullopt;
}

auto status_name(run_status s) -> std::string_view
{
	switch (s) {
	case run_status::succeeded:
		return "succeeded";
	case run_status::failed_fallback:
		return "failed_fallback";
	}
	return "unknown";
}

auto validate_request(const schedule_request &request) -> std::expected<type::ok_t, type::error>
{
	if (auto res = request.constraints.validate(); !res) {
		return res;
	}

	auto invalid = [](std::string msg) { return std::unexpected(type::error{type::error_kind::invalid_input, msg}); };

	std::unordered_set<std::string> request_ids;
	for (const auto &r : request.requests) {
		if (r.id.empty()) {
			return invalid("meeting request without id");
		}
		if (!request_ids.insert(r.id).second) {
			return invalid(std::format("duplicate meeting request id {}", r.id));
		}
		if (!std::isfinite(r.importance_score) || r.importance_score < constants::limits::min_importance ||
				r.importance_score > constants::limits::max_importance) {
			return invalid(std::format("request {}: importance score {} outside 0-100", r.id, r.importance_score));
		}
	}

	std::unordered_set<std::string> host_ids;
	for (const auto &h : request.hosts) {
		if (h.id.empty()) {
			return invalid("host without id");
		}
		if (!host_ids.insert(h.id).second) {
			return invalid(std::format("duplicate host id {}", h.id));
		}
		if (h.max_meetings_per_day && *h.max_meetings_per_day < 0) {
			return invalid(std::format("host {}: negative daily meeting limit", h.id));
		}

		for (const auto &day : h.availability) {
			for (const auto &slot : day.slots) {
				if (slot.start >= slot.end) {
					return invalid(std::format("host {}: slot {} ends before it starts", h.id, describe(slot)));
				}
			}
		}
	}

	return type::ok_t{};
}

} // namespace agenda
