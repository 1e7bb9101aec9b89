#include "core/constants.hpp"
#include "core/logger.hpp"
#include "services/greedy_solver.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <functional>
#include <numeric>

namespace agenda {

auto greedy_solver::expertise_matches(const meeting_request &request, const host &h) -> bool
{
	return std::ranges::any_of(request.requested_topics, [&](const std::string &topic) {
		return std::ranges::any_of(h.expertise, [&](const std::string &exp) { return util::mutual_contains_ci(topic, exp); });
	});
}

auto greedy_solver::score(const meeting_request &request, const host &h, const time_slot &slot) const -> double
{
	double s = request.importance_score;

	if (expertise_matches(request, h)) {
		s += config_.expertise_bonus;
	}
	if (request.prefers(slot.date)) {
		s += config_.preferred_date_bonus;
	}
	if (h.prefers_type(request.meeting_type)) {
		s += config_.preferred_type_bonus;
	}
	return s;
}

auto greedy_solver::rationale(const meeting_request &request, const host &h, const time_slot &slot, double score) const -> std::string
{
	std::vector<std::string> reasons;
	reasons.push_back(std::format("Importance score: {}", request.importance_score));

	if (expertise_matches(request, h)) {
		reasons.emplace_back(constants::text::reason_expertise);
	}
	if (request.prefers(slot.date)) {
		reasons.emplace_back(constants::text::reason_preferred_date);
	}
	if (h.prefers_type(request.meeting_type)) {
		reasons.emplace_back(constants::text::reason_preferred_type);
	}

	std::string joined;
	for (const auto &r : reasons) {
		if (!joined.empty()) {
			joined += ". ";
		}
		joined += r;
	}
	return std::format("Assigned to {} (Score: {}). {}.", h.display_name(), std::lround(score), joined);
}

auto greedy_solver::find_best(const meeting_request &request, const scheduling_problem &problem, const schedule_book &book) const -> std::optional<candidate>
{
	const auto &index = problem.index();
	const auto &constraints = problem.constraints();
	const int buffer = enforce_buffer_ ? constraints.buffer_minutes : 0;

	std::optional<candidate> best;
	for (host_handle h = 0; h < index.size(); ++h) {
		const auto &owner = index.host_at(h);
		const auto slots = index.slots(h);

		for (std::size_t i = 0; i < slots.size(); ++i) {
			if (book.check(h, owner, slots[i], constraints, buffer) != infeasibility::none) {
				continue;
			}

			const double s = score(request, owner, slots[i]);
			// strictly greater keeps the first candidate on ties
			if (!best || s > best->score) {
				best = candidate{.handle = h, .slot_index = i, .score = s};
			}
		}
	}
	return best;
}

auto greedy_solver::solve(const scheduling_problem &problem, const run_control &) -> std::expected<strategy_outcome, type::error>
{
	const auto requests = problem.requests();
	const auto &index = problem.index();
	log::info("Running greedy solver: {} requests, {} active hosts, {} slots", requests.size(), index.size(), index.total_slots());

	// Importance descending, ties keep input order
	std::vector<std::size_t> order(requests.size());
	std::iota(order.begin(), order.end(), std::size_t{0});
	std::ranges::stable_sort(order, std::greater{}, [&](std::size_t i) { return requests[i].importance_score; });

	strategy_outcome out;
	schedule_book book(index.size());

	for (std::size_t ri : order) {
		const auto &request = requests[ri];

		if (auto best = find_best(request, problem, book)) {
			const auto &owner = index.host_at(best->handle);
			const auto &slot = index.slots(best->handle)[best->slot_index];

			book.commit(best->handle, slot);
			out.assignments.push_back({.request_id = request.id,
																 .host_id = owner.id,
																 .slot = slot,
																 .score = best->score,
																 .rationale = rationale(request, owner, slot, best->score)});
			log::debug("request {}{} -> host {} at {} (score {})", request.id, request.company_name.empty() ? "" : std::format(" ({})", request.company_name),
								 owner.id, describe(slot), best->score);
		}
		else {
			out.unscheduled.push_back({.request_id = request.id,
																 .reason = std::string(constants::text::no_slot_matches),
																 .alternatives = index.first_slots(constants::limits::max_alternative_suggestions)});
			log::debug("request {}{} left unscheduled", request.id, request.company_name.empty() ? "" : std::format(" ({})", request.company_name));
		}
	}

	out.explanation = std::format("Greedy algorithm: assigned {}/{} meetings", out.assignments.size(), requests.size());
	log::info("Greedy solver finished: {} assigned, {} unscheduled", out.assignments.size(), out.unscheduled.size());
	return out;
}

} // namespace agenda
