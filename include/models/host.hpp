#pragma once

#include "models/time_slot.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace agenda {

struct host_availability {
	type::date date{};
	std::vector<time_slot> slots{};
	bool blocked{false};
	std::string block_reason{};

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json slots = nlohmann::json::array();
		for (const auto &s : self.slots) {
			slots.push_back(s.to_json());
		}

		nlohmann::json out{{"date", format_date(self.date)}, {"timeSlots", std::move(slots)}, {"isBlocked", self.blocked}};
		if (!self.block_reason.empty()) {
			out["blockReason"] = self.block_reason;
		}
		return out;
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> host_availability
	{
		auto d = parse_date(j.at("date").get<std::string>());
		if (!d) {
			throw std::invalid_argument(d.error().message);
		}

		host_availability a{.date = *d, .blocked = j.value("isBlocked", false), .block_reason = j.value("blockReason", std::string{})};
		if (j.contains("timeSlots")) {
			for (const auto &sj : j.at("timeSlots")) {
				a.slots.push_back(time_slot::from_json(sj, a.date));
			}
		}
		return a;
	}
};

class host {
public:
	std::string id;
	std::string name;
	std::vector<host_availability> availability;
	std::optional<int> max_meetings_per_day{}; // overrides the global constraint when set
	std::vector<std::string> expertise;
	std::vector<std::string> preferred_meeting_types;
	bool active{true};

	[[nodiscard]] auto display_name(this const auto &self) -> const std::string & { return self.name.empty() ? self.id : self.name; }

	[[nodiscard]] auto prefers_type(this const auto &self, std::string_view meeting_type) -> bool
	{
		return std::ranges::find(self.preferred_meeting_types, meeting_type) != self.preferred_meeting_types.end();
	}

	[[nodiscard]] auto daily_cap(this const auto &self, int global_cap) -> int { return self.max_meetings_per_day.value_or(global_cap); }

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json avail = nlohmann::json::array();
		for (const auto &a : self.availability) {
			avail.push_back(a.to_json());
		}

		nlohmann::json out{{"id", self.id},
											 {"name", self.name},
											 {"availability", std::move(avail)},
											 {"expertise", self.expertise},
											 {"preferredMeetingTypes", self.preferred_meeting_types},
											 {"isActive", self.active}};
		if (self.max_meetings_per_day) {
			out["maxMeetingsPerDay"] = *self.max_meetings_per_day;
		}
		return out;
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> host
	{
		host h{.id = j.at("id").get<std::string>(),
					 .name = j.value("name", std::string{}),
					 .expertise = j.value("expertise", std::vector<std::string>{}),
					 .preferred_meeting_types = j.value("preferredMeetingTypes", std::vector<std::string>{}),
					 .active = j.value("isActive", true)};

		if (auto it = j.find("maxMeetingsPerDay"); it != j.end() && !it->is_null()) {
			h.max_meetings_per_day = it->get<int>();
		}

		if (j.contains("availability")) {
			for (const auto &aj : j.at("availability")) {
				h.availability.push_back(host_availability::from_json(aj));
			}
		}
		return h;
	}
};

} // namespace agenda
