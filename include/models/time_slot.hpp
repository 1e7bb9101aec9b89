#pragma once

#include "core/utils.hpp"
#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace agenda {

// "YYYY-MM-DD" <-> calendar date
[[nodiscard]] auto parse_date(std::string_view text) -> type::result<type::date>;
[[nodiscard]] auto format_date(type::date d) -> std::string;

// "HH:MM" <-> minutes since midnight; "24:00" is accepted as end of day
[[nodiscard]] auto parse_clock(std::string_view text) -> type::result<int>;
[[nodiscard]] auto format_clock(int minutes) -> std::string;

class time_slot {
public:
	type::date date{};
	int start{}; // minutes since midnight
	int end{};
	std::optional<std::string> host_id{};

	[[nodiscard]] auto operator==(const time_slot &) const -> bool = default;

	[[nodiscard]] auto length(this const auto &self) -> int { return self.end - self.start; }

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json out{{"date", format_date(self.date)}, {"startTime", format_clock(self.start)}, {"endTime", format_clock(self.end)}};
		if (self.host_id) {
			out["hostId"] = *self.host_id;
		}
		return out;
	}

	// A slot nested in an availability entry may omit its date and inherit the entry's.
	[[nodiscard]] static auto from_json(const nlohmann::json &j, std::optional<type::date> inherited = std::nullopt) -> time_slot
	{
		time_slot s;

		if (j.contains("date")) {
			auto d = parse_date(j.at("date").get<std::string>());
			if (!d) {
				throw std::invalid_argument(d.error().message);
			}
			s.date = *d;
		}
		else if (inherited) {
			s.date = *inherited;
		}
		else {
			throw std::invalid_argument("time slot is missing its date");
		}

		auto start = parse_clock(j.at("startTime").get<std::string>());
		if (!start) {
			throw std::invalid_argument(start.error().message);
		}
		auto end = parse_clock(j.at("endTime").get<std::string>());
		if (!end) {
			throw std::invalid_argument(end.error().message);
		}
		s.start = *start;
		s.end = *end;

		if (j.contains("hostId") && !j.at("hostId").is_null()) {
			s.host_id = j.at("hostId").get<std::string>();
		}
		return s;
	}
};

// Human-readable "2025-03-10 09:00-09:30"
[[nodiscard]] auto describe(const time_slot &slot) -> std::string;

} // namespace agenda
