#pragma once

#include "core/constants.hpp"
#include "models/time_slot.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace agenda {

class meeting_request {
public:
	std::string id;
	double importance_score{constants::defaults::importance_score};
	std::vector<std::string> requested_topics;
	std::vector<type::date> preferred_dates;
	std::string meeting_type;
	std::string company_name;

	[[nodiscard]] auto prefers(this const auto &self, type::date d) -> bool { return std::ranges::find(self.preferred_dates, d) != self.preferred_dates.end(); }

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json dates = nlohmann::json::array();
		for (const auto &d : self.preferred_dates) {
			dates.push_back(format_date(d));
		}

		nlohmann::json out{{"id", self.id},
											 {"importanceScore", self.importance_score},
											 {"requestedTopics", self.requested_topics},
											 {"preferredDates", std::move(dates)},
											 {"meetingType", self.meeting_type}};
		if (!self.company_name.empty()) {
			out["companyName"] = self.company_name;
		}
		return out;
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> meeting_request
	{
		meeting_request r{.id = j.at("id").get<std::string>(),
											.requested_topics = j.value("requestedTopics", std::vector<std::string>{}),
											.meeting_type = j.value("meetingType", std::string{}),
											.company_name = j.value("companyName", std::string{})};

		// the qualification step may not have scored the request yet
		if (auto it = j.find("importanceScore"); it != j.end() && !it->is_null()) {
			r.importance_score = it->get<double>();
		}

		for (const auto &dj : j.value("preferredDates", std::vector<std::string>{})) {
			auto d = parse_date(dj);
			if (!d) {
				throw std::invalid_argument(d.error().message);
			}
			r.preferred_dates.push_back(*d);
		}
		return r;
	}
};

} // namespace agenda
