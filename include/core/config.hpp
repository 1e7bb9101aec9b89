#pragma once

#include "core/logger.hpp"
#include "core/utils.hpp"
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace agenda {

struct annealing_config {
	double initial_temperature{1000.0};
	double min_temperature{1.0};
	double cooling_rate{0.95};
	int max_iterations{1000};
	double collision_penalty{100.0};
	double preferred_date_bonus{15.0};
	std::uint64_t seed{0}; // 0 = seed from entropy
};

struct greedy_config {
	double expertise_bonus{20.0};
	double preferred_date_bonus{15.0};
	double preferred_type_bonus{10.0};
};

struct hybrid_config {
	std::size_t max_requests{50};
	std::size_t max_hosts{10};
	double acceptance_ratio{0.7}; // annealing must schedule strictly more than this share
};

struct metrics_config {
	// Assumed slots per availability day when computing host utilization
	double utilization_slots_per_day{4.0};
};

struct scheduler_config {
	annealing_config annealing{};
	greedy_config greedy{};
	hybrid_config hybrid{};
	metrics_config metrics{};
	bool enforce_buffer{false};

	log::level log_level{log::level::info};
	std::string log_file{};

	[[nodiscard]] auto validate() const -> std::expected<type::ok_t, type::error>;

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		return {{"annealing",
						 {{"initialTemperature", self.annealing.initial_temperature},
							{"minTemperature", self.annealing.min_temperature},
							{"coolingRate", self.annealing.cooling_rate},
							{"maxIterations", self.annealing.max_iterations},
							{"collisionPenalty", self.annealing.collision_penalty},
							{"preferredDateBonus", self.annealing.preferred_date_bonus},
							{"seed", self.annealing.seed}}},
						{"greedy",
						 {{"expertiseBonus", self.greedy.expertise_bonus},
							{"preferredDateBonus", self.greedy.preferred_date_bonus},
							{"preferredTypeBonus", self.greedy.preferred_type_bonus}}},
						{"hybrid", {{"maxRequests", self.hybrid.max_requests}, {"maxHosts", self.hybrid.max_hosts}, {"acceptanceRatio", self.hybrid.acceptance_ratio}}},
						{"metrics", {{"utilizationSlotsPerDay", self.metrics.utilization_slots_per_day}}},
						{"enforceBuffer", self.enforce_buffer},
						{"logLevel", log::level_name(self.log_level)},
						{"logFile", self.log_file}};
	}

	// Every key is optional; missing ones keep their defaults.
	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> scheduler_config;
};

[[nodiscard]] auto load_config(const std::filesystem::path &path) -> std::expected<scheduler_config, type::error>;

// Apply log level and file from the config to the global logger.
[[nodiscard]] auto apply_logging(const scheduler_config &config) -> std::expected<type::ok_t, type::error>;

} // namespace agenda
