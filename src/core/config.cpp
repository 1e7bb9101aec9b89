#include "core/config.hpp"

#include <format>
#include <fstream>

namespace agenda {

auto scheduler_config::validate() const -> std::expected<type::ok_t, type::error>
{
	auto invalid = [](std::string_view msg) { return std::unexpected(type::error{type::error_kind::invalid_input, msg}); };

	if (!(annealing.initial_temperature > 0.0) || !(annealing.min_temperature > 0.0)) {
		return invalid("annealing temperatures must be positive");
	}
	if (!(annealing.cooling_rate > 0.0 && annealing.cooling_rate < 1.0)) {
		return invalid("annealing cooling rate must lie in (0, 1)");
	}
	if (annealing.max_iterations < 0) {
		return invalid("annealing iteration cap must not be negative");
	}
	if (annealing.collision_penalty < 0.0 || annealing.preferred_date_bonus < 0.0) {
		return invalid("annealing weights must not be negative");
	}
	if (greedy.expertise_bonus < 0.0 || greedy.preferred_date_bonus < 0.0 || greedy.preferred_type_bonus < 0.0) {
		return invalid("greedy bonus weights must not be negative");
	}
	if (hybrid.acceptance_ratio < 0.0 || hybrid.acceptance_ratio > 1.0) {
		return invalid("hybrid acceptance ratio must lie in [0, 1]");
	}
	if (!(metrics.utilization_slots_per_day > 0.0)) {
		return invalid("utilization slots per day must be positive");
	}
	return type::ok_t{};
}

auto scheduler_config::from_json(const nlohmann::json &j) -> scheduler_config
{
	scheduler_config c;

	if (auto it = j.find("annealing"); it != j.end()) {
		const auto &a = *it;
		c.annealing.initial_temperature = a.value("initialTemperature", c.annealing.initial_temperature);
		c.annealing.min_temperature = a.value("minTemperature", c.annealing.min_temperature);
		c.annealing.cooling_rate = a.value("coolingRate", c.annealing.cooling_rate);
		c.annealing.max_iterations = a.value("maxIterations", c.annealing.max_iterations);
		c.annealing.collision_penalty = a.value("collisionPenalty", c.annealing.collision_penalty);
		c.annealing.preferred_date_bonus = a.value("preferredDateBonus", c.annealing.preferred_date_bonus);
		c.annealing.seed = a.value("seed", c.annealing.seed);
	}

	if (auto it = j.find("greedy"); it != j.end()) {
		const auto &g = *it;
		c.greedy.expertise_bonus = g.value("expertiseBonus", c.greedy.expertise_bonus);
		c.greedy.preferred_date_bonus = g.value("preferredDateBonus", c.greedy.preferred_date_bonus);
		c.greedy.preferred_type_bonus = g.value("preferredTypeBonus", c.greedy.preferred_type_bonus);
	}

	if (auto it = j.find("hybrid"); it != j.end()) {
		const auto &h = *it;
		c.hybrid.max_requests = h.value("maxRequests", c.hybrid.max_requests);
		c.hybrid.max_hosts = h.value("maxHosts", c.hybrid.max_hosts);
		c.hybrid.acceptance_ratio = h.value("acceptanceRatio", c.hybrid.acceptance_ratio);
	}

	if (auto it = j.find("metrics"); it != j.end()) {
		c.metrics.utilization_slots_per_day = it->value("utilizationSlotsPerDay", c.metrics.utilization_slots_per_day);
	}

	c.enforce_buffer = j.value("enforceBuffer", c.enforce_buffer);

	if (auto it = j.find("logLevel"); it != j.end()) {
		const auto name = it->get<std::string>();
		auto lv = log::parse_level(name);
		if (!lv) {
			throw std::invalid_argument(std::format("unknown log level '{}'", name));
		}
		c.log_level = *lv;
	}
	c.log_file = j.value("logFile", c.log_file);

	return c;
}

auto load_config(const std::filesystem::path &path) -> std::expected<scheduler_config, type::error>
{
	if (!std::filesystem::exists(path)) {
		return std::unexpected(type::error{type::error_kind::io, std::format("config file not found: {}", path.string())});
	}

	scheduler_config config;
	try { // The try block is for nlohmann::json
		std::ifstream file(path);
		nlohmann::json j;
		file >> j;
		config = scheduler_config::from_json(j);
	} catch (const std::exception &e) {
		return std::unexpected(type::error{type::error_kind::io, std::format("cannot load config {}: {}", path.string(), e.what())});
	}

	if (auto res = config.validate(); !res) {
		return std::unexpected(res.error());
	}
	return config;
}

auto apply_logging(const scheduler_config &config) -> std::expected<type::ok_t, type::error>
{
	log::set_level(config.log_level);
	if (!log::set_file(config.log_file)) {
		return std::unexpected(type::error{type::error_kind::io, std::format("cannot open log file {}", config.log_file)});
	}
	return type::ok_t{};
}

} // namespace agenda
