#include "core/logger.hpp"

#include "core/utils.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>

namespace agenda::log {

namespace {
std::atomic<level> min_level{level::info};
std::mutex sink_mutex;
std::ofstream log_file;

auto timestamp_now() -> std::string
{
	const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
	return std::format("{:%Y-%m-%d %H:%M:%S}", now);
}
} // namespace

auto parse_level(std::string_view name) -> std::optional<level>
{
	const auto lower = util::to_lower(name);
	if (lower == "debug")
		return level::debug;
	if (lower == "info")
		return level::info;
	if (lower == "warn" || lower == "warning")
		return level::warning;
	if (lower == "error")
		return level::error;
	if (lower == "off")
		return level::off;
	return std::nullopt;
}

auto level_name(level lv) -> std::string_view
{
	switch (lv) {
	case level::debug:
		return "DEBUG";
	case level::info:
		return "INFO";
	case level::warning:
		return "WARN";
	case level::error:
		return "ERROR";
	case level::off:
		return "OFF";
	}
	return "UNKNOWN";
}

auto set_level(level lv) -> void { min_level.store(lv); }

auto current_level() -> level { return min_level.load(); }

auto set_file(const std::filesystem::path &path) -> bool
{
	std::lock_guard lock(sink_mutex);
	if (log_file.is_open()) {
		log_file.close();
	}

	if (path.empty()) {
		return true;
	}

	log_file.open(path, std::ios::out | std::ios::app);
	return log_file.is_open();
}

auto write(level lv, std::string_view msg) -> void
{
	if (lv == level::off || lv < current_level()) {
		return;
	}

	const auto line = std::format("[{}][{}] {}\n", timestamp_now(), level_name(lv), msg);

	std::lock_guard lock(sink_mutex);
	if (log_file.is_open()) {
		log_file << line;
		log_file.flush();
	}

	// stdout carries result documents, so log lines go to stderr only
	std::cerr << line;
}

} // namespace agenda::log
