#pragma once

#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace agenda::log {

enum class level { debug, info, warning, error, off };

[[nodiscard]] auto parse_level(std::string_view name) -> std::optional<level>;
[[nodiscard]] auto level_name(level lv) -> std::string_view;

auto set_level(level lv) -> void;
[[nodiscard]] auto current_level() -> level;

// Also append every line to the given file; an empty path closes it.
[[nodiscard]] auto set_file(const std::filesystem::path &path) -> bool;

auto write(level lv, std::string_view msg) -> void;

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void
{
	if (current_level() <= level::debug) {
		write(level::debug, std::format(fmt, std::forward<Args>(args)...));
	}
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void
{
	if (current_level() <= level::info) {
		write(level::info, std::format(fmt, std::forward<Args>(args)...));
	}
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void
{
	if (current_level() <= level::warning) {
		write(level::warning, std::format(fmt, std::forward<Args>(args)...));
	}
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void
{
	if (current_level() <= level::error) {
		write(level::error, std::format(fmt, std::forward<Args>(args)...));
	}
}

} // namespace agenda::log
