#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <variant>

namespace agenda {

namespace type {
// Strong type aliases
using date = std::chrono::year_month_day;
using ok_t = std::monostate;

enum class error_kind { invalid_constraints, invalid_input, solver_failure, io };

// Error handling
struct error {
	error_kind kind{error_kind::solver_failure};
	std::string message;

	constexpr error(std::string_view sv) : message(sv) {}
	constexpr error(error_kind k, std::string_view sv) : kind(k), message(sv) {}

	constexpr error() = default;
	constexpr error(const error &) = default;
	constexpr error(error &&) noexcept = default;
	constexpr error &operator=(const error &) = default;
	constexpr error &operator=(error &&) noexcept = default;

	// explicit object parameter
	[[nodiscard]] auto what(this const auto &self) -> std::string_view { return self.message; }
};

template <typename T>
using result = std::expected<T, error>;
} // namespace type

namespace util {
[[nodiscard]] inline auto to_lower(std::string_view sv) -> std::string
{
	std::string out(sv);
	std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return out;
}

// Case-insensitive "either contains the other".
[[nodiscard]] inline auto mutual_contains_ci(std::string_view a, std::string_view b) -> bool
{
	if (a.empty() || b.empty()) {
		return false;
	}

	const auto la = to_lower(a);
	const auto lb = to_lower(b);
	return la.find(lb) != std::string::npos || lb.find(la) != std::string::npos;
}

} // namespace util

} // namespace agenda
