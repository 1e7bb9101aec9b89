#include "core/constants.hpp"
#include "models/time_slot.hpp"

#include <charconv>
#include <format>

namespace agenda {

namespace {
auto parse_fixed(std::string_view text, std::size_t pos, std::size_t len, int &out) -> bool
{
	const auto *first = text.data() + pos;
	const auto *last = first + len;
	auto [ptr, ec] = std::from_chars(first, last, out);
	return ec == std::errc{} && ptr == last;
}
} // namespace

auto parse_date(std::string_view text) -> type::result<type::date>
{
	int y = 0;
	int m = 0;
	int d = 0;
	if (text.size() != 10 || text[4] != '-' || text[7] != '-' || !parse_fixed(text, 0, 4, y) || !parse_fixed(text, 5, 2, m) ||
			!parse_fixed(text, 8, 2, d)) {
		return std::unexpected(type::error{type::error_kind::invalid_input, std::format("invalid date format (YYYY-MM-DD): '{}'", text)});
	}

	const type::date ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)}, std::chrono::day{static_cast<unsigned>(d)}};
	if (!ymd.ok()) {
		return std::unexpected(type::error{type::error_kind::invalid_input, std::format("invalid calendar date: '{}'", text)});
	}
	return ymd;
}

auto format_date(type::date d) -> std::string
{
	return std::format("{:04}-{:02}-{:02}", static_cast<int>(d.year()), static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day()));
}

auto parse_clock(std::string_view text) -> type::result<int>
{
	int h = 0;
	int m = 0;
	if (text.size() != 5 || text[2] != ':' || !parse_fixed(text, 0, 2, h) || !parse_fixed(text, 3, 2, m)) {
		return std::unexpected(type::error{type::error_kind::invalid_input, std::format("invalid time format (HH:MM): '{}'", text)});
	}

	const int total = h * 60 + m;
	if (h < 0 || m < 0 || m > 59 || total > constants::limits::minutes_per_day) {
		return std::unexpected(type::error{type::error_kind::invalid_input, std::format("time out of range: '{}'", text)});
	}
	return total;
}

auto format_clock(int minutes) -> std::string { return std::format("{:02}:{:02}", minutes / 60, minutes % 60); }

auto describe(const time_slot &slot) -> std::string
{
	return std::format("{} {}-{}", format_date(slot.date), format_clock(slot.start), format_clock(slot.end));
}

} // namespace agenda
