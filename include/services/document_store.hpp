#pragma once

#include "core/utils.hpp"
#include "models/schedule.hpp"
#include <nlohmann/json.hpp>

#include <filesystem>

namespace agenda {

// Reads scheduling request documents and writes result documents (JSON).
class document_store {
public:
	explicit document_store(std::filesystem::path base_dir = ".") : base_dir_{std::move(base_dir)} {}

	[[nodiscard]] static auto parse_request(const nlohmann::json &j) -> std::expected<schedule_request, type::error>;

	[[nodiscard]] auto load_request(const std::filesystem::path &file) const -> std::expected<schedule_request, type::error>;
	[[nodiscard]] auto save_result(const std::filesystem::path &file, const schedule_result &result) const -> std::expected<type::ok_t, type::error>;

private:
	std::filesystem::path base_dir_;

	[[nodiscard]] auto resolve(const std::filesystem::path &file) const -> std::filesystem::path;
};

} // namespace agenda
