#include "services/document_store.hpp"

#include <format>
#include <fstream>

namespace agenda {

auto document_store::resolve(const std::filesystem::path &file) const -> std::filesystem::path { return file.is_absolute() ? file : base_dir_ / file; }

auto document_store::parse_request(const nlohmann::json &j) -> std::expected<schedule_request, type::error>
{
	if (!j.is_object()) {
		return std::unexpected(type::error{type::error_kind::invalid_input, "scheduling request must be a JSON object"});
	}

	schedule_request request;

	try { // The try block is for nlohmann::json
		request.constraints = scheduling_constraints::from_json(j.at("constraints"));
	} catch (const std::exception &e) {
		return std::unexpected(type::error{type::error_kind::invalid_constraints, std::format("invalid constraints: {}", e.what())});
	}

	try {
		for (const auto &item : j.value("requests", nlohmann::json::array())) {
			request.requests.push_back(meeting_request::from_json(item));
		}
		for (const auto &item : j.value("hosts", nlohmann::json::array())) {
			request.hosts.push_back(host::from_json(item));
		}

		if (auto it = j.find("algorithm"); it != j.end() && !it->is_null()) {
			const auto name = it->get<std::string>();
			auto algo = parse_algorithm(name);
			if (!algo) {
				return std::unexpected(type::error{type::error_kind::invalid_input, std::format("unknown algorithm '{}'", name)});
			}
			request.algorithm = *algo;
		}
	} catch (const std::exception &e) {
		return std::unexpected(type::error{type::error_kind::invalid_input, std::format("invalid scheduling request: {}", e.what())});
	}

	return request;
}

auto document_store::load_request(const std::filesystem::path &file) const -> std::expected<schedule_request, type::error>
{
	const auto path = resolve(file);
	if (!std::filesystem::exists(path)) {
		return std::unexpected(type::error{type::error_kind::io, std::format("request file not found: {}", path.string())});
	}

	nlohmann::json j;
	try { // The try block is for nlohmann::json
		std::ifstream in(path);
		in >> j;
	} catch (const std::exception &e) {
		return std::unexpected(type::error{type::error_kind::io, std::format("cannot parse {}: {}", path.string(), e.what())});
	}

	return parse_request(j);
}

auto document_store::save_result(const std::filesystem::path &file, const schedule_result &result) const -> std::expected<type::ok_t, type::error>
{
	const auto path = resolve(file);

	try { // The try block is for nlohmann::json
		std::ofstream out(path);
		if (!out) {
			return std::unexpected(type::error{type::error_kind::io, std::format("cannot open {} for writing", path.string())});
		}
		out << result.to_json().dump(2) << '\n';
		return type::ok_t{};
	} catch (const std::exception &e) {
		return std::unexpected(type::error{type::error_kind::io, std::format("cannot save result to {}: {}", path.string(), e.what())});
	}
}

} // namespace agenda
