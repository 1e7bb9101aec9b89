#include "core/config.hpp"
#include "core/logger.hpp"
#include "services/document_store.hpp"
#include "services/scheduler_service.hpp"

#include <charconv>
#include <iostream>
#include <memory>
#include <optional>
#include <string_view>

using namespace agenda;

namespace {

struct cli_options {
	std::filesystem::path request_file;
	std::optional<std::filesystem::path> output_file;
	std::optional<std::filesystem::path> config_file;
	std::optional<scheduler_algorithm> algorithm;
	std::optional<std::uint64_t> seed;
	std::optional<long long> timeout_ms;
};

auto usage(std::string_view prog) -> void
{
	std::cerr << "usage: " << prog
						<< " <request.json> [-o result.json] [-c config.json] [-a classical|quantum|hybrid] [-s seed] [-t timeout-ms]\n";
}

template <typename T>
auto parse_number(std::string_view text) -> std::optional<T>
{
	T value{};
	auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

auto parse_args(int argc, char **argv) -> std::optional<cli_options>
{
	cli_options opts;

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		const bool has_value = i + 1 < argc;

		if (arg == "-o" && has_value) {
			opts.output_file = argv[++i];
		}
		else if (arg == "-c" && has_value) {
			opts.config_file = argv[++i];
		}
		else if (arg == "-a" && has_value) {
			opts.algorithm = parse_algorithm(argv[++i]);
			if (!opts.algorithm) {
				return std::nullopt;
			}
		}
		else if (arg == "-s" && has_value) {
			opts.seed = parse_number<std::uint64_t>(argv[++i]);
			if (!opts.seed) {
				return std::nullopt;
			}
		}
		else if (arg == "-t" && has_value) {
			opts.timeout_ms = parse_number<long long>(argv[++i]);
			if (!opts.timeout_ms) {
				return std::nullopt;
			}
		}
		else if (!arg.starts_with('-') && opts.request_file.empty()) {
			opts.request_file = arg;
		}
		else {
			return std::nullopt;
		}
	}

	if (opts.request_file.empty()) {
		return std::nullopt;
	}
	return opts;
}

} // namespace

int main(int argc, char **argv)
{
	auto opts = parse_args(argc, argv);
	if (!opts) {
		usage(argc > 0 ? argv[0] : "agenda-scheduler");
		return 2;
	}

	run_control control;
	if (opts->timeout_ms) {
		auto timed = run_control::with_timeout(*opts->timeout_ms);
		if (!timed) {
			std::cerr << timed.error().what() << "\n";
			usage(argv[0]);
			return 2;
		}
		control = std::move(*timed);
	}

	// Load configuration
	scheduler_config config;
	if (opts->config_file) {
		auto loaded = load_config(*opts->config_file);
		if (!loaded) {
			std::cerr << "Config error: " << loaded.error().what() << "\n";
			return 1;
		}
		config = std::move(*loaded);
	}
	if (opts->seed) {
		config.annealing.seed = *opts->seed;
	}

	if (auto res = apply_logging(config); !res) {
		std::cerr << "Logging setup warning: " << res.error().what() << "\n";
	}

	// Initialize services
	auto store = std::make_shared<document_store>();
	auto scheduler = std::make_shared<scheduler_service>(config);

	auto request = store->load_request(opts->request_file);
	if (!request) {
		log::error("Load error: {}", request.error().what());
		return 1;
	}
	if (opts->algorithm) {
		request->algorithm = *opts->algorithm;
	}

	auto result = scheduler->optimize(*request, control);
	if (!result) {
		log::error("Scheduling rejected: {}", result.error().what());
		return 1;
	}

	std::cerr << result->explanation << " [" << result->metrics.scheduled_count << "/" << result->metrics.total_requests << " scheduled, "
						<< algorithm_name(result->algorithm_used) << "]\n";

	// Write result
	if (opts->output_file) {
		if (auto res = store->save_result(*opts->output_file, *result); !res) {
			log::error("Save error: {}", res.error().what());
			return 1;
		}
	}
	else {
		std::cout << result->to_json().dump(2) << "\n";
	}

	return 0;
}
