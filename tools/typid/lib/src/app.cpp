#include <djson/json.hpp>
#include <fmt/format.h>
#include <typid/json.hpp>
#include <typid/version.hpp>
#include <typid_tool/app.hpp>
#include <cstdio>
#include <iterator>

namespace typid::tool {
bool Args::Parser::option(cli_args::Key key, cli_args::Value value) {
	switch (key.single) {
	case 'v': args.verbose = true; return true;
	case 'n': return parse_count(value);
	default: break;
	}

	if (key.full == "key") {
		if (value.empty()) {
			std::fprintf(stderr, "key must not be empty\n");
			return false;
		}
		args.key = value;
		return true;
	}
	return false;
}

bool Args::Parser::parse_count(cli_args::Value const value) {
	if (!cli_args::as(args.count, value) || args.count == 0) {
		std::fprintf(stderr, "%s", fmt::format("invalid count, must be a positive integer: {}\n", value).c_str());
		return false;
	}
	return true;
}

bool Args::Parser::arguments(std::span<char const* const> in) {
	for (auto const* arg : in) { args.inputs.emplace_back(arg); }
	return true;
}

bool App::run_new() {
	logger.info("generating {} identifier(s)", args.count);
	for (std::size_t i = 0; i < args.count; ++i) { fmt::format_to(std::back_inserter(output), "{}\n", EntityId::make()); }
	return true;
}

bool App::run_parse() {
	if (args.inputs.empty()) {
		logger.error("missing required argument: <uuid>...");
		return false;
	}
	bool ret{true};
	for (auto const input : args.inputs) {
		auto const result = EntityId::from_str(input);
		if (!result) {
			logger.error("invalid UUID: '{}'", result.failure.input);
			ret = false;
			continue;
		}
		logger.info("'{}' => {} (version {})", input, *result, result->uuid().version());
		fmt::format_to(std::back_inserter(output), "{}\n", *result);
	}
	return ret;
}

bool App::run_json() {
	auto json = dj::Json{};
	for (std::size_t i = 0; i < args.count; ++i) {
		auto& out_entry = json.push_back({});
		typid::to_json(out_entry[args.key], EntityId::make());
	}
	fmt::format_to(std::back_inserter(output), "{}\n", dj::to_string(json));
	return true;
}

bool App::run(std::span<char const* const> in) {
	auto parser = Args::Parser{};

	auto spec = cli_args::Spec{};
	spec.app_name = "typid";
	spec.options = {
		cli_args::Opt{cli_args::Key{"count", 'n'}, "N", false, "number of identifiers to generate (new, json)"},
		cli_args::Opt{cli_args::Key{"key"}, "NAME", false, "JSON key for each identifier (json)"},
		cli_args::Opt{cli_args::Key{"verbose", 'v'}, {}, true, "verbose logging"},
	};
	spec.commands = {
		"new",
		"parse",
		"json",
	};
	spec.arguments = "[uuid...]";
	spec.version = version_v;

	switch (cli_args::parse(spec, &parser, in)) {
	case cli_args::Result::eExitSuccess: return true;
	case cli_args::Result::eExitFailure: return false;
	default: break;
	}

	args = std::move(parser.args);
	if (parser.command == "parse") {
		args.command = Command::eParse;
	} else if (parser.command == "json") {
		args.command = Command::eJson;
	} else {
		args.command = Command::eNew;
	}

	if (args.command != Command::eParse && !args.inputs.empty()) {
		logger.error("unexpected argument: {}", args.inputs.front());
		return false;
	}

	logger.set_silenced(Logger::Level::eInfo, !args.verbose);

	switch (args.command) {
	case Command::eParse: return run_parse();
	case Command::eJson: return run_json();
	case Command::eNew: return run_new();
	}
	return true;
}
} // namespace typid::tool
