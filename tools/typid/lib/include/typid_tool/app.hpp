#pragma once
#include <typid/typed_id.hpp>
#include <typid/util/cli_args.hpp>
#include <typid/util/logger.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace typid::tool {
enum class Command { eNew, eParse, eJson };

struct Args {
	struct Parser;

	Command command{};
	std::size_t count{1};
	std::string key{"id"};
	std::vector<std::string_view> inputs{};
	bool verbose{};
};

struct Args::Parser : cli_args::Parser {
	Args args{};

	bool option(cli_args::Key key, cli_args::Value value) override;
	bool arguments(std::span<char const* const> in) override;

	bool parse_count(cli_args::Value value);
};

// tag for identifiers produced by this tool
struct Entity;
using EntityId = TypedId<Entity>;

///
/// \brief The typid command line application.
///
/// Results are appended to output (one line per identifier, or one JSON document);
/// diagnostics go through logger.
///
struct App {
	Args args{};
	Logger logger{"typid-cli"};
	std::string output{};

	///
	/// \brief Parse args and run the selected command.
	/// \param in Command line arguments, excluding the executable
	/// \returns false on invalid usage or if any input failed to parse
	///
	bool run(std::span<char const* const> in);

	bool run_new();
	bool run_parse();
	bool run_json();
};
} // namespace typid::tool
