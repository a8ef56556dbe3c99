#include <catch2/catch.hpp>
#include <djson/json.hpp>
#include <typid_tool/app.hpp>
#include <array>
#include <sstream>
#include <string>
#include <vector>

namespace {
using typid::Logger;
using typid::tool::App;
using typid::tool::Command;
using typid::tool::EntityId;

struct Capture : Logger::Sink {
	std::vector<Logger::Entry> entries{};

	void on_log(Logger::Entry const& entry) final { entries.push_back(entry); }
};

struct QuietConsole {
	bool console{Logger::s_console};

	QuietConsole() { Logger::s_console = false; }
	~QuietConsole() { Logger::s_console = console; }
};

template <std::size_t N>
bool run(App& app, std::array<char const*, N> const& args) {
	return app.run(std::span<char const* const>{args});
}

std::vector<std::string> lines_of(std::string const& text) {
	auto ret = std::vector<std::string>{};
	auto stream = std::istringstream{text};
	for (auto line = std::string{}; std::getline(stream, line);) { ret.push_back(line); }
	return ret;
}
} // namespace

TEST_CASE("tool defaults to new") {
	auto const quiet = QuietConsole{};
	auto app = App{};
	REQUIRE(app.run({}));
	REQUIRE(app.args.command == Command::eNew);
	REQUIRE(app.args.count == 1);
	auto const lines = lines_of(app.output);
	REQUIRE(lines.size() == 1);
	auto const id = EntityId::from_str(lines.front());
	REQUIRE(id);
	REQUIRE(id->uuid().version() == 4);
}

TEST_CASE("tool new with count") {
	auto const quiet = QuietConsole{};
	auto app = App{};
	REQUIRE(run(app, std::array{"new", "-n=3"}));
	auto const lines = lines_of(app.output);
	REQUIRE(lines.size() == 3);
	REQUIRE(lines[0] != lines[1]);
	REQUIRE(lines[1] != lines[2]);
}

TEST_CASE("tool rejects bad counts") {
	auto const quiet = QuietConsole{};
	for (auto const count : {"--count=0", "--count=-1", "--count=x", "--count"}) {
		INFO(count);
		auto app = App{};
		REQUIRE_FALSE(run(app, std::array{"new", count}));
		REQUIRE(app.output.empty());
	}
}

TEST_CASE("tool rejects arguments for new and json") {
	auto const quiet = QuietConsole{};
	auto capture = Capture{};
	Logger::attach(capture);

	auto app = App{};
	REQUIRE_FALSE(run(app, std::array{"new", "extra"}));
	REQUIRE(app.output.empty());
	REQUIRE(capture.entries.size() == 1);
	REQUIRE(capture.entries.front().level == Logger::Level::eError);
	REQUIRE(capture.entries.front().formatted_message.find("extra") != std::string::npos);

	auto json = App{};
	REQUIRE_FALSE(run(json, std::array{"json", "extra"}));
	REQUIRE(json.output.empty());
}

TEST_CASE("tool parse") {
	auto const quiet = QuietConsole{};
	auto capture = Capture{};
	Logger::attach(capture);

	SECTION("canonicalizes valid input") {
		auto app = App{};
		REQUIRE(run(app, std::array{"parse", "550E8400-E29B-41D4-A716-446655440000", "{550e8400-e29b-41d4-a716-446655440000}"}));
		REQUIRE(app.args.command == Command::eParse);
		REQUIRE(app.args.inputs.size() == 2);
		REQUIRE(lines_of(app.output) == std::vector<std::string>{"550e8400-e29b-41d4-a716-446655440000", "550e8400-e29b-41d4-a716-446655440000"});
		REQUIRE(capture.entries.empty());
	}

	SECTION("reports invalid input and fails") {
		auto app = App{};
		REQUIRE_FALSE(run(app, std::array{"parse", "not-a-uuid", "550e8400-e29b-41d4-a716-446655440000"}));
		REQUIRE(lines_of(app.output) == std::vector<std::string>{"550e8400-e29b-41d4-a716-446655440000"});
		REQUIRE(capture.entries.size() == 1);
		REQUIRE(capture.entries.front().level == Logger::Level::eError);
		REQUIRE(capture.entries.front().formatted_message.find("not-a-uuid") != std::string::npos);
	}

	SECTION("options after inputs") {
		auto app = App{};
		REQUIRE(run(app, std::array{"parse", "550e8400-e29b-41d4-a716-446655440000", "-v"}));
		REQUIRE(app.args.verbose);
		REQUIRE(app.args.inputs.size() == 1);
		REQUIRE_FALSE(capture.entries.empty());
		REQUIRE(capture.entries.front().level == Logger::Level::eInfo);
	}

	SECTION("requires input") {
		auto app = App{};
		REQUIRE_FALSE(run(app, std::array{"parse"}));
		REQUIRE(app.output.empty());
	}
}

TEST_CASE("tool json") {
	auto const quiet = QuietConsole{};

	SECTION("default key") {
		auto app = App{};
		REQUIRE(run(app, std::array{"json", "-n=2"}));
		REQUIRE(app.args.key == "id");
		auto const json = dj::Json::parse(app.output);
		REQUIRE(json.is_array());
		REQUIRE(json.array_view().size() == 2);
		for (auto const& entry : json.array_view()) { REQUIRE(EntityId::from_str(entry["id"].as_string())); }
	}

	SECTION("custom key") {
		auto app = App{};
		REQUIRE(run(app, std::array{"json", "--key=entity"}));
		REQUIRE(app.args.key == "entity");
		auto const json = dj::Json::parse(app.output);
		REQUIRE(json.array_view().size() == 1);
		REQUIRE(EntityId::from_str(json[0]["entity"].as_string()));
		REQUIRE_FALSE(json[0].contains("id"));
	}

	SECTION("empty key") {
		auto app = App{};
		REQUIRE_FALSE(run(app, std::array{"json", "--key="}));
	}
}
