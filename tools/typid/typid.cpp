#include <typid_tool/app.hpp>
#include <cstdio>
#include <cstdlib>

int main(int argc, char** argv) {
	typid::Logger::s_format = "[{level}] [{context}] {message}";
	auto app = typid::tool::App{};
	auto const success = app.run({argv + 1, static_cast<std::size_t>(argc - 1)});
	std::fputs(app.output.c_str(), stdout);
	if (!success) { return EXIT_FAILURE; }
}
