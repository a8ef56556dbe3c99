#include <fmt/format.h>
#include <typid/util/cli_args.hpp>
#include <algorithm>
#include <cstdio>
#include <iterator>

namespace typid {
namespace {
using cli_args::Result;

cli_args::Spec validate(cli_args::Spec spec) {
	if (spec.version.empty()) { spec.version = "(unknown)"; }
	std::erase_if(spec.options, [](cli_args::Opt const& opt) { return !opt.key.valid(); });
	spec.options.push_back(cli_args::Opt{.key = {.full = "help"}, .help = "Show this help text"});
	spec.options.push_back(cli_args::Opt{.key = {.full = "version"}, .help = "Display the version"});
	return spec;
}

std::size_t value_width(cli_args::Opt const& opt) {
	if (opt.value.empty()) { return 0; }
	return opt.value.size() + (opt.is_optional_value ? 3 : 1);
}

cli_args::Opt const* find_full(cli_args::Spec const& spec, std::string_view const full) {
	auto const it = std::ranges::find_if(spec.options, [full](cli_args::Opt const& opt) { return !opt.key.full.empty() && opt.key.full == full; });
	return it == spec.options.end() ? nullptr : &*it;
}

cli_args::Opt const* find_single(cli_args::Spec const& spec, char const single) {
	auto const it = std::ranges::find_if(spec.options, [single](cli_args::Opt const& opt) { return opt.key.single != '\0' && opt.key.single == single; });
	return it == spec.options.end() ? nullptr : &*it;
}

Result fail(std::string const& message) {
	std::fprintf(stderr, "%s\n", message.c_str());
	return Result::eExitFailure;
}

struct OptionParser {
	cli_args::Spec const& spec;
	cli_args::Parser* out;

	Result dispatch(cli_args::Opt const& opt, cli_args::Value const value) const {
		if (opt.key.full == "help") {
			std::printf("%s", cli_args::help_text(spec).c_str());
			return Result::eExitSuccess;
		}
		if (opt.key.full == "version") {
			std::printf("%s", fmt::format("{} version {}\n", spec.app_name, spec.version).c_str());
			return Result::eExitSuccess;
		}
		if (opt.value.empty() && !value.empty()) { return fail(fmt::format("option does not take a value: {}", display(opt))); }
		if (!opt.value.empty() && !opt.is_optional_value && value.empty()) { return fail(fmt::format("missing required value for option: {}", display(opt))); }
		if (!out || !out->option(opt.key, value)) { return Result::eExitFailure; }
		return Result::eContinue;
	}

	static std::string display(cli_args::Opt const& opt) {
		if (!opt.key.full.empty()) { return fmt::format("--{}", opt.key.full); }
		return fmt::format("-{}", opt.key.single);
	}

	// --key or --key=value
	Result parse_full(std::string_view arg) const {
		auto value = cli_args::Value{};
		if (auto const eq = arg.find('='); eq != std::string_view::npos) {
			value = arg.substr(eq + 1);
			arg = arg.substr(0, eq);
		}
		auto const* opt = find_full(spec, arg);
		if (!opt) { return fail(fmt::format("unknown option: --{}", arg)); }
		return dispatch(*opt, value);
	}

	// -abc or -k=value
	Result parse_singles(std::string_view arg) const {
		while (!arg.empty()) {
			auto const single = arg.front();
			arg.remove_prefix(1);
			auto const* opt = find_single(spec, single);
			if (!opt) { return fail(fmt::format("unknown option: -{}", single)); }
			auto value = cli_args::Value{};
			if (arg.starts_with('=')) {
				value = arg.substr(1);
				arg = {};
			}
			if (auto const result = dispatch(*opt, value); result != Result::eContinue) { return result; }
		}
		return Result::eContinue;
	}

	Result operator()(std::string_view const arg) const {
		if (arg.starts_with("--")) { return parse_full(arg.substr(2)); }
		return parse_singles(arg.substr(1));
	}
};

constexpr bool is_option(std::string_view const arg) { return arg.size() > 1 && arg.front() == '-'; }
} // namespace

std::string cli_args::help_text(Spec const& spec) {
	auto ret = fmt::format("Usage: {}", spec.app_name);
	auto out = std::back_inserter(ret);
	if (!spec.commands.empty()) { fmt::format_to(out, " <COMMAND>"); }
	fmt::format_to(out, " [OPTION]...");
	if (!spec.arguments.empty()) { fmt::format_to(out, " {}", spec.arguments); }
	fmt::format_to(out, "\n\n");

	auto max_width = std::size_t{};
	for (auto const& opt : spec.options) { max_width = std::max(max_width, opt.key.full.size() + value_width(opt)); }

	for (auto const& opt : spec.options) {
		if (!opt.key.valid()) { continue; }
		if (opt.key.single != '\0') {
			fmt::format_to(out, "  -{}{}", opt.key.single, opt.key.full.empty() ? ' ' : ',');
		} else {
			fmt::format_to(out, "    ");
		}
		auto lhs = opt.key.full.empty() ? std::string{"  "} : fmt::format(" --{}", opt.key.full);
		if (!opt.value.empty()) { lhs += opt.is_optional_value ? fmt::format("[={}]", opt.value) : fmt::format("={}", opt.value); }
		fmt::format_to(out, "{:<{}}    {}\n", lhs, max_width + 3, opt.help);
	}

	if (!spec.commands.empty()) {
		fmt::format_to(out, "\nCOMMANDS: ");
		for (std::size_t i = 0; i < spec.commands.size(); ++i) { fmt::format_to(out, "{}{}", (i > 0 ? " | " : ""), spec.commands[i]); }
		fmt::format_to(out, "\n");
	}
	return ret;
}

auto cli_args::parse(Spec spec, Parser* out, std::span<char const* const> args) -> Result {
	auto const valid_spec = validate(std::move(spec));
	auto const parse_option = OptionParser{.spec = valid_spec, .out = out};
	// options may appear anywhere before "--"; everything else is positional
	auto positional = std::vector<char const*>{};
	for (; !args.empty(); args = args.subspan(1)) {
		auto const arg = std::string_view{args.front()};
		if (arg == "--") {
			args = args.subspan(1);
			break;
		}
		if (is_option(arg)) {
			if (auto const result = parse_option(arg); result != Result::eContinue) { return result; }
			continue;
		}
		if (out && out->command.empty() && positional.empty() && !valid_spec.commands.empty()) {
			auto const it = std::ranges::find(valid_spec.commands, arg);
			if (it == valid_spec.commands.end()) { return fail(fmt::format("unrecognized command: {}", arg)); }
			out->command = *it;
			continue;
		}
		positional.push_back(args.front());
	}
	positional.insert(positional.end(), args.begin(), args.end());
	if (out && !out->arguments(positional)) { return Result::eExitFailure; }
	return Result::eContinue;
}
} // namespace typid
