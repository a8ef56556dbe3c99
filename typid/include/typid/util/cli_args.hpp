#pragma once
#include <charconv>
#include <concepts>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace typid::cli_args {
///
/// \brief Result of parsing options.
///
enum class Result { eContinue, eExitFailure, eExitSuccess };

///
/// \brief Specification of an option key.
///
struct Key {
	///
	/// \brief Long form of the key (--full).
	///
	std::string_view full{};
	///
	/// \brief Short / character form of the key (-s).
	///
	char single{};

	constexpr bool valid() const { return !full.empty() || single != '\0'; }
};

using Value = std::string_view;

///
/// \brief Specification for an option consumed by a custom parser.
///
struct Opt {
	Key key{};
	///
	/// \brief Name of the value (printed in help); empty if the option is a flag.
	///
	Value value{};
	bool is_optional_value{};
	std::string_view help{};
};

///
/// \brief Interface for custom parser.
///
struct Parser {
	///
	/// \brief Selected command, if any (set by parse()).
	///
	std::string_view command{};

	virtual ~Parser() = default;

	///
	/// \brief Callback for a parsed option.
	/// \returns false to abort parsing
	///
	virtual bool option(Key key, Value value) = 0;
	///
	/// \brief Callback for positional arguments (everything that is neither an option nor the command).
	///
	/// Options are recognized anywhere before a "--" terminator; args after it are passed verbatim.
	/// \returns false to abort parsing
	///
	virtual bool arguments(std::span<char const* const> args) = 0;
};

///
/// \brief Specification for application.
///
struct Spec {
	std::string_view app_name{};
	///
	/// \brief Options accepted in addition to --help and --version.
	///
	/// Invalid keys are removed from the list.
	///
	std::vector<Opt> options{};
	///
	/// \brief Valid commands, if any; the first non-option arg is then parsed as a command.
	///
	std::vector<std::string_view> commands{};
	///
	/// \brief Text to display for arguments, if any.
	///
	std::string_view arguments{};
	std::string_view version{"(unknown)"};
};

///
/// \brief Build the text printed for --help.
///
std::string help_text(Spec const& spec);

///
/// \brief Parse help, version, and custom command line args.
/// \param spec Application spec
/// \param out Custom parser (may be null if spec has no custom options)
/// \param args Command line arguments, excluding the executable
///
Result parse(Spec spec, Parser* out, std::span<char const* const> args);

///
/// \brief Convert a value to an integer.
/// \returns false if value is not entirely a valid integer
///
template <std::integral Type>
bool as(Type& out, Value const value) {
	if (value.empty()) { return false; }
	auto const* end = value.data() + value.size();
	auto const [ptr, ec] = std::from_chars(value.data(), end, out);
	return ec == std::errc{} && ptr == end;
}
} // namespace typid::cli_args
