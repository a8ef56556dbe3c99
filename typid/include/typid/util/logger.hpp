#pragma once
#include <fmt/format.h>
#include <typid/defines.hpp>
#include <bitset>
#include <cstdint>
#include <string>
#include <string_view>

namespace typid {
class Logger {
  public:
	///
	/// \brief The output pipe for logging.
	///
	enum class Pipe : std::uint8_t { eStdOut, eStdErr };
	///
	/// \brief The level of a log message.
	///
	enum class Level : std::uint8_t { eError, eWarn, eInfo, eDebug, eCOUNT_ };

	using LevelMask = std::bitset<static_cast<std::size_t>(Level::eCOUNT_)>;

	///
	/// \brief The format for a log message.
	///
	/// Available arguments: thread, level, context, message, timestamp.
	///
	inline static std::string s_format{"[T{thread}] [{level}] [{context}] {message} [{timestamp}]"};
	///
	/// \brief Whether entries are also written to stdout / stderr.
	///
	inline static bool s_console{true};

	///
	/// \brief A log message entry.
	///
	struct Entry {
		std::string formatted_message{};
		Level level{};
	};

	struct Sink;

	static constexpr char to_char(Level const level) {
		switch (level) {
		case Level::eError: return 'E';
		case Level::eWarn: return 'W';
		case Level::eInfo: return 'I';
		case Level::eDebug: return 'D';
		default: return '?';
		}
	}

	///
	/// \brief Obtain a small integer identifying the calling thread.
	///
	static int thread_id();

	///
	/// \brief Attach a sink to receive log callbacks.
	///
	/// Sink's destructor will detach itself.
	///
	static void attach(Sink& out_sink);

	///
	/// \brief Log an entry through a pipe and dispatch it to attached sinks.
	///
	static void print_to(Pipe pipe, Entry const& entry);

	///
	/// \brief Format a log message according to s_format.
	///
	static std::string format(Level level, std::string_view context, std::string_view message);

	template <typename... Args>
	static std::string format(Level level, std::string_view const context, fmt::format_string<Args...> fmt, Args const&... args) {
		return format(level, context, std::string_view{fmt::vformat(fmt, fmt::make_format_args(args...))});
	}

	Logger(std::string_view context = "typid") : context(context) {}

	template <typename... Args>
	void error(fmt::format_string<Args...> fmt, Args const&... args) const {
		log(Level::eError, fmt, args...);
	}

	template <typename... Args>
	void warn(fmt::format_string<Args...> fmt, Args const&... args) const {
		log(Level::eWarn, fmt, args...);
	}

	template <typename... Args>
	void info(fmt::format_string<Args...> fmt, Args const&... args) const {
		log(Level::eInfo, fmt, args...);
	}

	///
	/// \brief Log a debug message (compiled out unless TYPID_DEBUG is defined).
	///
	template <typename... Args>
	void debug(fmt::format_string<Args...> fmt, Args const&... args) const {
		if constexpr (debug_v) { log(Level::eDebug, fmt, args...); }
	}

	bool is_silenced(Level const level) const { return silent.test(static_cast<std::size_t>(level)); }
	void set_silenced(Level const level, bool const value) { silent.set(static_cast<std::size_t>(level), value); }

	void print(Entry const& entry) const { print_to(entry.level == Level::eError ? Pipe::eStdErr : Pipe::eStdOut, entry); }

	std::string_view context{};
	///
	/// \brief Levels that should be suppressed from being logged.
	///
	LevelMask silent{};

  private:
	template <typename... Args>
	void log(Level const level, fmt::format_string<Args...> fmt, Args const&... args) const {
		if (is_silenced(level)) { return; }
		print(Entry{format(level, context, fmt, args...), level});
	}
};

///
/// \brief Receives every entry printed after attachment.
///
/// on_log is called with the sink registry locked (re-entrantly): a sink may log, but must
/// guard against logging its own entries forever, and must not attach or destroy sinks there.
///
struct Logger::Sink {
	Sink() = default;
	Sink(Sink&&) = delete;
	Sink& operator=(Sink&&) = delete;
	Sink(Sink const&) = delete;
	Sink& operator=(Sink const&) = delete;

	virtual ~Sink();

	virtual void on_log(Entry const& entry) = 0;
};

///
/// \brief Library-wide Logger instance.
///
inline auto const g_logger{Logger{}};
} // namespace typid
