#include <fmt/chrono.h>
#include <typid/util/logger.hpp>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace typid {
namespace {
struct GetThreadId {
	std::unordered_map<std::thread::id, int> ids{};
	int next{};
	std::mutex mutex{};

	int operator()() {
		auto lock = std::scoped_lock{mutex};
		auto const [it, _] = ids.try_emplace(std::this_thread::get_id(), next);
		if (it->second == next) { ++next; }
		return it->second;
	}
};

struct Storage {
	std::unordered_set<Logger::Sink*> sinks{};
	// recursive: sinks may log from on_log
	std::recursive_mutex mutex{};
};

GetThreadId g_get_thread_id{};
Storage g_storage{};

std::string make_timestamp() {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	return fmt::format("{:%H:%M:%S}", fmt::localtime(now));
}
} // namespace

Logger::Sink::~Sink() {
	auto lock = std::scoped_lock{g_storage.mutex};
	g_storage.sinks.erase(this);
}

int Logger::thread_id() { return g_get_thread_id(); }

void Logger::attach(Sink& out_sink) {
	auto lock = std::scoped_lock{g_storage.mutex};
	g_storage.sinks.insert(&out_sink);
}

std::string Logger::format(Level const level, std::string_view context, std::string_view const message) {
	if (context.empty()) { context = "Unknown"; }
	return fmt::format(fmt::runtime(s_format), fmt::arg("thread", thread_id()), fmt::arg("level", to_char(level)), fmt::arg("context", context),
					   fmt::arg("message", message), fmt::arg("timestamp", make_timestamp()));
}

void Logger::print_to(Pipe const pipe, Entry const& entry) {
	if (s_console) {
		auto* fd = pipe == Pipe::eStdErr ? stderr : stdout;
		std::fprintf(fd, "%s\n", entry.formatted_message.c_str());
	}
	auto lock = std::scoped_lock{g_storage.mutex};
	for (auto* sink : g_storage.sinks) { sink->on_log(entry); }
}
} // namespace typid
