#include <typid/util/entropy.hpp>
#include <algorithm>
#include <cstring>

namespace typid::util {
Entropy& Entropy::thread_instance() {
	thread_local auto ret = Entropy{};
	return ret;
}

void Entropy::fill(std::span<std::uint8_t> out) {
	using word_t = std::random_device::result_type;
	while (!out.empty()) {
		auto const word = static_cast<word_t>(m_device());
		auto const count = std::min(out.size(), sizeof(word));
		std::memcpy(out.data(), &word, count);
		out = out.subspan(count);
	}
}
} // namespace typid::util
