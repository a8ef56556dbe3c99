#pragma once
#include <cstddef>
#include <functional>

namespace typid {
// boost::hash_combine
constexpr void hash_combine(std::size_t& out_seed, std::size_t const hash) { out_seed ^= hash + 0x9e3779b9 + (out_seed << 6) + (out_seed >> 2); }

template <typename... Types>
std::size_t make_combined_hash(Types const&... t) {
	auto ret = std::size_t{};
	(hash_combine(ret, std::hash<Types>{}(t)), ...);
	return ret;
}
} // namespace typid
