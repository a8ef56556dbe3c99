#include <typid/util/entropy.hpp>
#include <typid/util/hash_combine.hpp>
#include <typid/uuid.hpp>
#include <cstring>
#include <optional>

namespace typid {
namespace {
constexpr std::string_view hex_digits_v{"0123456789abcdef"};
constexpr std::string_view urn_prefix_v{"urn:uuid:"};
// offsets of the hyphens in the canonical form
constexpr std::size_t hyphens_v[] = {8, 13, 18, 23};

constexpr std::optional<std::uint8_t> to_nibble(char const c) {
	if (c >= '0' && c <= '9') { return static_cast<std::uint8_t>(c - '0'); }
	if (c >= 'a' && c <= 'f') { return static_cast<std::uint8_t>(c - 'a' + 10); }
	if (c >= 'A' && c <= 'F') { return static_cast<std::uint8_t>(c - 'A' + 10); }
	return {};
}

constexpr bool is_hyphen_offset(std::size_t const index) {
	for (auto const offset : hyphens_v) {
		if (offset == index) { return true; }
	}
	return false;
}

struct HexReader {
	Uuid::Bytes bytes{};
	std::size_t nibbles{};

	constexpr bool push(char const c) {
		auto const nibble = to_nibble(c);
		if (!nibble || nibbles >= bytes.size() * 2) { return false; }
		auto& byte = bytes[nibbles / 2];
		byte = static_cast<std::uint8_t>((nibbles % 2 == 0) ? (*nibble << 4) : (byte | *nibble));
		++nibbles;
		return true;
	}

	constexpr bool complete() const { return nibbles == bytes.size() * 2; }
};

constexpr std::optional<Uuid::Bytes> read_simple(std::string_view const text) {
	if (text.size() != 32) { return {}; }
	auto reader = HexReader{};
	for (char const c : text) {
		if (!reader.push(c)) { return {}; }
	}
	return reader.bytes;
}

constexpr std::optional<Uuid::Bytes> read_hyphenated(std::string_view const text) {
	if (text.size() != Uuid::string_length_v) { return {}; }
	auto reader = HexReader{};
	for (std::size_t i = 0; i < text.size(); ++i) {
		if (is_hyphen_offset(i)) {
			if (text[i] != '-') { return {}; }
			continue;
		}
		if (!reader.push(text[i])) { return {}; }
	}
	if (!reader.complete()) { return {}; }
	return reader.bytes;
}

constexpr std::optional<Uuid::Bytes> read_any(std::string_view text) {
	if (text.starts_with(urn_prefix_v)) { return read_hyphenated(text.substr(urn_prefix_v.size())); }
	if (text.starts_with('{')) {
		if (!text.ends_with('}')) { return {}; }
		return read_hyphenated(text.substr(1, text.size() - 2));
	}
	if (text.size() == 32) { return read_simple(text); }
	return read_hyphenated(text);
}

std::uint64_t read_u64(Uuid::Bytes const& bytes, std::size_t const offset) {
	auto ret = std::uint64_t{};
	std::memcpy(&ret, bytes.data() + offset, sizeof(ret));
	return ret;
}
} // namespace

Uuid Uuid::make_v4() { return make_v4(util::Entropy::thread_instance()); }

Uuid Uuid::make_v4(util::Entropy& entropy) {
	auto ret = Uuid{};
	entropy.fill(ret.m_bytes);
	ret.m_bytes[6] = static_cast<std::uint8_t>((ret.m_bytes[6] & 0x0f) | 0x40);
	ret.m_bytes[8] = static_cast<std::uint8_t>((ret.m_bytes[8] & 0x3f) | 0x80);
	return ret;
}

Parsed<Uuid> Uuid::from_str(std::string_view const text) {
	auto bytes = read_any(text);
	if (!bytes) { return {.failure = {std::string{text}}}; }
	return {.value = Uuid{*bytes}};
}

Uuid Uuid::parse(std::string_view const text) {
	auto result = from_str(text);
	if (!result) { throw ParseError{std::move(result.failure)}; }
	return *result;
}

std::size_t Uuid::hash() const { return make_combined_hash(read_u64(m_bytes, 0), read_u64(m_bytes, 8)); }

std::string Uuid::to_string() const {
	auto ret = std::string{};
	ret.reserve(string_length_v);
	for (std::size_t i = 0; i < m_bytes.size(); ++i) {
		if (i == 4 || i == 6 || i == 8 || i == 10) { ret += '-'; }
		ret += hex_digits_v[m_bytes[i] >> 4];
		ret += hex_digits_v[m_bytes[i] & 0x0f];
	}
	return ret;
}
} // namespace typid
