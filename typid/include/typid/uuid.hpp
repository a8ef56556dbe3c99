#pragma once
#include <fmt/format.h>
#include <typid/parsed.hpp>
#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace typid {
namespace util {
class Entropy;
}

///
/// \brief A 128-bit universally unique identifier.
///
/// Carries no type tag: this is the representation shared by every TypedId.
/// Ordering is lexicographic over the bytes, which has no relation to creation time.
///
class Uuid {
  public:
	using Bytes = std::array<std::uint8_t, 16>;

	///
	/// \brief Length of the canonical hyphenated text form.
	///
	static constexpr std::size_t string_length_v{36};

	///
	/// \brief Layout variant, encoded in the high bits of byte 8.
	///
	enum class Variant : std::uint8_t { eNcs, eRfc4122, eMicrosoft, eFuture };

	struct Hasher;

	///
	/// \brief Generate a random version 4 UUID from the calling thread's entropy source.
	///
	static Uuid make_v4();
	///
	/// \brief Generate a random version 4 UUID.
	/// \param entropy Source of random bytes
	///
	static Uuid make_v4(util::Entropy& entropy);

	///
	/// \brief Wrap 16 bytes verbatim (no version / variant fix-up).
	///
	static constexpr Uuid from_bytes(Bytes const& bytes) { return Uuid{bytes}; }
	static constexpr Uuid nil() { return Uuid{}; }

	///
	/// \brief Parse hyphenated, simple (32 digits), braced or URN text.
	/// \returns Parsed UUID, or a failure holding text verbatim
	///
	static Parsed<Uuid> from_str(std::string_view text);
	///
	/// \brief Parse text, throwing ParseError on failure.
	///
	static Uuid parse(std::string_view text);

	constexpr Uuid() = default;

	constexpr Bytes const& bytes() const { return m_bytes; }

	constexpr bool is_nil() const {
		for (auto const byte : m_bytes) {
			if (byte != 0) { return false; }
		}
		return true;
	}

	constexpr std::uint8_t version() const { return static_cast<std::uint8_t>(m_bytes[6] >> 4); }
	constexpr Variant variant() const {
		auto const bits = m_bytes[8];
		if ((bits & 0x80) == 0x00) { return Variant::eNcs; }
		if ((bits & 0xc0) == 0x80) { return Variant::eRfc4122; }
		if ((bits & 0xe0) == 0xc0) { return Variant::eMicrosoft; }
		return Variant::eFuture;
	}

	std::size_t hash() const;

	///
	/// \brief Render as 36 lowercase hex digits and hyphens (8-4-4-4-12).
	///
	std::string to_string() const;

	auto operator<=>(Uuid const&) const = default;

  private:
	constexpr explicit Uuid(Bytes const& bytes) : m_bytes(bytes) {}

	Bytes m_bytes{};
};

static_assert(sizeof(Uuid) == sizeof(Uuid::Bytes));

struct Uuid::Hasher {
	std::size_t operator()(Uuid const& uuid) const { return uuid.hash(); }
};
} // namespace typid

template <>
struct std::hash<typid::Uuid> {
	std::size_t operator()(typid::Uuid const& uuid) const { return uuid.hash(); }
};

template <>
struct fmt::formatter<typid::Uuid> : fmt::formatter<std::string_view> {
	template <typename FormatContext>
	auto format(typid::Uuid const& uuid, FormatContext& ctx) const {
		return fmt::formatter<std::string_view>::format(uuid.to_string(), ctx);
	}
};
