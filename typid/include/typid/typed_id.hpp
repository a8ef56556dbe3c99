#pragma once
#include <typid/uuid.hpp>

namespace typid {
///
/// \brief A UUID bound, at compile time only, to the entity type it identifies.
///
/// TypedId<Foo> and TypedId<Bar> share layout and behaviour but are distinct types:
/// neither converts to, compares with, nor constructs from the other.
/// Type is never instantiated and may be incomplete.
///
/// Typical usage:
/// \code
/// struct Foo {
/// 	TypedId<Foo> id{};
/// };
/// auto a = Foo{};
/// auto b = Foo{};
/// assert(a.id != b.id);
/// \endcode
///
template <typename Type>
class TypedId {
  public:
	using tag_type = Type;
	using Bytes = Uuid::Bytes;

	struct Hasher {
		std::size_t operator()(TypedId const& id) const { return id.hash(); }
	};

	///
	/// \brief Generate a new random (version 4) identifier.
	///
	static TypedId make() { return TypedId{Uuid::make_v4()}; }
	///
	/// \brief Wrap 16 bytes verbatim.
	///
	static constexpr TypedId from_bytes(Bytes const& bytes) { return TypedId{Uuid::from_bytes(bytes)}; }

	///
	/// \brief Parse text into an identifier for Type.
	/// \returns Parsed identifier, or a failure holding text verbatim
	///
	static Parsed<TypedId> from_str(std::string_view const text) {
		auto result = Uuid::from_str(text);
		if (!result) { return {.failure = std::move(result.failure)}; }
		return {.value = TypedId{*result}};
	}

	///
	/// \brief Parse text, throwing ParseError on failure.
	///
	static TypedId parse(std::string_view const text) { return TypedId{Uuid::parse(text)}; }

	///
	/// \brief Generates a new random identifier.
	///
	TypedId() : m_uuid(Uuid::make_v4()) {}

	///
	/// \brief Obtain the untagged UUID.
	///
	Uuid uuid() const { return m_uuid; }
	Bytes const& bytes() const { return m_uuid.bytes(); }

	std::size_t hash() const { return m_uuid.hash(); }
	std::string to_string() const { return m_uuid.to_string(); }

	auto operator<=>(TypedId const&) const = default;

  private:
	constexpr explicit TypedId(Uuid const& uuid) : m_uuid(uuid) {}

	Uuid m_uuid;
};
} // namespace typid

template <typename Type>
struct std::hash<typid::TypedId<Type>> {
	std::size_t operator()(typid::TypedId<Type> const& id) const { return id.hash(); }
};

template <typename Type>
struct fmt::formatter<typid::TypedId<Type>> : fmt::formatter<typid::Uuid> {
	template <typename FormatContext>
	auto format(typid::TypedId<Type> const& id, FormatContext& ctx) const {
		return fmt::formatter<typid::Uuid>::format(id.uuid(), ctx);
	}
};
