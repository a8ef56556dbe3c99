#pragma once
#include <typid/error.hpp>
#include <concepts>
#include <optional>
#include <string_view>

namespace typid {
///
/// \brief Result of a non-throwing parse: either a value or the failure.
///
template <typename Type>
struct Parsed {
	std::optional<Type> value{};
	ParseFailure failure{};

	bool has_value() const { return value.has_value(); }
	explicit operator bool() const { return has_value(); }

	Type const& operator*() const { return *value; }
	Type const* operator->() const { return &*value; }
};

///
/// \brief Identifier types that parse themselves from text and render back to it.
///
template <typename Type>
concept IdentifierT = requires(Type const& id, std::string_view text) {
	{ Type::from_str(text) } -> std::same_as<Parsed<Type>>;
	{ id.to_string() } -> std::same_as<std::string>;
};
} // namespace typid
