#pragma once
#include <djson/json.hpp>
#include <typid/typed_id.hpp>
#include <typid/util/logger.hpp>

namespace typid {
namespace detail {
std::string to_content(dj::Json const& json);
}

///
/// \brief Store the canonical text form as a JSON string.
///
template <IdentifierT Id>
void to_json(dj::Json& out, Id const& id) {
	out = id.to_string();
}

///
/// \brief Parse an identifier from a JSON string.
/// \returns Parsed identifier, or a failure holding the offending content (a warning is logged)
///
template <IdentifierT Id>
Parsed<Id> try_from_json(dj::Json const& json) {
	if (!json.is_string()) {
		auto content = detail::to_content(json);
		g_logger.warn("expected identifier string, got: {}", content);
		return {.failure = {std::move(content)}};
	}
	auto ret = Id::from_str(json.as_string());
	if (!ret) { g_logger.warn("invalid identifier: '{}'", ret.failure.input); }
	return ret;
}

///
/// \brief Parse an identifier from a JSON string, throwing JsonError on failure.
///
/// out is left untouched on failure.
///
template <IdentifierT Id>
void from_json(dj::Json const& json, Id& out) {
	if (!json.is_string()) { throw JsonError{detail::to_content(json)}; }
	auto result = Id::from_str(json.as_string());
	if (!result) { throw JsonError{fmt::format("\"{}\"", result.failure.input)}; }
	out = *result;
}

///
/// \brief Deserialize field key of json, throwing JsonError on failure.
///
template <IdentifierT Id>
Id from_json_field(dj::Json const& json, std::string_view const key) {
	auto const& field = json[key];
	if (!field.is_string()) { throw JsonError{fmt::format("{}: {}", key, detail::to_content(field))}; }
	auto result = Id::from_str(field.as_string());
	if (!result) { throw JsonError{fmt::format("{}: \"{}\"", key, result.failure.input)}; }
	return *result;
}
} // namespace typid
