#include <fmt/format.h>
#include <typid/error.hpp>

namespace typid {
ParseError::ParseError(ParseFailure failure) : Error(fmt::format("invalid UUID: '{}'", failure.input)), m_failure(std::move(failure)) {}

JsonError::JsonError(std::string content) : Error(fmt::format("invalid identifier in JSON field: {}", content)), m_content(std::move(content)) {}
} // namespace typid
