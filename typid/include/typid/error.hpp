#pragma once
#include <stdexcept>
#include <string>

namespace typid {
///
/// \brief Base typid exception.
///
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

///
/// \brief Text that is not a valid UUID representation.
///
struct ParseFailure {
	///
	/// \brief The rejected input, verbatim.
	///
	std::string input{};
};

///
/// \brief Thrown by the throwing parse entry points.
///
class ParseError : public Error {
  public:
	explicit ParseError(ParseFailure failure);

	std::string const& input() const { return m_failure.input; }
	ParseFailure const& failure() const { return m_failure; }

  private:
	ParseFailure m_failure{};
};

///
/// \brief Thrown when a JSON field does not hold a valid identifier.
///
class JsonError : public Error {
  public:
	explicit JsonError(std::string content);

	///
	/// \brief Serialized form of the offending JSON value.
	///
	std::string const& content() const { return m_content; }

  private:
	std::string m_content{};
};
} // namespace typid
