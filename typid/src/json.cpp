#include <typid/json.hpp>

namespace typid {
std::string detail::to_content(dj::Json const& json) {
	if (!json) { return "null"; }
	return dj::to_string(json);
}
} // namespace typid
