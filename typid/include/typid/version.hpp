#pragma once
#include <string_view>

namespace typid {
///
/// \brief Library version, reported by the typid tool's --version.
///
inline constexpr std::string_view version_v{"0.3.0"};
} // namespace typid
