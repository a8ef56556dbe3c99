#pragma once

namespace typid {
constexpr bool debug_v =
#if defined(TYPID_DEBUG)
	true;
#else
	false;
#endif
} // namespace typid
