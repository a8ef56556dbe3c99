#pragma once
#include <cstdint>
#include <random>
#include <span>

namespace typid::util {
///
/// \brief Source of random bytes backed by the OS entropy device.
///
/// Each thread owns its own instance (see thread_instance()), so no locking is needed.
///
class Entropy {
  public:
	///
	/// \brief Obtain the calling thread's instance.
	///
	static Entropy& thread_instance();

	///
	/// \brief Overwrite every byte of out with random data.
	///
	void fill(std::span<std::uint8_t> out);

  private:
	std::random_device m_device{};
};
} // namespace typid::util
