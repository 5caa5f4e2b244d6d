#ifndef SMARTNUM_PRIMETABLE_HPP
#define SMARTNUM_PRIMETABLE_HPP 1

#include <cstdint>
#include <vector>

namespace smartnum{
	//! Every prime below this bound is in the table
	constexpr std::uint32_t primeTableLimit = 65536;

	/**
	 * \brief Ascending list of all primes below primeTableLimit
	 *
	 * Built by a sieve on first use and immutable afterwards. Safe to call
	 * concurrently, including the first call.
	 **/
	const std::vector<std::uint32_t> &primeTable();
}

#endif // !SMARTNUM_PRIMETABLE_HPP
