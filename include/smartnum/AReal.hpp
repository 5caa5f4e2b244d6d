#ifndef SMARTNUM_AREAL_HPP
#define SMARTNUM_AREAL_HPP 1

#include <cstdint>
#include <memory>
#include <string>

#include "fwd.hpp"
#include "AInt.hpp"
#include "ARatio.hpp"

namespace smartnum{
	/**
	 * \brief Arbitrary precision binary floating point (MPFR mpfr_t)
	 *
	 * Every value carries its own precision in bits. Binary operations
	 * produce a result at the larger precision of the two operands.
	 **/
	class AReal{
		public:
			AReal(const AReal &other) noexcept;
			AReal(AReal &&other) noexcept;

			~AReal();

			AReal(const AInt &i, std::size_t precisionBits) noexcept;
			AReal(const ARatio &q, std::size_t precisionBits) noexcept;

			AReal operator*(const AReal &rhs) const noexcept;

			AReal pow(const AReal &exp) const noexcept;

			std::size_t precision() const noexcept;

			double toDouble() const noexcept;

			//! Truncates towards zero to \p scale fractional digits
			ADecimal toDecimal(std::uint32_t scale) const;

			//! Number of bits needed to carry \p digits decimal digits
			static std::size_t bitsForDigits(std::size_t digits) noexcept;

		private:
			AReal() noexcept;

			struct Impl;
			std::unique_ptr<Impl> m_impl;
	};
}

#endif // !SMARTNUM_AREAL_HPP
