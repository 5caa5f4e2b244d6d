#ifndef SMARTNUM_AINT_HPP
#define SMARTNUM_AINT_HPP 1

#include <cstdint>
#include <memory>
#include <string>

#include "RoundingMode.hpp"

namespace smartnum{
	//! Arbitrary precision integer (GMP mpz_t)
	class AInt{
		public:
			AInt(const AInt &other) noexcept;
			AInt(AInt &&other) noexcept;

			~AInt();

			explicit AInt(std::int64_t i) noexcept;
			explicit AInt(std::uint64_t ui) noexcept;
			explicit AInt(const std::string &s);

			AInt &operator=(const AInt &other) noexcept;
			AInt &operator=(AInt &&other) noexcept;

			AInt operator+(const AInt &rhs) const noexcept;
			AInt operator-(const AInt &rhs) const noexcept;
			AInt operator*(const AInt &rhs) const noexcept;
			AInt operator-() const noexcept;

			bool operator<(const AInt &rhs) const noexcept;
			bool operator>(const AInt &rhs) const noexcept;
			bool operator<=(const AInt &rhs) const noexcept;
			bool operator>=(const AInt &rhs) const noexcept;
			bool operator==(const AInt &rhs) const noexcept;
			bool operator!=(const AInt &rhs) const noexcept;

			AInt pow(unsigned long exp) const noexcept;

			//! 10^exp
			static AInt pow10(unsigned long exp) noexcept;

			AInt abs() const noexcept;

			//! -1, 0 or 1
			int sign() const noexcept;
			bool isZero() const noexcept{ return sign() == 0; }
			bool isOdd() const noexcept;

			bool divisibleBy(unsigned long d) const noexcept;
			bool divisibleBy(const AInt &d) const noexcept;

			//! Division that is known to leave no remainder
			AInt divExact(unsigned long d) const noexcept;
			AInt divExact(const AInt &d) const;

			/**
			 * \brief Integer division with an explicit rounding policy
			 * \throws DivisionByZeroError if \p d is zero
			 * \throws RoundingNecessaryError for RoundingMode::unnecessary with a remainder
			 **/
			AInt divRound(const AInt &d, RoundingMode mode) const;

			//! Greatest common divisor, always non-negative
			static AInt gcd(const AInt &a, const AInt &b) noexcept;

			bool fitsInt64() const noexcept;

			//! \throws PrecisionOverflowError if the value does not fit
			std::int64_t toInt64() const;

			std::string toString() const;

		private:
			AInt() noexcept;

			struct Impl;
			std::unique_ptr<Impl> m_impl;

			friend class ARatio;
			friend class AReal;
	};
}

#endif // !SMARTNUM_AINT_HPP
