#ifndef SMARTNUM_ADECIMAL_HPP
#define SMARTNUM_ADECIMAL_HPP 1

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "AInt.hpp"
#include "ARatio.hpp"

namespace smartnum{
	//! Most integral digits a decimal shift may produce before PrecisionOverflowError
	constexpr std::uint64_t maxDecimalDigits = 1000000;

	/**
	 * \brief Arbitrary precision decimal
	 *
	 * Value is unscaled * 10^-scale. The scale is kept as given, so
	 * "2.500" and "2.5" are equal but print differently until
	 * stripTrailingZeros is applied.
	 **/
	class ADecimal{
		public:
			ADecimal(AInt unscaled_, std::uint32_t scale_) noexcept
				: m_unscaled(std::move(unscaled_)), m_scale(scale_){}

			explicit ADecimal(const AInt &i) noexcept: ADecimal(i, 0){}

			//! \throws std::runtime_error if \p s is not a decimal literal
			explicit ADecimal(const std::string &s);

			/**
			 * \brief Parse a plain decimal literal
			 *
			 * Accepts an optional '-', digits and at most one decimal point,
			 * with at least one digit anywhere ("5", "-5.", ".5", "-0.25").
			 * A leading '+' is only accepted with \p allowPlusSign.
			 **/
			static std::optional<ADecimal> tryParse(std::string_view s, bool allowPlusSign = false);

			//! Expansion of \p q to exactly \p scale fractional digits
			static ADecimal fromRatio(const ARatio &q, std::uint32_t scale, RoundingMode mode);

			const AInt &unscaled() const noexcept{ return m_unscaled; }
			std::uint32_t scale() const noexcept{ return m_scale; }

			int sign() const noexcept{ return m_unscaled.sign(); }
			bool isZero() const noexcept{ return m_unscaled.isZero(); }
			bool isInteger() const noexcept;

			ADecimal abs() const noexcept{ return {m_unscaled.abs(), m_scale}; }
			ADecimal operator-() const noexcept{ return {-m_unscaled, m_scale}; }

			/**
			 * \brief Multiply by 10^exp by moving the decimal point
			 * \throws PrecisionOverflowError if the scale would overflow or more
			 * than maxDecimalDigits zeros would be appended
			 **/
			ADecimal shifted(std::int64_t exp) const;

			ADecimal withScale(std::uint32_t newScale, RoundingMode mode) const;
			ADecimal stripTrailingZeros() const;

			//! Integer part with an explicit rounding policy
			AInt toInteger(RoundingMode mode) const;

			ARatio toRatio() const;

			bool operator==(const ADecimal &rhs) const;
			bool operator!=(const ADecimal &rhs) const{ return !(*this == rhs); }

			std::string toString() const;

		private:
			AInt m_unscaled;
			std::uint32_t m_scale;
	};
}

#endif // !SMARTNUM_ADECIMAL_HPP
