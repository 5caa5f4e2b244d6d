#ifndef SMARTNUM_FORMATTER_HPP
#define SMARTNUM_FORMATTER_HPP 1

#include <cstdint>

#include "Number.hpp"
#include "MathBuilder.hpp"

//! \file

namespace smartnum{
	/**
	 * \brief Render a value as a valid input string
	 *
	 * Rationals render reduced as "num/den", or as a plain integer when the
	 * reduced denominator is 1. Integers render as their digits and decimals
	 * as their expansion to at most \p accuracy fractional digits.
	 **/
	HumanStringBuilder humanString(const CanonicalNumber &value, std::uint32_t accuracy);

	//! Same precedence as humanString, fractions render as \frac{num}{den}
	LatexBuilder latex(const CanonicalNumber &value, std::uint32_t accuracy);

	//! Decimal expansion of \p value truncated to \p accuracy digits, trailing zeros stripped
	ADecimal decimalExpansion(const CanonicalNumber &value, std::uint32_t accuracy);
}

#endif // !SMARTNUM_FORMATTER_HPP
