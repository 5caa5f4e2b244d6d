#ifndef SMARTNUM_LITERALPARSER_HPP
#define SMARTNUM_LITERALPARSER_HPP 1

#include <cstdint>
#include <string_view>

#include "Number.hpp"

//! \file

namespace smartnum{
	/**
	 * \brief Classify normalized text and build its canonical value
	 *
	 * Classifiers are tried in this order, each must match the whole text:
	 *  1. direct literal     "12", "-0.25", ".5"
	 *  2. scientific         "1.5e3", "2E-4", "1e0.5"
	 *  3. explicit fraction  "6/8", "-1.5 / 2"
	 *  4. residual sign run  "- -6" (whitespace inside a sign run)
	 *
	 * A scientific result is truncated to \p accuracy fractional digits.
	 *
	 * \throws InvalidInputError if no classifier matches
	 * \throws DivisionByZeroError for a fraction with a zero denominator
	 * \throws PrecisionOverflowError for an exponent beyond 64 bits
	 **/
	CanonicalNumber parseLiteral(std::string_view normalized, std::uint32_t accuracy);
}

#endif // !SMARTNUM_LITERALPARSER_HPP
