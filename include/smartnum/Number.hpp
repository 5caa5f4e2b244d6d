#ifndef SMARTNUM_NUMBER_HPP
#define SMARTNUM_NUMBER_HPP 1

#include <string>
#include <variant>

#include "AInt.hpp"
#include "ARatio.hpp"
#include "ADecimal.hpp"

namespace smartnum{
	/**
	 * \brief Numerator/denominator pair, not necessarily in lowest terms
	 *
	 * The denominator is always positive, the numerator carries the sign.
	 * Unlike ARatio the pair is stored exactly as built, so "6/8" stays 6/8.
	 **/
	struct Fraction{
		AInt numerator;
		AInt denominator;

		ARatio toRatio() const{ return ARatio(numerator, denominator); }

		std::string toString() const{
			return numerator.toString() + "/" + denominator.toString();
		}
	};

	inline bool operator==(const Fraction &lhs, const Fraction &rhs) noexcept{
		return lhs.numerator == rhs.numerator && lhs.denominator == rhs.denominator;
	}

	inline bool operator!=(const Fraction &lhs, const Fraction &rhs) noexcept{
		return !(lhs == rhs);
	}

	//! Canonical form of a parsed number
	using CanonicalNumber = std::variant<AInt, ADecimal, Fraction>;

	enum class NumberKind{
		integer, decimal, rational,

		COUNT
	};

	NumberKind kindOf(const CanonicalNumber &value) noexcept;

	//! Exact value of \p value as a canonical rational
	ARatio toRatio(const CanonicalNumber &value);

	//! Store \p dec as an integer when it has no fractional digits left
	CanonicalNumber fromDecimal(const ADecimal &dec);
}

#endif // !SMARTNUM_NUMBER_HPP
