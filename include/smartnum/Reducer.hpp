#ifndef SMARTNUM_REDUCER_HPP
#define SMARTNUM_REDUCER_HPP 1

#include <cstddef>
#include <cstdint>

#include "Number.hpp"

//! \file

namespace smartnum{
	//! Odd trial divisors are tried up to this bound once the prime table runs out
	constexpr std::uint64_t trialDivisionLimit = std::uint64_t(1) << 18;

	constexpr double defaultTolerance = 1e-8;
	constexpr std::size_t defaultMaxIterations = 100;

	/**
	 * \brief Reduce numerator/denominator to lowest terms by trial division
	 *
	 * Common factors are divided out prime by prime from primeTable(), then
	 * by successive odd integers up to trialDivisionLimit. Operands with
	 * larger common factors left over are finished with AInt::gcd.
	 *
	 * The returned denominator is positive and gcd(|num|, den) == 1.
	 *
	 * \throws DivisionByZeroError if \p denominator is zero
	 **/
	Fraction exactReduce(const AInt &numerator, const AInt &denominator);

	inline Fraction exactReduce(const Fraction &f){
		return exactReduce(f.numerator, f.denominator);
	}

	//! Result of approximateReduce
	struct Approximation{
		Fraction fraction;

		//! false if the iteration cap was hit before the tolerance was met
		bool converged = true;

		std::size_t iterations = 0;
	};

	/**
	 * \brief Best rational approximation of a decimal by continued fractions
	 *
	 * Stops at the first convergent h/k with |x - h/k| <= |x| * tolerance.
	 * Values with three or more leading fractional zeros (|x| < 0.001) are
	 * converted exactly instead. Never throws; when \p maxIterations is
	 * reached the last convergent is returned with converged == false.
	 **/
	Approximation approximateReduce(
		const ADecimal &decimal,
		double tolerance = defaultTolerance,
		std::size_t maxIterations = defaultMaxIterations
	) noexcept;

	//! Number of reductions run by this process so far
	std::size_t reducerInvocations() noexcept;
}

#endif // !SMARTNUM_REDUCER_HPP
