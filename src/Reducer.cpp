#include <atomic>
#include <cmath>
#include <iostream>

#include "smartnum/Reducer.hpp"
#include "smartnum/PrimeTable.hpp"
#include "smartnum/Errors.hpp"

using namespace smartnum;

static std::atomic<std::size_t> invocationCount{0};

std::size_t smartnum::reducerInvocations() noexcept{
	return invocationCount.load();
}

//! Is \p p greater than either operand
static bool beyondOperands(std::uint64_t p, const AInt &a, const AInt &b){
	const auto pInt = static_cast<std::int64_t>(p);
	return (a.fitsInt64() && pInt > a.toInt64()) || (b.fitsInt64() && pInt > b.toInt64());
}

static Fraction reduceExact(AInt numerator, AInt denominator){
	if(denominator.isZero())
		throw DivisionByZeroError(numerator.toString(), denominator.toString());

	if(denominator.sign() < 0){
		numerator = -numerator;
		denominator = -denominator;
	}

	if(numerator.isZero())
		return {AInt(0L), AInt(1L)};

	const bool negative = numerator.sign() < 0;
	const AInt one(1L);

	auto a = numerator.abs();
	auto b = std::move(denominator);

	auto finished = [&]{ return a == one || b == one; };

	auto divideOut = [&](unsigned long p){
		while(a.divisibleBy(p) && b.divisibleBy(p)){
			a = a.divExact(p);
			b = b.divExact(p);
		}
	};

	bool exhausted = true;

	for(auto p : primeTable()){
		if(finished() || beyondOperands(p, a, b)){
			exhausted = false;
			break;
		}

		divideOut(p);
	}

	if(exhausted){
		auto p = std::uint64_t(primeTable().back()) + 2;
		for(; p <= trialDivisionLimit; p += 2){
			if(finished() || beyondOperands(p, a, b)){
				exhausted = false;
				break;
			}

			divideOut(static_cast<unsigned long>(p));
		}
	}

	// common factors above the trial bound
	if(exhausted && !finished()){
		auto g = AInt::gcd(a, b);
		if(g != one){
			a = a.divExact(g);
			b = b.divExact(g);
		}
	}

	return {negative ? -a : a, std::move(b)};
}

Fraction smartnum::exactReduce(const AInt &numerator, const AInt &denominator){
	++invocationCount;
	return reduceExact(numerator, denominator);
}

Approximation smartnum::approximateReduce(const ADecimal &decimal, double tolerance, std::size_t maxIterations) noexcept{
	++invocationCount;

	if(decimal.isZero())
		return {{AInt(0L), AInt(1L)}, true, 0};

	// unscaled/10^scale directly, the loop would crawl near the tolerance floor
	const auto x = decimal.abs().toRatio();
	if(x < ARatio(1L, 1000L))
		return {reduceExact(decimal.unscaled(), AInt::pow10(decimal.scale())), true, 0};

	if(!(tolerance >= 0.0))
		tolerance = 0.0;
	else if(std::isinf(tolerance))
		tolerance = 1.0;

	const ARatio tol(tolerance);
	const auto bound = x * tol;

	AInt h(1L), hPrev(0L);
	AInt k(0L), kPrev(1L);
	auto b = x;

	auto withinTolerance = [&]{ return (x - ARatio(h, k)).abs() <= bound; };

	std::size_t iterations = 0;
	while(iterations < maxIterations){
		++iterations;

		auto a = b.floor();

		auto hNext = a * h + hPrev;
		hPrev = std::move(h);
		h = std::move(hNext);

		auto kNext = a * k + kPrev;
		kPrev = std::move(k);
		k = std::move(kNext);

		if(withinTolerance())
			break;

		auto frac = b - ARatio(a);
		if(frac.isZero() || frac <= tol)
			break;

		b = frac.inverse();
	}

	// maxIterations == 0 leaves the 1/0 seed
	if(k.isZero()){
		h = x.floor();
		k = AInt(1L);
	}

	const bool converged = withinTolerance();
	if(!converged){
		std::cerr << "smartnum: approximateReduce(" << decimal.toString() << ") stopped after "
				  << iterations << " iterations at " << h.toString() << '/' << k.toString()
				  << " without reaching tolerance " << tolerance << '\n';
	}

	if(decimal.sign() < 0)
		h = -h;

	return {{std::move(h), std::move(k)}, converged, iterations};
}
