#include "test_support.hpp"

using namespace smartnum;

namespace smartnum_test{
	void expectStr(const std::string &actual, const std::string &expected){
		if(actual != expected)
			std::fprintf(stderr, "string assert failed: expected \"%s\" got \"%s\"\n", expected.c_str(), actual.c_str());

		assert(actual == expected);
	}

	void expectInt(const AInt &actual, const std::string &expected){
		expectStr(actual.toString(), expected);
	}

	void expectFraction(const Fraction &actual, const std::string &num, const std::string &den){
		if(actual.numerator.toString() != num || actual.denominator.toString() != den){
			std::fprintf(
				stderr, "fraction assert failed: expected %s/%s got %s\n",
				num.c_str(), den.c_str(), actual.toString().c_str()
			);
		}

		assert(actual.numerator.toString() == num);
		assert(actual.denominator.toString() == den);
	}

	void expectLowestTerms(const Fraction &actual, const AInt &n, const AInt &d){
		assert(actual.denominator.sign() > 0);
		assert(AInt::gcd(actual.numerator, actual.denominator) == AInt(1L));
		assert(actual.toRatio() == ARatio(n, d));
	}
}
