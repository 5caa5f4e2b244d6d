#ifndef SMARTNUM_TESTS_TEST_SUPPORT_HPP
#define SMARTNUM_TESTS_TEST_SUPPORT_HPP 1

#include <cassert>
#include <cstdio>
#include <string>

#include "smartnum/Number.hpp"

namespace smartnum_test{
	void expectStr(const std::string &actual, const std::string &expected);
	void expectInt(const smartnum::AInt &actual, const std::string &expected);
	void expectFraction(const smartnum::Fraction &actual, const std::string &num, const std::string &den);

	//! Reduced, positive denominator and equal in value to \p n / \p d
	void expectLowestTerms(const smartnum::Fraction &actual, const smartnum::AInt &n, const smartnum::AInt &d);

	template<typename E, typename Fn>
	void expectThrows(Fn &&fn, const char *what){
		bool thrown = false;
		try{
			fn();
		}
		catch(const E&){
			thrown = true;
		}

		if(!thrown)
			std::fprintf(stderr, "expected exception not thrown: %s\n", what);

		assert(thrown);
	}

	void runBignumTests();
	void runNormalizerTests();
	void runParserTests();
	void runReducerTests();
	void runFormatterTests();
	void runSmartNumberTests();
}

#endif // !SMARTNUM_TESTS_TEST_SUPPORT_HPP
