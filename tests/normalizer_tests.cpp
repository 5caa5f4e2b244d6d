#include <string>

#include "smartnum/Normalizer.hpp"

#include "test_support.hpp"

using namespace smartnum;

namespace smartnum_test{
	namespace{
		void testDigitSeparators(){
			expectStr(normalize("1 000"), "1000");
			expectStr(normalize("1 000 000"), "1000000");
			expectStr(normalize("12 \t 34"), "1234");
			expectStr(normalize("1\xC2\xA0" "000"), "1000");          // no-break space
			expectStr(normalize("1\xE2\x80\x89" "234.5"), "1234.5");  // thin space
			expectStr(normalize("3 / 4"), "3 / 4");

			// separators not standing between two digits are left alone
			expectStr(normalize("1 . 5"), "1 . 5");
			expectStr(normalize(" 5"), " 5");
			expectStr(normalize("5 "), "5 ");

			// invalid utf-8 passes through untouched
			expectStr(normalize("1\xFF 2"), "1\xFF 2");
		}

		void testTrailingZeros(){
			expectStr(normalize("2.500"), "2.5");
			expectStr(normalize("3.000"), "3");
			expectStr(normalize("-2.500"), "-2.5");
			expectStr(normalize("0.000"), "0");
			expectStr(normalize(".000"), "0");
			expectStr(normalize("5."), "5");
			expectStr(normalize("1 000.50"), "1000.5");

			// integers keep their zeros
			expectStr(normalize("100"), "100");
			expectStr(normalize("1.5e30"), "1.5e30");
		}

		void testSignRuns(){
			expectStr(normalize("---6"), "-6");
			expectStr(normalize("--6"), "6");
			expectStr(normalize("+-6"), "-6");
			expectStr(normalize("++6"), "6");
			expectStr(normalize("----2.50"), "2.5");
			expectStr(normalize("-6"), "-6");
			expectStr(normalize("--"), "");
			expectStr(normalize("abc"), "abc");

			for(std::size_t n = 2; n < 10; n++){
				auto text = std::string(n, '-') + "6";
				expectStr(normalize(text), n % 2 ? "-6" : "6");
			}
		}

		void testCollapseLeadingSigns(){
			assert(!collapseLeadingSigns("-6"));
			assert(!collapseLeadingSigns("6--"));
			assert(!collapseLeadingSigns("- -6"));

			expectStr(*collapseLeadingSigns("- -6", true), "6");
			expectStr(*collapseLeadingSigns("- - -6", true), "-6");
			expectStr(*collapseLeadingSigns("-+-+7"), "7");
		}
	}

	void runNormalizerTests(){
		testDigitSeparators();
		testTrailingZeros();
		testSignRuns();
		testCollapseLeadingSigns();
	}
}
