#include <string>

#include "smartnum/Reducer.hpp"
#include "smartnum/PrimeTable.hpp"
#include "smartnum/ADecimal.hpp"
#include "smartnum/Errors.hpp"

#include "test_support.hpp"

using namespace smartnum;

namespace smartnum_test{
	namespace{
		void testPrimeTable(){
			const auto &primes = primeTable();

			assert(primes.front() == 2);
			assert(primes.size() == 6542);
			assert(primes.back() == 65521);

			for(std::size_t i = 1; i < primes.size(); i++)
				assert(primes[i - 1] < primes[i]);

			// built once
			assert(&primeTable() == &primes);
		}

		void testExactReduce(){
			expectFraction(exactReduce(AInt(6L), AInt(8L)), "3", "4");
			expectFraction(exactReduce(AInt(-6L), AInt(8L)), "-3", "4");
			expectFraction(exactReduce(AInt(6L), AInt(-8L)), "-3", "4");
			expectFraction(exactReduce(AInt(-6L), AInt(-8L)), "3", "4");
			expectFraction(exactReduce(AInt(0L), AInt(5L)), "0", "1");
			expectFraction(exactReduce(AInt(0L), AInt(-5L)), "0", "1");
			expectFraction(exactReduce(AInt(12L), AInt(4L)), "3", "1");
			expectFraction(exactReduce(AInt(7L), AInt(13L)), "7", "13");

			auto once = exactReduce(AInt(360L), AInt(84L));
			expectFraction(once, "30", "7");
			assert(exactReduce(once) == once);

			expectThrows<DivisionByZeroError>(
				[]{ exactReduce(AInt(3L), AInt(0L)); },
				"exactReduce(3, 0)"
			);
		}

		void testLargeCommonFactors(){
			// common prime above the trial bound
			const AInt big(1000003L);
			expectFraction(exactReduce(big * AInt(6L), big * AInt(5L)), "6", "5");

			// first prime past the table
			const AInt justPast(65537L);
			expectFraction(exactReduce(justPast * AInt(4L), justPast * AInt(9L)), "4", "9");

			const AInt mersenne("2305843009213693951");
			expectFraction(exactReduce(mersenne * AInt(3L), mersenne * AInt(7L)), "3", "7");

			const auto huge = AInt(2L).pow(200UL) * AInt(3L).pow(50UL);
			expectFraction(exactReduce(huge * AInt(5L), huge * AInt(11L)), "5", "11");
		}

		void testLowestTermsGrid(){
			for(long n = -30; n <= 30; n++){
				for(long d = -30; d <= 30; d++){
					if(d == 0)
						continue;

					expectLowestTerms(exactReduce(AInt(n), AInt(d)), AInt(n), AInt(d));
				}
			}
		}

		void testApproximateReduce(){
			auto expectApprox = [](const char *dec, const char *num, const char *den){
				auto result = approximateReduce(ADecimal(dec));
				assert(result.converged);
				expectFraction(result.fraction, num, den);
			};

			expectApprox("2.5", "5", "2");
			expectApprox("0.75", "3", "4");
			expectApprox("-0.125", "-1", "8");
			expectApprox("0", "0", "1");
			expectApprox("7", "7", "1");
			expectApprox("0.0005", "1", "2000");
			expectApprox("-0.00025", "-1", "4000");
			expectApprox("0.333333333333", "1", "3");

			const ADecimal pi("3.14159265358979");
			auto piApprox = approximateReduce(pi);
			assert(piApprox.converged);
			assert(piApprox.fraction.denominator.sign() > 0);

			const auto x = pi.toRatio();
			assert((x - piApprox.fraction.toRatio()).abs() <= x * ARatio(defaultTolerance));
		}

		void testIterationCap(){
			auto capped = approximateReduce(ADecimal("3.14159265358979"), 0.0, 2);
			assert(!capped.converged);
			assert(capped.iterations == 2);
			expectFraction(capped.fraction, "22", "7");

			auto none = approximateReduce(ADecimal("2.75"), defaultTolerance, 0);
			assert(!none.converged);
			expectFraction(none.fraction, "2", "1");
		}

		void testInvocationCounter(){
			const auto before = reducerInvocations();

			exactReduce(AInt(2L), AInt(4L));
			approximateReduce(ADecimal("0.5"));

			assert(reducerInvocations() == before + 2);
		}
	}

	void runReducerTests(){
		testPrimeTable();
		testExactReduce();
		testLargeCommonFactors();
		testLowestTermsGrid();
		testApproximateReduce();
		testIterationCap();
		testInvocationCounter();
	}
}
