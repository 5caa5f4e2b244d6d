#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "smartnum/SmartNumber.hpp"
#include "smartnum/Reducer.hpp"
#include "smartnum/Errors.hpp"

#include "test_support.hpp"

using namespace smartnum;

namespace smartnum_test{
	namespace{
		void testConstruction(){
			SmartNumber n("1 000");
			expectStr(n.input(), "1 000");
			assert(n.accuracy() == defaultAccuracy);
			assert(n.kind() == NumberKind::integer);
			expectStr(n.toString(), "1000");

			expectStr(SmartNumber("---6").toString(), "-6");
			expectStr(SmartNumber("- -6").toString(), "6");
			expectStr(SmartNumber("-2.500").toString(), "-2.5");
			expectStr(SmartNumber("1.5e3").toString(), "1500");

			expectThrows<InvalidInputError>([]{ SmartNumber("abc"); }, "SmartNumber(\"abc\")");
			expectThrows<InvalidInputError>([]{ SmartNumber(""); }, "SmartNumber(\"\")");
			expectThrows<DivisionByZeroError>([]{ SmartNumber("1/0"); }, "SmartNumber(\"1/0\")");

			try{
				SmartNumber("12abc");
				assert(false);
			}
			catch(const NumberError &e){
				assert(std::string(e.what()).find("12abc") != std::string::npos);
			}
		}

		void testRoundTrip(){
			for(auto text : {"42", "-17", "2.5", "-0.125", "1/3", "6/8", "-6/8", "1.5e3", "2E-4", "---6", "1 000 000"}){
				SmartNumber first(text);
				SmartNumber second(first.toString());
				expectStr(second.toString(), first.toString());
				assert(toRatio(second.value()) == toRatio(first.value()));
			}
		}

		void testFractionViews(){
			SmartNumber explicitRational("6/8");
			assert(explicitRational.isExplicitRational());
			expectStr(explicitRational.asFraction().toString(), "6/8");
			expectStr(explicitRational.asFraction(true).toString(), "3/4");
			expectFraction(explicitRational.asRational(true), "3", "4");
			expectStr(explicitRational.toString(), "3/4");
			expectStr(explicitRational.toLatex().toString(), "\\frac{3}{4}");

			SmartNumber decimal("2.5");
			assert(!decimal.isExplicitRational());
			expectStr(decimal.asFraction().toString(), "5/2");
			expectStr(decimal.asFraction(false).toString(), "25/10");

			SmartNumber integer("-7");
			expectFraction(integer.asRational(), "-7", "1");

			const auto &parts = decimal.asFraction();
			assert(parts.size() == 2);
			expectInt(parts[0], "5");
			expectInt(parts[1], "2");
			expectThrows<std::out_of_range>([&]{ (void)parts[2]; }, "FractionNumbers[2]");
		}

		void testPredicates(){
			assert(SmartNumber("1.5e3").isInteger());
			assert(SmartNumber("8/4").isInteger());
			assert(SmartNumber("2.000").isInteger());
			assert(SmartNumber("2.5").isFloat());
			assert(SmartNumber("1/3").isFloat());

			SmartNumber tiny("0.0000000000001");
			assert(!tiny.isZero());
			assert(tiny.isPositive());

			assert(SmartNumber("-0.000").isZero());
			assert(SmartNumber("0/7").isZero());
			assert(!SmartNumber("0/7").isNegative());
			assert(SmartNumber("-1/7").isNegative());
			assert(SmartNumber("1/-7").isNegative());
		}

		void testRounding(){
			SmartNumber n("-2.5");
			expectInt(n.asInteger(), "-3");
			expectInt(n.asInteger(RoundingMode::ceiling), "-2");
			expectInt(n.asInteger(RoundingMode::down), "-2");
			expectInt(n.asInteger(RoundingMode::halfUp), "-3");
			expectInt(n.asInteger(RoundingMode::halfEven), "-2");
			assert(n.asInt64(RoundingMode::up) == -3);

			assert(SmartNumber("7/2").asInt64() == 3);

			expectThrows<RoundingNecessaryError>(
				[&]{ n.asInteger(RoundingMode::unnecessary); },
				"-2.5 with RoundingMode::unnecessary"
			);

			expectThrows<PrecisionOverflowError>(
				[]{ SmartNumber("1e30").asInt64(); },
				"asInt64 of 1e30"
			);
		}

		void testAccuracy(){
			SmartNumber third(5, "1/3");
			assert(third.accuracy() == 5);
			expectStr(third.asDecimal().toString(), "0.33333");
			expectStr(third.toString(), "1/3");

			expectStr(SmartNumber(2, "3.14159").toString(), "3.14");
			expectStr(SmartNumber(3, "1e-5").toString(), "0");

			assert(SmartNumber("0.25").asFloat() == 0.25);
			assert(std::fabs(SmartNumber("1/3").asFloat() - 1.0 / 3.0) < 1e-15);
		}

		void testMemoization(){
			SmartNumber n("2.5");

			const auto before = reducerInvocations();

			const auto &first = n.asFraction();
			const auto &second = n.asFraction();
			assert(&first == &second);
			assert(&n.asRational() == &n.asRational());
			assert(reducerInvocations() == before + 1);

			assert(&n.asDecimal() == &n.asDecimal());
			assert(&n.toHumanString() == &n.toHumanString());
			assert(&n.toLatex() == &n.toLatex());

			SmartNumber copy(n);
			assert(&copy.asFraction() != &first);
			expectStr(copy.asFraction().toString(), first.toString());
			expectStr(copy.input(), n.input());

			SmartNumber moved(std::move(copy));
			expectStr(moved.toString(), "2.5");
		}

		void testConcurrentViews(){
			const SmartNumber shared("0.75");
			const auto before = reducerInvocations();

			std::vector<const FractionNumbers*> seen(8, nullptr);
			std::vector<std::thread> threads;

			for(std::size_t i = 0; i < seen.size(); i++)
				threads.emplace_back([&shared, &seen, i]{ seen[i] = &shared.asFraction(); });

			for(auto &t : threads)
				t.join();

			for(auto ptr : seen)
				assert(ptr == seen.front());

			expectStr(seen.front()->toString(), "3/4");
			assert(reducerInvocations() == before + 1);
		}

		void testLatexComposition(){
			SmartNumber half("1/2"), third("1/3"), sum("5/6");

			auto eq = half.toLatex().plus(third.toLatex()).equals(sum.toLatex());
			expectStr(eq.toString(), "\\frac{1}{2} + \\frac{1}{3} = \\frac{5}{6}");

			auto human = half.toHumanString().multipliedBy(SmartNumber("-4").toHumanString());
			expectStr(human.toString(), "1/2 * -4");

			std::ostringstream os;
			os << SmartNumber("6/8");
			expectStr(os.str(), "3/4");
		}
	}

	void runSmartNumberTests(){
		testConstruction();
		testRoundTrip();
		testFractionViews();
		testPredicates();
		testRounding();
		testAccuracy();
		testMemoization();
		testConcurrentViews();
		testLatexComposition();
	}
}
