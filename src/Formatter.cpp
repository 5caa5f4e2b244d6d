#include "smartnum/Formatter.hpp"
#include "smartnum/Reducer.hpp"
#include "smartnum/Util.hpp"

using namespace smartnum;

ADecimal smartnum::decimalExpansion(const CanonicalNumber &value, std::uint32_t accuracy){
	return std::visit(
		Overloaded{
			[](const AInt &i){ return ADecimal(i); },
			[accuracy](const ADecimal &d){
				auto bounded = d.scale() > accuracy ? d.withScale(accuracy, RoundingMode::down) : d;
				return bounded.stripTrailingZeros();
			},
			[accuracy](const Fraction &f){
				return ADecimal::fromRatio(f.toRatio(), accuracy, RoundingMode::down).stripTrailingZeros();
			}
		},
		value
	);
}

static std::string formatNumber(const CanonicalNumber &value, std::uint32_t accuracy, bool asLatex){
	if(auto fraction = std::get_if<Fraction>(&value)){
		auto reduced = exactReduce(*fraction);
		if(reduced.denominator == AInt(1L))
			return reduced.numerator.toString();

		if(!asLatex)
			return reduced.toString();

		const bool negative = reduced.numerator.sign() < 0;
		return (negative ? "-" : "")
			+ std::string("\\frac{") + reduced.numerator.abs().toString() + "}{"
			+ reduced.denominator.toString() + "}";
	}

	return decimalExpansion(value, accuracy).toString();
}

HumanStringBuilder smartnum::humanString(const CanonicalNumber &value, std::uint32_t accuracy){
	return HumanStringBuilder(formatNumber(value, accuracy, false));
}

LatexBuilder smartnum::latex(const CanonicalNumber &value, std::uint32_t accuracy){
	return LatexBuilder(formatNumber(value, accuracy, true));
}
