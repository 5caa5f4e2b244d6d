#include "smartnum/Number.hpp"
#include "smartnum/Util.hpp"

using namespace smartnum;

NumberKind smartnum::kindOf(const CanonicalNumber &value) noexcept{
	return std::visit(
		Overloaded{
			[](const AInt&){ return NumberKind::integer; },
			[](const ADecimal&){ return NumberKind::decimal; },
			[](const Fraction&){ return NumberKind::rational; }
		},
		value
	);
}

ARatio smartnum::toRatio(const CanonicalNumber &value){
	return std::visit(
		Overloaded{
			[](const AInt &i){ return ARatio(i); },
			[](const ADecimal &d){ return d.toRatio(); },
			[](const Fraction &f){ return f.toRatio(); }
		},
		value
	);
}

CanonicalNumber smartnum::fromDecimal(const ADecimal &dec){
	auto stripped = dec.stripTrailingZeros();
	if(stripped.scale() == 0)
		return stripped.unscaled();

	return stripped;
}
