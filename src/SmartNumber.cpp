#include <stdexcept>

#include "smartnum/SmartNumber.hpp"
#include "smartnum/Normalizer.hpp"
#include "smartnum/LiteralParser.hpp"
#include "smartnum/Reducer.hpp"
#include "smartnum/Formatter.hpp"
#include "smartnum/AReal.hpp"
#include "smartnum/Util.hpp"

using namespace smartnum;

const AInt &FractionNumbers::operator[](std::size_t idx) const{
	switch(idx){
		case 0: return m_numerator;
		case 1: return m_denominator;

		default:
			throw std::out_of_range("Fraction index must be 0 or 1, got " + std::to_string(idx));
	}
}

struct SmartNumber::Cache{
	Lazy<double> floatView;
	Lazy<ADecimal> decimalView;
	Lazy<FractionNumbers> fractionView, fractionSimplifiedView;
	Lazy<Fraction> rationalView, rationalSimplifiedView;
	Lazy<HumanStringBuilder> humanStringView;
	Lazy<LatexBuilder> latexView;
};

SmartNumber::SmartNumber(std::optional<std::uint32_t> accuracy_, std::string input_)
	: m_accuracy(accuracy_.value_or(defaultAccuracy))
	, m_input(std::move(input_))
	, m_value(parseLiteral(normalize(m_input), m_accuracy))
	, m_cache(std::make_unique<Cache>()){}

SmartNumber::SmartNumber(const SmartNumber &other)
	: m_accuracy(other.m_accuracy)
	, m_input(other.m_input)
	, m_value(other.m_value)
	, m_cache(std::make_unique<Cache>()){}

SmartNumber::SmartNumber(SmartNumber &&other) noexcept
	: m_accuracy(other.m_accuracy)
	, m_input(std::move(other.m_input))
	, m_value(std::move(other.m_value))
	, m_cache(std::move(other.m_cache)){}

SmartNumber::~SmartNumber(){}

bool SmartNumber::resolveSimplify(std::optional<bool> simplify) const noexcept{
	return simplify.value_or(!isExplicitRational());
}

int SmartNumber::sign() const noexcept{
	return std::visit(
		Overloaded{
			[](const AInt &i){ return i.sign(); },
			[](const ADecimal &d){ return d.sign(); },
			[](const Fraction &f){ return f.numerator.sign(); }
		},
		m_value
	);
}

AInt SmartNumber::asInteger(RoundingMode mode) const{
	return std::visit(
		Overloaded{
			[](const AInt &i){ return i; },
			[mode](const ADecimal &d){ return d.toInteger(mode); },
			[mode](const Fraction &f){ return f.numerator.divRound(f.denominator, mode); }
		},
		m_value
	);
}

std::int64_t SmartNumber::asInt64(RoundingMode mode) const{
	return asInteger(mode).toInt64();
}

const ADecimal &SmartNumber::asDecimal() const{
	return m_cache->decimalView.get([this]{ return decimalExpansion(m_value, m_accuracy); });
}

double SmartNumber::asFloat() const{
	return m_cache->floatView.get([this]{ return AReal(toRatio(m_value), 53).toDouble(); });
}

const Fraction &SmartNumber::asRational(std::optional<bool> simplify) const{
	if(resolveSimplify(simplify)){
		return m_cache->rationalSimplifiedView.get([this]{
			if(auto dec = std::get_if<ADecimal>(&m_value))
				return approximateReduce(*dec).fraction;

			return exactReduce(asRational(false));
		});
	}

	return m_cache->rationalView.get([this]{
		return std::visit(
			Overloaded{
				[](const AInt &i){ return Fraction{i, AInt(1L)}; },
				[](const ADecimal &d){ return Fraction{d.unscaled(), AInt::pow10(d.scale())}; },
				[](const Fraction &f){ return f; }
			},
			m_value
		);
	});
}

const FractionNumbers &SmartNumber::asFraction(std::optional<bool> simplify) const{
	const bool simplified = resolveSimplify(simplify);
	auto &slot = simplified ? m_cache->fractionSimplifiedView : m_cache->fractionView;
	return slot.get([this, simplified]{ return FractionNumbers(asRational(simplified)); });
}

bool SmartNumber::isInteger() const{
	return std::visit(
		Overloaded{
			[](const AInt&){ return true; },
			[](const ADecimal &d){ return d.isInteger(); },
			[](const Fraction &f){ return f.numerator.divisibleBy(f.denominator); }
		},
		m_value
	);
}

bool SmartNumber::isZero() const noexcept{
	return sign() == 0;
}

bool SmartNumber::isPositive() const noexcept{
	return sign() > 0;
}

bool SmartNumber::isNegative() const noexcept{
	return sign() < 0;
}

const HumanStringBuilder &SmartNumber::toHumanString() const{
	return m_cache->humanStringView.get([this]{ return humanString(m_value, m_accuracy); });
}

const LatexBuilder &SmartNumber::toLatex() const{
	return m_cache->latexView.get([this]{ return latex(m_value, m_accuracy); });
}
