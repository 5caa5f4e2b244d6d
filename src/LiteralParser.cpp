#include <algorithm>
#include <optional>

#include "smartnum/LiteralParser.hpp"
#include "smartnum/Normalizer.hpp"
#include "smartnum/AReal.hpp"
#include "smartnum/Errors.hpp"

using namespace smartnum;

using ClassifyResult = std::optional<CanonicalNumber>;
using ClassifyFn = ClassifyResult(*)(std::string_view, std::uint32_t);

static bool isSpace(char c) noexcept{
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

static std::string_view trimRight(std::string_view s) noexcept{
	while(!s.empty() && isSpace(s.back()))
		s.remove_suffix(1);
	return s;
}

static std::string_view trimLeft(std::string_view s) noexcept{
	while(!s.empty() && isSpace(s.front()))
		s.remove_prefix(1);
	return s;
}

static ClassifyResult classifyDirect(std::string_view text, std::uint32_t){
	auto dec = ADecimal::tryParse(text);
	if(!dec)
		return std::nullopt;

	return fromDecimal(*dec);
}

static CanonicalNumber scaleByIntegralPower(const ADecimal &mantissa, const AInt &exp, std::uint32_t accuracy){
	if(!exp.fitsInt64())
		throw PrecisionOverflowError("Exponent " + exp.toString() + " is out of range");

	const auto e = exp.toInt64();
	const auto digits = std::uint64_t(mantissa.unscaled().abs().toString().size());

	if(e < 0){
		// every digit lands beyond the retained scale, truncation leaves zero
		const auto totalScale = std::uint64_t(mantissa.scale()) + (std::uint64_t(-(e + 1)) + 1);
		if(totalScale > std::uint64_t(accuracy) + digits)
			return AInt(0L);

		if(std::min(totalScale, std::uint64_t(accuracy)) > maxDecimalDigits)
			throw PrecisionOverflowError("Scale of 10^" + exp.toString() + " exceeds " + std::to_string(maxDecimalDigits) + " digits");
	}
	else if(digits + std::uint64_t(e) > maxDecimalDigits + mantissa.scale()){
		throw PrecisionOverflowError("Magnitude of 10^" + exp.toString() + " exceeds " + std::to_string(maxDecimalDigits) + " digits");
	}

	auto shifted = mantissa.shifted(e);
	if(shifted.scale() > accuracy)
		shifted = shifted.withScale(accuracy, RoundingMode::down);

	return fromDecimal(shifted);
}

static CanonicalNumber scaleByRealPower(const ADecimal &mantissa, const ADecimal &exp, std::uint32_t accuracy){
	auto expCeil = exp.toInteger(RoundingMode::ceiling);
	if(!expCeil.fitsInt64())
		throw PrecisionOverflowError("Exponent " + exp.toString() + " is out of range");

	const auto intDigits = std::uint64_t(mantissa.unscaled().abs().toString().size())
						 + static_cast<std::uint64_t>(std::max<std::int64_t>(expCeil.toInt64(), 0));

	if(intDigits + accuracy > maxDecimalDigits)
		throw PrecisionOverflowError("Magnitude of 10^" + exp.toString() + " exceeds " + std::to_string(maxDecimalDigits) + " digits");

	const auto precision = AReal::bitsForDigits(std::size_t(accuracy) + intDigits + 10);

	AReal ten(AInt(10L), precision);
	auto power = ten.pow(AReal(exp.toRatio(), precision));
	auto result = AReal(mantissa.toRatio(), precision) * power;

	return fromDecimal(result.toDecimal(accuracy));
}

static ClassifyResult classifyScientific(std::string_view text, std::uint32_t accuracy){
	auto ePos = text.find_first_of("eE");
	if(ePos == std::string_view::npos)
		return std::nullopt;

	auto mantissa = ADecimal::tryParse(text.substr(0, ePos), true);
	auto exp = ADecimal::tryParse(text.substr(ePos + 1), true);
	if(!mantissa || !exp)
		return std::nullopt;

	if(exp->isInteger())
		return scaleByIntegralPower(*mantissa, exp->toInteger(RoundingMode::unnecessary), accuracy);
	else
		return scaleByRealPower(*mantissa, *exp, accuracy);
}

static ClassifyResult classifyFraction(std::string_view text, std::uint32_t){
	auto slashPos = text.find('/');
	if(slashPos == std::string_view::npos)
		return std::nullopt;

	auto lhsText = trimRight(text.substr(0, slashPos));
	auto rhsText = trimLeft(text.substr(slashPos + 1));

	auto x = ADecimal::tryParse(lhsText);
	auto y = ADecimal::tryParse(rhsText);
	if(!x || !y)
		return std::nullopt;

	if(y->isZero())
		throw DivisionByZeroError(std::string(lhsText), std::string(rhsText));

	// x/y == (ux * 10^sy) / (uy * 10^sx), no decimal intermediate
	auto numerator = x->unscaled() * AInt::pow10(y->scale());
	auto denominator = y->unscaled() * AInt::pow10(x->scale());

	if(denominator.sign() < 0){
		numerator = -numerator;
		denominator = -denominator;
	}

	return Fraction{std::move(numerator), std::move(denominator)};
}

static ClassifyResult classifySignRun(std::string_view text, std::uint32_t accuracy){
	auto collapsed = collapseLeadingSigns(text, true);
	if(!collapsed)
		return std::nullopt;

	return parseLiteral(normalize(*collapsed), accuracy);
}

// Priority matters: "1e5" is not a direct literal but "1.5" must never
// reach the scientific or fraction classifiers.
static const ClassifyFn classifiers[] = {
	classifyDirect,
	classifyScientific,
	classifyFraction,
	classifySignRun
};

CanonicalNumber smartnum::parseLiteral(std::string_view normalized, std::uint32_t accuracy){
	for(auto classify : classifiers){
		if(auto res = classify(normalized, accuracy))
			return std::move(*res);
	}

	throw InvalidInputError(std::string(normalized));
}
