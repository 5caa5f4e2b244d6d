#include <stdexcept>

#include "smartnum/ADecimal.hpp"
#include "smartnum/Errors.hpp"

using namespace smartnum;

static bool isDigit(char c) noexcept{ return c >= '0' && c <= '9'; }

ADecimal::ADecimal(const std::string &s): m_unscaled(0L), m_scale(0){
	auto parsed = tryParse(s);
	if(!parsed)
		throw std::runtime_error("Invalid decimal literal \"" + s + "\"");

	*this = std::move(*parsed);
}

std::optional<ADecimal> ADecimal::tryParse(std::string_view s, bool allowPlusSign){
	std::size_t idx = 0;
	bool negative = false;

	if(idx < s.size() && (s[idx] == '-' || (allowPlusSign && s[idx] == '+'))){
		negative = s[idx] == '-';
		++idx;
	}

	std::string digits;
	std::uint32_t scale = 0;
	bool seenPoint = false;

	for(; idx < s.size(); ++idx){
		const char c = s[idx];
		if(isDigit(c)){
			digits += c;
			if(seenPoint) ++scale;
		}
		else if(c == '.' && !seenPoint)
			seenPoint = true;
		else
			return std::nullopt;
	}

	if(digits.empty())
		return std::nullopt;

	AInt unscaled(digits);
	return ADecimal(negative ? -unscaled : unscaled, scale);
}

ADecimal ADecimal::fromRatio(const ARatio &q, std::uint32_t scale, RoundingMode mode){
	auto shifted = q.numerator() * AInt::pow10(scale);
	return ADecimal(shifted.divRound(q.denominator(), mode), scale);
}

bool ADecimal::isInteger() const noexcept{
	return m_scale == 0 || m_unscaled.divisibleBy(AInt::pow10(m_scale));
}

ADecimal ADecimal::shifted(std::int64_t exp) const{
	if(exp >= 0){
		const auto up = static_cast<std::uint64_t>(exp);
		if(up <= m_scale)
			return ADecimal(m_unscaled, m_scale - static_cast<std::uint32_t>(up));

		if(up - m_scale > maxDecimalDigits)
			throw PrecisionOverflowError("Decimal shift by " + std::to_string(exp) + " exceeds " + std::to_string(maxDecimalDigits) + " digits");

		return ADecimal(m_unscaled * AInt::pow10(static_cast<unsigned long>(up - m_scale)), 0);
	}

	const auto down = static_cast<std::uint64_t>(-(exp + 1)) + 1;
	if(down + m_scale > UINT32_MAX)
		throw PrecisionOverflowError("Decimal scale overflow while shifting by " + std::to_string(exp));

	return ADecimal(m_unscaled, m_scale + static_cast<std::uint32_t>(down));
}

ADecimal ADecimal::withScale(std::uint32_t newScale, RoundingMode mode) const{
	if(newScale >= m_scale)
		return ADecimal(m_unscaled * AInt::pow10(newScale - m_scale), newScale);

	auto divisor = AInt::pow10(m_scale - newScale);
	return ADecimal(m_unscaled.divRound(divisor, mode), newScale);
}

ADecimal ADecimal::stripTrailingZeros() const{
	if(m_unscaled.isZero())
		return ADecimal(AInt(0L), 0);

	auto unscaled = m_unscaled;
	auto scale = m_scale;

	while(scale > 0 && unscaled.divisibleBy(10UL)){
		unscaled = unscaled.divExact(10UL);
		--scale;
	}

	return ADecimal(std::move(unscaled), scale);
}

AInt ADecimal::toInteger(RoundingMode mode) const{
	if(m_scale == 0)
		return m_unscaled;

	return m_unscaled.divRound(AInt::pow10(m_scale), mode);
}

ARatio ADecimal::toRatio() const{
	return ARatio(m_unscaled, AInt::pow10(m_scale));
}

bool ADecimal::operator==(const ADecimal &rhs) const{
	return toRatio() == rhs.toRatio();
}

std::string ADecimal::toString() const{
	auto digits = m_unscaled.abs().toString();

	if(m_scale > 0){
		if(digits.size() <= m_scale)
			digits.insert(0, m_scale - digits.size() + 1, '0');

		digits.insert(digits.size() - m_scale, ".");
	}

	return (m_unscaled.sign() < 0 ? "-" : "") + digits;
}
