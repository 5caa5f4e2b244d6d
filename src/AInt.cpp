#include <stdexcept>
#include <cstring>

#include "smartnum/Errors.hpp"

#include "Impls.hpp"

using namespace smartnum;

AInt::AInt() noexcept: m_impl(std::make_unique<AInt::Impl>()){}

AInt::AInt(AInt &&other) noexcept: m_impl(std::move(other.m_impl)){}

AInt::AInt(const AInt &other) noexcept: AInt(){
	mpz_set(m_impl->value, other.m_impl->value);
}

AInt::~AInt(){}

AInt::AInt(std::int64_t i) noexcept: AInt(){
	mpz_set_si(m_impl->value, i);
}

AInt::AInt(std::uint64_t i) noexcept: AInt(){
	mpz_set_ui(m_impl->value, i);
}

AInt::AInt(const std::string &s): AInt(){
	auto str = (!s.empty() && s[0] == '+') ? s.substr(1) : s;
	if(str.empty() || mpz_set_str(m_impl->value, str.c_str(), 10) == -1)
		throw std::runtime_error("Invalid integer literal (mpz_set_str)");
}

AInt &AInt::operator=(const AInt &other) noexcept{
	if(this == &other)
		return *this;

	if(!m_impl)
		m_impl = std::make_unique<Impl>();

	mpz_set(m_impl->value, other.m_impl->value);
	return *this;
}

AInt &AInt::operator=(AInt &&other) noexcept{
	m_impl = std::move(other.m_impl);
	return *this;
}

#define DEF_AINT_OP(op, fn)\
AInt AInt::operator op(const AInt &rhs) const noexcept{\
	AInt ret;\
	fn(ret.m_impl->value, m_impl->value, rhs.m_impl->value);\
	return ret;\
}

DEF_AINT_OP(+, mpz_add)
DEF_AINT_OP(-, mpz_sub)
DEF_AINT_OP(*, mpz_mul)

AInt AInt::operator-() const noexcept{
	AInt ret;
	mpz_neg(ret.m_impl->value, m_impl->value);
	return ret;
}

bool AInt::operator<(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) < 0;
}

bool AInt::operator>(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) > 0;
}

bool AInt::operator<=(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) <= 0;
}

bool AInt::operator>=(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) >= 0;
}

bool AInt::operator==(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) == 0;
}

bool AInt::operator!=(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) != 0;
}

AInt AInt::pow(unsigned long exp) const noexcept{
	AInt res;
	mpz_pow_ui(res.m_impl->value, m_impl->value, exp);
	return res;
}

AInt AInt::pow10(unsigned long exp) noexcept{
	AInt res;
	mpz_ui_pow_ui(res.m_impl->value, 10, exp);
	return res;
}

AInt AInt::abs() const noexcept{
	AInt res;
	mpz_abs(res.m_impl->value, m_impl->value);
	return res;
}

int AInt::sign() const noexcept{
	return mpz_sgn(m_impl->value);
}

bool AInt::isOdd() const noexcept{
	return mpz_odd_p(m_impl->value) != 0;
}

bool AInt::divisibleBy(unsigned long d) const noexcept{
	return mpz_divisible_ui_p(m_impl->value, d) != 0;
}

bool AInt::divisibleBy(const AInt &d) const noexcept{
	return mpz_divisible_p(m_impl->value, d.m_impl->value) != 0;
}

AInt AInt::divExact(unsigned long d) const noexcept{
	AInt res;
	mpz_divexact_ui(res.m_impl->value, m_impl->value, d);
	return res;
}

AInt AInt::divExact(const AInt &d) const{
	if(d.isZero())
		throw DivisionByZeroError(toString(), "0");

	AInt res;
	mpz_divexact(res.m_impl->value, m_impl->value, d.m_impl->value);
	return res;
}

AInt AInt::divRound(const AInt &d, RoundingMode mode) const{
	if(d.isZero())
		throw DivisionByZeroError(toString(), "0");

	AInt q, r;
	mpz_tdiv_qr(q.m_impl->value, r.m_impl->value, m_impl->value, d.m_impl->value);

	if(r.isZero())
		return q;

	// sign of the exact quotient, truncation went towards zero
	const int quotientSign = sign() * d.sign();
	const AInt away = q + AInt(static_cast<std::int64_t>(quotientSign));

	auto halfCmp = [&]{
		AInt twiceRem = r.abs() * AInt(2L);
		return mpz_cmp(twiceRem.m_impl->value, d.abs().m_impl->value);
	};

	switch(mode){
		case RoundingMode::unnecessary:
			throw RoundingNecessaryError("Rounding necessary for " + toString() + "/" + d.toString());

		case RoundingMode::up: return away;
		case RoundingMode::down: return q;
		case RoundingMode::ceiling: return quotientSign > 0 ? away : q;
		case RoundingMode::floor: return quotientSign < 0 ? away : q;

		case RoundingMode::halfUp:
		case RoundingMode::halfDown:
		case RoundingMode::halfEven:
		case RoundingMode::halfCeiling:
		case RoundingMode::halfFloor:{
			auto cmp = halfCmp();
			if(cmp > 0) return away;
			if(cmp < 0) return q;

			switch(mode){
				case RoundingMode::halfUp: return away;
				case RoundingMode::halfDown: return q;
				case RoundingMode::halfEven: return q.isOdd() ? away : q;
				case RoundingMode::halfCeiling: return quotientSign > 0 ? away : q;
				default: return quotientSign < 0 ? away : q;
			}
		}

		default:
			throw std::runtime_error("Unrecognized rounding mode in 'divRound'");
	}
}

AInt AInt::gcd(const AInt &a, const AInt &b) noexcept{
	AInt res;
	mpz_gcd(res.m_impl->value, a.m_impl->value, b.m_impl->value);
	return res;
}

bool AInt::fitsInt64() const noexcept{
	static_assert(sizeof(long) == sizeof(std::int64_t), "mpz_get_si must cover std::int64_t");
	return mpz_fits_slong_p(m_impl->value) != 0;
}

std::int64_t AInt::toInt64() const{
	if(!fitsInt64())
		throw PrecisionOverflowError("Integer " + toString() + " does not fit in 64 bits");

	return mpz_get_si(m_impl->value);
}

std::string AInt::toString() const{
	std::string str;
	str.resize(mpz_sizeinbase(m_impl->value, 10) + 2);
	mpz_get_str(&str[0], 10, m_impl->value);
	str.resize(std::strlen(str.c_str()));
	return str;
}
