#include <cstring>

#include "smartnum/Errors.hpp"

#include "Impls.hpp"

using namespace smartnum;

ARatio::ARatio() noexcept: m_impl(std::make_unique<Impl>()){}

ARatio::ARatio(const ARatio &other) noexcept: ARatio(){
	mpq_set(m_impl->value, other.m_impl->value);
}

ARatio::ARatio(ARatio &&other) noexcept: m_impl(std::move(other.m_impl)){}

ARatio::~ARatio(){}

ARatio::ARatio(std::int64_t n, std::int64_t d): ARatio(AInt(n), AInt(d)){}

ARatio::ARatio(double d) noexcept: ARatio(){
	mpq_set_d(m_impl->value, d);
}

ARatio::ARatio(const AInt &n, const AInt &d): ARatio(){
	if(d.isZero())
		throw DivisionByZeroError(n.toString(), d.toString());

	mpz_set(mpq_numref(m_impl->value), n.m_impl->value);
	mpz_set(mpq_denref(m_impl->value), d.m_impl->value);
	mpq_canonicalize(m_impl->value);
}

ARatio &ARatio::operator=(const ARatio &other) noexcept{
	if(this == &other)
		return *this;

	if(!m_impl)
		m_impl = std::make_unique<Impl>();

	mpq_set(m_impl->value, other.m_impl->value);
	return *this;
}

ARatio &ARatio::operator=(ARatio &&other) noexcept{
	m_impl = std::move(other.m_impl);
	return *this;
}

AInt ARatio::numerator() const noexcept{
	AInt res;
	mpz_set(res.m_impl->value, mpq_numref(m_impl->value));
	return res;
}

AInt ARatio::denominator() const noexcept{
	AInt res;
	mpz_set(res.m_impl->value, mpq_denref(m_impl->value));
	return res;
}

#define DEF_ARATIO_OP(op, fn)\
ARatio ARatio::operator op(const ARatio &rhs) const noexcept{\
	ARatio ret;\
	fn(ret.m_impl->value, m_impl->value, rhs.m_impl->value);\
	return ret;\
}

DEF_ARATIO_OP(+, mpq_add)
DEF_ARATIO_OP(-, mpq_sub)
DEF_ARATIO_OP(*, mpq_mul)

bool ARatio::operator<(const ARatio &rhs) const noexcept{
	return mpq_cmp(m_impl->value, rhs.m_impl->value) < 0;
}

bool ARatio::operator>(const ARatio &rhs) const noexcept{
	return mpq_cmp(m_impl->value, rhs.m_impl->value) > 0;
}

bool ARatio::operator<=(const ARatio &rhs) const noexcept{
	return mpq_cmp(m_impl->value, rhs.m_impl->value) <= 0;
}

bool ARatio::operator>=(const ARatio &rhs) const noexcept{
	return mpq_cmp(m_impl->value, rhs.m_impl->value) >= 0;
}

bool ARatio::operator==(const ARatio &rhs) const noexcept{
	return mpq_equal(m_impl->value, rhs.m_impl->value) != 0;
}

bool ARatio::operator!=(const ARatio &rhs) const noexcept{
	return mpq_equal(m_impl->value, rhs.m_impl->value) == 0;
}

ARatio ARatio::abs() const noexcept{
	ARatio res;
	mpq_abs(res.m_impl->value, m_impl->value);
	return res;
}

ARatio ARatio::inverse() const{
	if(isZero())
		throw DivisionByZeroError("1", "0");

	ARatio res;
	mpq_inv(res.m_impl->value, m_impl->value);
	return res;
}

int ARatio::sign() const noexcept{
	return mpq_sgn(m_impl->value);
}

AInt ARatio::floor() const noexcept{
	AInt res;
	mpz_fdiv_q(res.m_impl->value, mpq_numref(m_impl->value), mpq_denref(m_impl->value));
	return res;
}

std::string ARatio::toString() const{
	std::size_t strLen = mpz_sizeinbase(mpq_numref(m_impl->value), 10)
					   + mpz_sizeinbase(mpq_denref(m_impl->value), 10) + 3;
	std::string str;
	str.resize(strLen);
	mpq_get_str(&str[0], 10, m_impl->value);
	str.resize(std::strlen(str.c_str()));
	return str;
}
