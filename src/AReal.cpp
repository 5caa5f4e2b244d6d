#include <stdexcept>
#include <algorithm>
#include <cmath>

#include "smartnum/ADecimal.hpp"

#include "Impls.hpp"

using namespace smartnum;

AReal::AReal() noexcept: m_impl(std::make_unique<Impl>()){}

AReal::AReal(const AReal &other) noexcept: AReal(){
	mpfr_init2(m_impl->value, mpfr_get_prec(other.m_impl->value));
	mpfr_set(m_impl->value, other.m_impl->value, MPFR_RNDN);
}

AReal::AReal(AReal &&other) noexcept: m_impl(std::move(other.m_impl)){}

AReal::~AReal(){}

AReal::AReal(const AInt &i, std::size_t precisionBits) noexcept: AReal(){
	mpfr_init2(m_impl->value, static_cast<mpfr_prec_t>(std::max<std::size_t>(precisionBits, MPFR_PREC_MIN)));
	mpfr_set_z(m_impl->value, i.m_impl->value, MPFR_RNDN);
}

AReal::AReal(const ARatio &q, std::size_t precisionBits) noexcept: AReal(){
	mpfr_init2(m_impl->value, static_cast<mpfr_prec_t>(std::max<std::size_t>(precisionBits, MPFR_PREC_MIN)));
	mpfr_set_q(m_impl->value, q.m_impl->value, MPFR_RNDN);
}

template<typename Fn>
void mpfrInitOp(mpfr_t rop, mpfr_t lhs, mpfr_t rhs, Fn fn){
	mpfr_init2(rop, std::max(mpfr_get_prec(lhs), mpfr_get_prec(rhs)));
	fn(rop, lhs, rhs, MPFR_RNDN);
}

#define DEF_AREAL_OP(op, fn)\
AReal AReal::operator op(const AReal &rhs) const noexcept{\
	AReal ret;\
	mpfrInitOp(ret.m_impl->value, m_impl->value, rhs.m_impl->value, fn);\
	return ret;\
}

DEF_AREAL_OP(*, mpfr_mul)

AReal AReal::pow(const AReal &exp) const noexcept{
	AReal res;
	mpfrInitOp(res.m_impl->value, m_impl->value, exp.m_impl->value, mpfr_pow);
	return res;
}

std::size_t AReal::precision() const noexcept{
	return static_cast<std::size_t>(mpfr_get_prec(m_impl->value));
}

double AReal::toDouble() const noexcept{
	return mpfr_get_d(m_impl->value, MPFR_RNDN);
}

ADecimal AReal::toDecimal(std::uint32_t scale) const{
	if(!mpfr_number_p(m_impl->value))
		throw std::runtime_error("Non-finite real can not be converted to a decimal");

	AReal shifted = *this * AReal(AInt::pow10(scale), precision());

	AInt unscaled(0L);
	mpfr_get_z(unscaled.m_impl->value, shifted.m_impl->value, MPFR_RNDZ);
	return ADecimal(std::move(unscaled), scale);
}

std::size_t AReal::bitsForDigits(std::size_t digits) noexcept{
	constexpr double log2Of10 = 3.32192809488736234787;
	return static_cast<std::size_t>(std::ceil(static_cast<double>(digits) * log2Of10)) + 16;
}
