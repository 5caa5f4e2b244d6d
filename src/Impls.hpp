#ifndef SMARTNUM_SRC_IMPLS_HPP
#define SMARTNUM_SRC_IMPLS_HPP 1

#include <gmp.h>
#include <mpfr.h>

#include "smartnum/AInt.hpp"
#include "smartnum/ARatio.hpp"
#include "smartnum/AReal.hpp"

struct smartnum::AInt::Impl{
	Impl(){ mpz_init(value); }
	~Impl(){ mpz_clear(value); }

	mpz_t value;
};

struct smartnum::ARatio::Impl{
	Impl(){ mpq_init(value); }
	~Impl(){ mpq_clear(value); }

	mpq_t value;
};

struct smartnum::AReal::Impl{
	~Impl(){ mpfr_clear(value); }

	mpfr_t value;
};

#endif // !SMARTNUM_SRC_IMPLS_HPP
