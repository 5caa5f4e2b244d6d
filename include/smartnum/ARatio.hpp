#ifndef SMARTNUM_ARATIO_HPP
#define SMARTNUM_ARATIO_HPP 1

#include <cstdint>
#include <memory>
#include <string>

#include "AInt.hpp"

namespace smartnum{
	//! Arbitrary precision rational (GMP mpq_t), always kept in canonical form
	class ARatio{
		public:
			ARatio(const ARatio &other) noexcept;
			ARatio(ARatio &&other) noexcept;

			~ARatio();

			//! \throws DivisionByZeroError if \p denominator is zero
			ARatio(const AInt &numerator, const AInt &denominator = AInt(1L));

			explicit ARatio(std::int64_t numerator, std::int64_t denominator = 1);
			explicit ARatio(double d) noexcept;

			ARatio &operator=(const ARatio &other) noexcept;
			ARatio &operator=(ARatio &&other) noexcept;

			AInt numerator() const noexcept;
			AInt denominator() const noexcept;

			ARatio operator+(const ARatio &rhs) const noexcept;
			ARatio operator-(const ARatio &rhs) const noexcept;
			ARatio operator*(const ARatio &rhs) const noexcept;

			bool operator<(const ARatio &rhs) const noexcept;
			bool operator>(const ARatio &rhs) const noexcept;
			bool operator<=(const ARatio &rhs) const noexcept;
			bool operator>=(const ARatio &rhs) const noexcept;
			bool operator==(const ARatio &rhs) const noexcept;
			bool operator!=(const ARatio &rhs) const noexcept;

			ARatio abs() const noexcept;
			ARatio inverse() const;

			int sign() const noexcept;
			bool isZero() const noexcept{ return sign() == 0; }

			//! Largest integer not greater than this
			AInt floor() const noexcept;

			std::string toString() const;

		private:
			ARatio() noexcept;

			struct Impl;
			std::unique_ptr<Impl> m_impl;

			friend class AReal;
	};
}

#endif // !SMARTNUM_ARATIO_HPP
