#ifndef SMARTNUM_SMARTNUMBER_HPP
#define SMARTNUM_SMARTNUMBER_HPP 1

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "Number.hpp"
#include "MathBuilder.hpp"
#include "RoundingMode.hpp"

namespace smartnum{
	//! Fractional digits kept by decimal expansions when no accuracy is given
	constexpr std::uint32_t defaultAccuracy = 100;

	//! Numerator/denominator pair that can also be indexed, [0] and [1]
	class FractionNumbers{
		public:
			FractionNumbers(AInt numerator_, AInt denominator_)
				: m_numerator(std::move(numerator_)), m_denominator(std::move(denominator_)){}

			explicit FractionNumbers(const Fraction &f)
				: FractionNumbers(f.numerator, f.denominator){}

			const AInt &numerator() const noexcept{ return m_numerator; }
			const AInt &denominator() const noexcept{ return m_denominator; }

			//! \throws std::out_of_range for any index but 0 and 1
			const AInt &operator[](std::size_t idx) const;

			std::size_t size() const noexcept{ return 2; }

			std::string toString() const{
				return m_numerator.toString() + "/" + m_denominator.toString();
			}

		private:
			AInt m_numerator, m_denominator;
	};

	/**
	 * \brief Exact number built from user text, with cached views
	 *
	 * Accepted input: "123", "-12.50", "1 000", "1.5e3", "6/8", "---6".
	 * Construction either yields a fully parsed number or throws. The
	 * number never changes afterwards; every derived view is computed on
	 * first access, once, and the same object is returned from then on.
	 *
	 * Copies start with an empty cache.
	 **/
	class SmartNumber{
		public:
			/**
			 * \param accuracy fractional digits kept by decimal expansions, defaultAccuracy if empty
			 * \param input the number as text
			 * \throws InvalidInputError if the text is not a number
			 * \throws DivisionByZeroError for a fraction with a zero denominator
			 **/
			SmartNumber(std::optional<std::uint32_t> accuracy, std::string input);

			explicit SmartNumber(std::string input)
				: SmartNumber(std::nullopt, std::move(input)){}

			SmartNumber(const SmartNumber &other);
			SmartNumber(SmartNumber &&other) noexcept;

			~SmartNumber();

			SmartNumber &operator=(const SmartNumber&) = delete;
			SmartNumber &operator=(SmartNumber&&) = delete;

			//! The text exactly as given to the constructor
			const std::string &input() const noexcept{ return m_input; }

			std::uint32_t accuracy() const noexcept{ return m_accuracy; }

			const CanonicalNumber &value() const noexcept{ return m_value; }

			NumberKind kind() const noexcept{ return kindOf(m_value); }

			//! Was the input written as "a/b"
			bool isExplicitRational() const noexcept{ return kind() == NumberKind::rational; }

			AInt asInteger(RoundingMode mode = RoundingMode::floor) const;

			//! \throws PrecisionOverflowError if the rounded value does not fit
			std::int64_t asInt64(RoundingMode mode = RoundingMode::floor) const;

			const ADecimal &asDecimal() const;

			/**
			 * WARNING: only an approximation, use asDecimal or asRational
			 * for anything that has to stay exact.
			 **/
			double asFloat() const;

			/**
			 * \brief Number as numerator and denominator
			 *
			 * By default an explicit "a/b" input is returned as written and
			 * everything else is simplified. Decimals are simplified by
			 * continued fraction approximation (see approximateReduce).
			 **/
			const FractionNumbers &asFraction(std::optional<bool> simplify = std::nullopt) const;

			//! Same as asFraction, without the indexable wrapper
			const Fraction &asRational(std::optional<bool> simplify = std::nullopt) const;

			bool isInteger() const;
			bool isFloat() const{ return !isInteger(); }

			bool isZero() const noexcept;
			bool isPositive() const noexcept;
			bool isNegative() const noexcept;

			const HumanStringBuilder &toHumanString() const;
			const LatexBuilder &toLatex() const;

			std::string toString() const{ return toHumanString().toString(); }

		private:
			bool resolveSimplify(std::optional<bool> simplify) const noexcept;
			int sign() const noexcept;

			std::uint32_t m_accuracy;
			std::string m_input;
			CanonicalNumber m_value;

			struct Cache;
			std::unique_ptr<Cache> m_cache;
	};

	inline std::ostream &operator<<(std::ostream &os, const SmartNumber &n){
		return os << n.toString();
	}
}

#endif // !SMARTNUM_SMARTNUMBER_HPP
