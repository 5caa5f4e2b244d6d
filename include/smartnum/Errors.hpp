#ifndef SMARTNUM_ERRORS_HPP
#define SMARTNUM_ERRORS_HPP 1

#include <stdexcept>
#include <string>

namespace smartnum{
	//! Base of every error thrown while building or viewing a number
	class NumberError: public std::exception{
		public:
			explicit NumberError(std::string msg): m_msg(std::move(msg)){}

			const char *what() const noexcept override{ return m_msg.c_str(); }

		private:
			std::string m_msg;
	};

	//! Text matched none of the recognized literal grammars
	class InvalidInputError: public NumberError{
		public:
			explicit InvalidInputError(std::string text_)
				: NumberError("Invalid number input: \"" + text_ + "\""), m_text(std::move(text_)){}

			//! The offending (normalized) text
			const std::string &text() const noexcept{ return m_text; }

		private:
			std::string m_text;
	};

	class DivisionByZeroError: public NumberError{
		public:
			DivisionByZeroError(std::string numerator_, std::string denominator_)
				: NumberError("Division by zero: " + numerator_ + "/" + denominator_)
				, m_numerator(std::move(numerator_)), m_denominator(std::move(denominator_)){}

			const std::string &numerator() const noexcept{ return m_numerator; }
			const std::string &denominator() const noexcept{ return m_denominator; }

		private:
			std::string m_numerator, m_denominator;
	};

	//! A fixed-width conversion can not hold the magnitude
	class PrecisionOverflowError: public NumberError{
		public:
			explicit PrecisionOverflowError(std::string msg): NumberError(std::move(msg)){}
	};

	//! RoundingMode::unnecessary was requested but digits would be lost
	class RoundingNecessaryError: public NumberError{
		public:
			explicit RoundingNecessaryError(std::string msg): NumberError(std::move(msg)){}
	};
}

#endif // !SMARTNUM_ERRORS_HPP
