#ifndef SMARTNUM_MATHBUILDER_HPP
#define SMARTNUM_MATHBUILDER_HPP 1

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace smartnum{
	//! Anything that renders to a textual fragment
	struct TextFragment{
		virtual ~TextFragment() = default;

		virtual std::string toString() const = 0;
	};

	//! Verbatim text as an operand
	class PlainText: public TextFragment{
		public:
			explicit PlainText(std::string text_): m_text(std::move(text_)){}

			std::string toString() const override{ return m_text; }

		private:
			std::string m_text;
	};

	inline std::ostream &operator<<(std::ostream &os, const TextFragment &fragment){
		return os << fragment.toString();
	}

	//! Operator tokens for LaTeX output
	struct LatexSyntax{
		static constexpr const char *plus = "+";
		static constexpr const char *minus = "-";
		static constexpr const char *multiply = "\\cdot";
		static constexpr const char *divide = "\\div";
		static constexpr const char *equals = "=";
	};

	//! Operator tokens for plain human readable output
	struct HumanStringSyntax{
		static constexpr const char *plus = "+";
		static constexpr const char *minus = "-";
		static constexpr const char *multiply = "*";
		static constexpr const char *divide = "/";
		static constexpr const char *equals = "=";
	};

	/**
	 * \brief Immutable builder for a flat mathematical expression
	 *
	 * Every operator returns a new builder holding "self <op> other".
	 * Composition is purely syntactic and left associative, there is no
	 * precedence handling: "a".plus("b").multipliedBy("c") renders as
	 * "a + b * c". Use wrap to parenthesize explicitly.
	 *
	 * Optional delimiters (e.g. "$" ... "$") surround the rendered text but
	 * are not part of the expression when it is used as an operand.
	 **/
	template<typename Syntax>
	class BasicMathBuilder: public TextFragment{
		public:
			explicit BasicMathBuilder(std::string expr = "")
				: m_expr(std::move(expr)){}

			BasicMathBuilder(std::string expr, std::string delimiterLeft, std::optional<std::string> delimiterRight = std::nullopt)
				: m_expr(std::move(expr)), m_delimLeft(std::move(delimiterLeft))
				, m_delimRight(delimiterRight ? std::move(*delimiterRight) : m_delimLeft){}

			BasicMathBuilder plus(const TextFragment &with) const{ return op(Syntax::plus, expression(with)); }
			BasicMathBuilder minus(const TextFragment &with) const{ return op(Syntax::minus, expression(with)); }
			BasicMathBuilder multipliedBy(const TextFragment &with) const{ return op(Syntax::multiply, expression(with)); }
			BasicMathBuilder dividedBy(const TextFragment &with) const{ return op(Syntax::divide, expression(with)); }
			BasicMathBuilder equals(const TextFragment &to) const{ return op(Syntax::equals, expression(to)); }

			BasicMathBuilder plus(std::string_view with) const{ return op(Syntax::plus, std::string(with)); }
			BasicMathBuilder minus(std::string_view with) const{ return op(Syntax::minus, std::string(with)); }
			BasicMathBuilder multipliedBy(std::string_view with) const{ return op(Syntax::multiply, std::string(with)); }
			BasicMathBuilder dividedBy(std::string_view with) const{ return op(Syntax::divide, std::string(with)); }
			BasicMathBuilder equals(std::string_view to) const{ return op(Syntax::equals, std::string(to)); }

			//! Surround the expression with \p left and \p right
			BasicMathBuilder wrap(std::string_view left, std::string_view right) const{
				auto ret = *this;
				ret.m_expr = std::string(left) + m_expr + std::string(right);
				return ret;
			}

			//! Surround the expression with \p both on each side
			BasicMathBuilder wrap(std::string_view both) const{ return wrap(both, both); }

			//! The expression without delimiters
			const std::string &expression() const noexcept{ return m_expr; }

			std::string toString() const override{ return m_delimLeft + m_expr + m_delimRight; }

		private:
			BasicMathBuilder op(const char *token, const std::string &rhs) const{
				auto ret = *this;
				ret.m_expr = m_expr + " " + token + " " + rhs;
				return ret;
			}

			static std::string expression(const TextFragment &fragment){
				if(auto builder = dynamic_cast<const BasicMathBuilder*>(&fragment))
					return builder->m_expr;

				return fragment.toString();
			}

			std::string m_expr;
			std::string m_delimLeft, m_delimRight;
	};

	using LatexBuilder = BasicMathBuilder<LatexSyntax>;
	using HumanStringBuilder = BasicMathBuilder<HumanStringSyntax>;
}

#endif // !SMARTNUM_MATHBUILDER_HPP
