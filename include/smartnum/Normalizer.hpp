#ifndef SMARTNUM_NORMALIZER_HPP
#define SMARTNUM_NORMALIZER_HPP 1

#include <optional>
#include <string>
#include <string_view>

//! \file

namespace smartnum{
	/**
	 * \brief Clean raw user text before it is parsed
	 *
	 * Applied in order:
	 *  1. whitespace (including unicode space separators) standing between
	 *     two digits is removed, "1 000" -> "1000"
	 *  2. trailing fractional zeros and a dangling point are stripped from
	 *     a decimal literal, "2.500" -> "2.5", "3.000" -> "3"
	 *  3. a leading run of two or more signs is collapsed by the parity of
	 *     its minus signs and the rest is normalized again, "---6" -> "-6"
	 *
	 * Never throws, whatever is left over is rejected by parseLiteral.
	 **/
	std::string normalize(std::string_view raw);

	/**
	 * \brief Collapse a leading run of '+'/'-' by the parity of its '-' count
	 *
	 * The run must start at the first character and hold at least two signs.
	 * With \p skipSpaces ASCII whitespace inside the run is dropped too.
	 * Returns nullopt if there is no such run.
	 **/
	std::optional<std::string> collapseLeadingSigns(std::string_view text, bool skipSpaces = false);
}

#endif // !SMARTNUM_NORMALIZER_HPP
