#include <cstdint>
#include <iterator>
#include <vector>

#include "utf8.h"

#include "smartnum/Normalizer.hpp"

using namespace smartnum;

static bool isDigitCp(std::uint32_t cp) noexcept{
	return cp >= '0' && cp <= '9';
}

static bool isAsciiSpace(char c) noexcept{
	switch(c){
		case ' ':
		case '\t':
		case '\n':
		case '\r':
		case '\v':
		case '\f':
			return true;

		default: return false;
	}
}

static bool isSeparatorCp(std::uint32_t cp) noexcept{
	if(cp < 0x80)
		return isAsciiSpace(static_cast<char>(cp));

	switch(cp){
		case 0x00A0: // no-break space
		case 0x202F: // narrow no-break space
		case 0x205F: // medium mathematical space
		case 0x3000: // ideographic space
			return true;

		default:
			// en quad .. hair space
			return cp >= 0x2000 && cp <= 0x200A;
	}
}

static std::string removeDigitSeparators(std::string_view raw){
	if(!utf8::is_valid(raw.begin(), raw.end()))
		return std::string(raw);

	std::vector<std::uint32_t> cps;
	utf8::utf8to32(raw.begin(), raw.end(), std::back_inserter(cps));

	std::string out;
	out.reserve(raw.size());

	std::size_t i = 0;
	while(i < cps.size()){
		if(isSeparatorCp(cps[i]) && i > 0 && isDigitCp(cps[i - 1])){
			auto j = i;
			while(j < cps.size() && isSeparatorCp(cps[j]))
				++j;

			if(j < cps.size() && isDigitCp(cps[j])){
				i = j;
				continue;
			}
		}

		utf8::append(cps[i], std::back_inserter(out));
		++i;
	}

	return out;
}

//! Is \p s a decimal literal with a decimal point (sign, digits, '.', digits)
static bool isPointedDecimal(std::string_view s) noexcept{
	std::size_t idx = 0;
	if(idx < s.size() && (s[idx] == '-' || s[idx] == '+'))
		++idx;

	bool seenPoint = false, seenDigit = false;
	for(; idx < s.size(); ++idx){
		if(s[idx] >= '0' && s[idx] <= '9')
			seenDigit = true;
		else if(s[idx] == '.' && !seenPoint)
			seenPoint = true;
		else
			return false;
	}

	return seenPoint && seenDigit;
}

static std::string stripFractionalZeros(std::string s){
	if(!isPointedDecimal(s))
		return s;

	while(s.back() == '0')
		s.pop_back();

	if(s.back() == '.')
		s.pop_back();

	// ".000" and "-.0" have no digits left
	if(s.empty() || s == "-" || s == "+")
		return "0";

	return s;
}

std::optional<std::string> smartnum::collapseLeadingSigns(std::string_view text, bool skipSpaces){
	if(text.empty() || (text[0] != '-' && text[0] != '+'))
		return std::nullopt;

	std::size_t idx = 0, signs = 0, minuses = 0;
	for(; idx < text.size(); ++idx){
		const char c = text[idx];
		if(c == '-'){
			++signs;
			++minuses;
		}
		else if(c == '+')
			++signs;
		else if(!(skipSpaces && isAsciiSpace(c)))
			break;
	}

	if(signs < 2)
		return std::nullopt;

	return std::string(minuses % 2 == 0 ? "" : "-") + std::string(text.substr(idx));
}

std::string smartnum::normalize(std::string_view raw){
	auto text = stripFractionalZeros(removeDigitSeparators(raw));

	if(auto collapsed = collapseLeadingSigns(text))
		return normalize(*collapsed);

	return text;
}
