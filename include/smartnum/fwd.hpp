#ifndef SMARTNUM_FWD_HPP
#define SMARTNUM_FWD_HPP 1

namespace smartnum{
	class AInt;
	class ARatio;
	class AReal;
	class ADecimal;

	struct Fraction;
	class SmartNumber;
}

#endif // !SMARTNUM_FWD_HPP
