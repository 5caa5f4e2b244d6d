#ifndef SMARTNUM_ROUNDINGMODE_HPP
#define SMARTNUM_ROUNDINGMODE_HPP 1

namespace smartnum{
	//! Policy used when a division or rescale would discard digits
	enum class RoundingMode{
		//! Throw RoundingNecessaryError instead of discarding anything
		unnecessary,
		//! Away from zero
		up,
		//! Towards zero (truncation)
		down,
		//! Towards positive infinity
		ceiling,
		//! Towards negative infinity
		floor,
		halfUp, halfDown, halfEven,
		halfCeiling, halfFloor,

		COUNT
	};
}

#endif // !SMARTNUM_ROUNDINGMODE_HPP
