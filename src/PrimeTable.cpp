#include "smartnum/PrimeTable.hpp"

using namespace smartnum;

static std::vector<std::uint32_t> sievePrimes(std::uint32_t limit){
	std::vector<bool> composite(limit, false);
	std::vector<std::uint32_t> primes;

	for(std::uint32_t i = 2; i < limit; i++){
		if(composite[i])
			continue;

		primes.push_back(i);

		for(std::uint64_t j = std::uint64_t(i) * i; j < limit; j += i)
			composite[j] = true;
	}

	return primes;
}

const std::vector<std::uint32_t> &smartnum::primeTable(){
	static const std::vector<std::uint32_t> table = sievePrimes(primeTableLimit);
	return table;
}
