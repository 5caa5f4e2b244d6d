#include "test_support.hpp"

namespace{
	void verifyAll(){
		smartnum_test::runBignumTests();
		smartnum_test::runNormalizerTests();
		smartnum_test::runParserTests();
		smartnum_test::runReducerTests();
		smartnum_test::runFormatterTests();
		smartnum_test::runSmartNumberTests();
	}
}

int main(){
	verifyAll();
	return 0;
}
