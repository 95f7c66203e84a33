/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_COMPLEX_STRATEGY_HH
#define QUICKSHRINK_COMPLEX_STRATEGY_HH

#include <complex>
#include <quickshrink/mapped_strategy.hh>
#include <quickshrink/pair_strategy.hh>


namespace quickshrink {

	typedef pair_strategy <search_strategy <double>>	float_pair_strategy;
	
	
	// Real and imaginary parts are drawn from the given float strategy.
	class complex_strategy final : public mapped_search_strategy <float_pair_strategy, std::complex <double>>
	{
	public:
		explicit complex_strategy(search_strategy_ptr <double> const &float_strategy);
		
		std::complex <double> pack(inner_value_type const &value) const override { return {value.first, value.second}; }
	};
}

#endif
