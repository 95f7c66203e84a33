/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <quickshrink/complex_strategy.hh>


namespace quickshrink {

	complex_strategy::complex_strategy(search_strategy_ptr <double> const &float_strategy):
		mapped_search_strategy(
			type_descriptor::make <std::complex <double>>(),
			std::make_shared <float_pair_strategy const>(float_strategy, float_strategy)
		)
	{
	}
}
