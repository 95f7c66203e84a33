/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_DISTRIBUTIONS_HH
#define QUICKSHRINK_DISTRIBUTIONS_HH

#include <quickshrink/basic_types.hh>


// Sampling helpers. All of them read only the given random source.
namespace quickshrink::distributions {

	// Uniform in [0, 1).
	double random_unit(random_source &rng);
	
	bool biased_coin(random_source &rng, double const probability);
	
	// Number of failures before the first success; capped to INTEGER_MAX.
	bits_type geometric(random_source &rng, double const probability);
	
	double uniform_float(random_source &rng, double const lb, double const ub);
	integer_type uniform_int(random_source &rng, integer_type const lb, integer_type const ub); // Closed range.
	double normal_variate(random_source &rng, double const mean, double const sd);
	double exponential_variate(random_source &rng, double const rate);
	double gamma_variate(random_source &rng, double const shape, double const scale);
	double beta_variate(random_source &rng, double const alpha, double const beta);
	
	// The given number of low bits set randomly, count ≤ 64.
	bits_type random_bits(random_source &rng, unsigned int const count);
}

#endif
