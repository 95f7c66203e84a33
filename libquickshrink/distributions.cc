/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <cmath>
#include <libbio/assert.hh>
#include <limits>
#include <quickshrink/distributions.hh>


namespace quickshrink::distributions {

	double random_unit(random_source &rng)
	{
		std::uniform_real_distribution <double> dist(0.0, 1.0);
		return dist(rng);
	}
	
	
	bool biased_coin(random_source &rng, double const probability)
	{
		if (probability <= 0.0)
			return false;
		if (1.0 <= probability)
			return true;
		return random_unit(rng) < probability;
	}
	
	
	bits_type geometric(random_source &rng, double const probability)
	{
		constexpr auto const max_value{bits_type(INTEGER_MAX)};
		
		if (1.0 <= probability)
			return 0;
		if (probability <= 0.0)
			return max_value;
			
		auto const denom(std::log1p(-probability));
		if (0.0 == denom)
			return max_value;
			
		// Use (0, 1] so that the logarithm is finite.
		auto const uu(1.0 - random_unit(rng));
		auto const value(std::floor(std::log(uu) / denom));
		if (! (value < double(max_value)))
			return max_value;
		return bits_type(value);
	}
	
	
	double uniform_float(random_source &rng, double const lb, double const ub)
	{
		libbio_assert_lte(lb, ub);
		return lb + (ub - lb) * random_unit(rng);
	}
	
	
	integer_type uniform_int(random_source &rng, integer_type const lb, integer_type const ub)
	{
		libbio_assert_lte(lb, ub);
		std::uniform_int_distribution <integer_type> dist(lb, ub);
		return dist(rng);
	}
	
	
	double normal_variate(random_source &rng, double const mean, double const sd)
	{
		if (0.0 == sd)
			return mean;
			
		std::normal_distribution <double> dist(mean, sd);
		return dist(rng);
	}
	
	
	double exponential_variate(random_source &rng, double const rate)
	{
		// A gamma distributed rate may underflow to zero.
		if (! (0.0 < rate))
			return std::numeric_limits <double>::infinity();
			
		std::exponential_distribution <double> dist(rate);
		return dist(rng);
	}
	
	
	double gamma_variate(random_source &rng, double const shape, double const scale)
	{
		std::gamma_distribution <double> dist(shape, scale);
		return dist(rng);
	}
	
	
	double beta_variate(random_source &rng, double const alpha, double const beta)
	{
		auto const xx(gamma_variate(rng, alpha, 1.0));
		auto const yy(gamma_variate(rng, beta, 1.0));
		auto const sum(xx + yy);
		
		// Both may underflow with small shape parameters.
		if (! (0.0 < sum))
			return alpha / (alpha + beta);
			
		return xx / sum;
	}
	
	
	bits_type random_bits(random_source &rng, unsigned int const count)
	{
		libbio_assert_lte(count, 64);
		static_assert(64 == std::numeric_limits <random_source::result_type>::digits);
		
		if (0 == count)
			return 0;
			
		auto const word(rng());
		return word >> (64U - count);
	}
}
