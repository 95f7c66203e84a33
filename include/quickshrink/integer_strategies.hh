/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_INTEGER_STRATEGIES_HH
#define QUICKSHRINK_INTEGER_STRATEGIES_HH

#include <quickshrink/search_strategy.hh>


namespace quickshrink {

	constexpr inline std::size_t const MAX_INTEGER_SIMPLIFY_ITERATIONS{100};
	
	// Candidates for an arbitrary integer: for negative values the magnitude and then
	// the negated candidates of the magnitude; for positive values 0, x / 2 and then either
	// every remaining value in (0, x) in decreasing order or, for large values,
	// a sample of (0, x) seeded with x.
	simplify_stream <integer_type> simplify_integer(integer_type const value);
	
	
	// Basic form and simplification for unbounded integers; subclasses produce.
	class int_strategy : public direct_search_strategy <integer_type>
	{
	public:
		explicit int_strategy(parameter_ptr param):
			direct_search_strategy <integer_type>(type_descriptor::make <integer_type>(), std::move(param))
		{
		}
		
		simplify_stream <integer_type> simplify(integer_type const &value) const override { return simplify_integer(value); }
		basic_value to_basic(integer_type const &value) const override { return basic_value(value); }
		integer_type from_basic(basic_value const &data) const override { return data.as_integer(); }
	};
	
	
	// Magnitudes are geometrically distributed and the sign is chosen with a per-run probability,
	// so runs tend to be biased towards small values of one sign.
	class random_geometric_int_strategy final : public int_strategy
	{
	public:
		random_geometric_int_strategy();
		
		integer_type produce_template(random_source &rng, parameter_value const &pv) const override;
	};
	
	
	// Integers in [start, end]. The parameter is a small subset of the range,
	// which makes the draws of one run recur.
	class bounded_int_strategy final : public direct_search_strategy <integer_type>
	{
	protected:
		integer_type	m_start{};
		integer_type	m_end{};
		
	public:
		// Throws invalid_range if end < start.
		bounded_int_strategy(integer_type const start, integer_type const end);
		
		integer_type start() const { return m_start; }
		integer_type end() const { return m_end; }
		
		integer_type produce_template(random_source &rng, parameter_value const &pv) const override;
		simplify_stream <integer_type> simplify(integer_type const &value) const override;
		basic_value to_basic(integer_type const &value) const override { return basic_value(value); }
		integer_type from_basic(basic_value const &data) const override;
		bool could_have_produced(integer_type const &value) const override { return m_start <= value && value <= m_end; }
	};
}

#endif
