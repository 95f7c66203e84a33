/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_FLOAT_STRATEGIES_HH
#define QUICKSHRINK_FLOAT_STRATEGIES_HH

#include <array>
#include <bit>
#include <quickshrink/search_strategy.hh>


namespace quickshrink {

	inline bits_type float_to_bits(double const value) { return std::bit_cast <bits_type>(value); }
	inline double bits_to_float(bits_type const bits) { return std::bit_cast <double>(bits); }
	
	// Build a double from its IEEE 754 fields (1 + 11 + 52 bits).
	inline double compose_float(bits_type const sign, bits_type const exponent, bits_type const fraction)
	{
		return bits_to_float((sign << 63U) | (exponent << 52U) | fraction);
	}
	
	// Candidates for an arbitrary double. The integral part is simplified with simplify_integer().
	simplify_stream <double> simplify_float(double const value);
	
	
	// Basic form (the bit pattern) and simplification shared by the float strategies.
	class float_strategy : public direct_search_strategy <double>
	{
	public:
		explicit float_strategy(parameter_ptr param):
			direct_search_strategy <double>(type_descriptor::make <double>(), std::move(param))
		{
		}
		
		float_strategy(descriptor_ptr desc, parameter_ptr param):
			direct_search_strategy <double>(std::move(desc), std::move(param))
		{
		}
		
		simplify_stream <double> simplify(double const &value) const override { return simplify_float(value); }
		basic_value to_basic(double const &value) const override { return basic_value(float_to_bits(value)); }
		double from_basic(basic_value const &data) const override;
	};
	
	
	// Every run draws its mean from the standard normal distribution.
	class gaussian_float_strategy final : public float_strategy
	{
	public:
		gaussian_float_strategy();
		
		double produce_template(random_source &rng, parameter_value const &pv) const override;
	};
	
	
	// Floats in a fixed closed interval. The conditional distribution is uniform
	// between a per-run cut point and one of the endpoints.
	class fixed_bounded_float_strategy final : public float_strategy
	{
	protected:
		double	m_lb{};
		double	m_ub{};
		
	public:
		// Throws invalid_range unless the bounds are finite and lb ≤ ub.
		fixed_bounded_float_strategy(double const lb, double const ub);
		
		double lower_bound() const { return m_lb; }
		double upper_bound() const { return m_ub; }
		
		double produce_template(random_source &rng, parameter_value const &pv) const override;
		simplify_stream <double> simplify(double const &value) const override;
		double from_basic(basic_value const &data) const override;
		bool could_have_produced(double const &value) const override { return m_lb <= value && value <= m_ub; }
	};
	
	
	// Every conditional distribution is bounded but the bounds themselves are drawn per run.
	class bounded_float_strategy final : public float_strategy
	{
	protected:
		std::shared_ptr <fixed_bounded_float_strategy const>	m_inner;
		
	public:
		bounded_float_strategy():
			bounded_float_strategy(std::make_shared <fixed_bounded_float_strategy const>(0.0, 1.0))
		{
		}
		
		double produce_template(random_source &rng, parameter_value const &pv) const override;
		
	protected:
		explicit bounded_float_strategy(std::shared_ptr <fixed_bounded_float_strategy const> inner);
	};
	
	
	// zero_point ± X where X is exponentially distributed.
	class exponential_float_strategy final : public float_strategy
	{
	public:
		exponential_float_strategy();
		
		double produce_template(random_source &rng, parameter_value const &pv) const override;
	};
	
	
	// Uniform over the bit patterns, including subnormals, infinities and NaNs.
	class full_range_float_strategy final : public float_strategy
	{
	public:
		full_range_float_strategy();
		
		double produce_template(random_source &rng, parameter_value const &pv) const override;
	};
	
	
	// Values close to zero.
	class small_float_strategy final : public float_strategy
	{
	public:
		small_float_strategy();
		
		// The largest n s.t. 2^-n > 0.
		static int max_exponent();
		
		double produce_template(random_source &rng, parameter_value const &pv) const override;
	};
	
	
	// Integers converted to floats.
	class just_int_float_strategy final : public float_strategy
	{
	protected:
		search_strategy_ptr <integer_type>	m_int_strategy;
		
	public:
		explicit just_int_float_strategy(search_strategy_ptr <integer_type> int_strategy);
		
		double produce_template(random_source &rng, parameter_value const &pv) const override;
	};
	
	
	// A fixed set of edge cases.
	class nasty_float_strategy final : public float_strategy
	{
	public:
		typedef std::array <double, 6>	element_array;
		
	public:
		nasty_float_strategy();
		
		static element_array const &elements();
		
		double produce_template(random_source &rng, parameter_value const &pv) const override;
	};
	
	
	// Reifies the template of the given strategy when producing.
	class wrapper_float_strategy final : public float_strategy
	{
	protected:
		search_strategy_ptr <double>	m_sub_strategy;
		
	public:
		explicit wrapper_float_strategy(search_strategy_ptr <double> sub_strategy);
		
		search_strategy <double> const &sub_strategy() const { return *m_sub_strategy; }
		
		double produce_template(random_source &rng, parameter_value const &pv) const override;
	};
}

#endif
