/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <algorithm>
#include <boost/format.hpp>
#include <cmath>
#include <functional>
#include <libbio/assert.hh>
#include <limits>
#include <quickshrink/distributions.hh>
#include <quickshrink/float_strategies.hh>
#include <quickshrink/integer_strategies.hh>

namespace dist	= quickshrink::distributions;
namespace qs	= quickshrink;


namespace {

	// Doubles with a smaller magnitude have an integral part representable as integer_type.
	constexpr double const INTEGRAL_PART_LIMIT{0x1p63};
	
	
	int find_max_exponent()
	{
		int lower(0);
		int upper(1);
		while (0.0 < std::ldexp(1.0, -upper))
		{
			lower = upper;
			upper *= 2;
		}
		
		libbio_always_assert_lt(0.0, std::ldexp(1.0, -lower));
		libbio_always_assert_eq(0.0, std::ldexp(1.0, -upper));
		
		while (lower + 1 < upper)
		{
			auto const mid((lower + upper) / 2);
			if (0.0 < std::ldexp(1.0, -mid))
				lower = mid;
			else
				upper = mid;
		}
		
		return lower;
	}
}


namespace quickshrink {

	simplify_stream <double> simplify_float(double const value)
	{
		typedef std::function <simplify_stream <double>()> stream_fn;
		
		if (0.0 == value)
			return {};
			
		if (std::isnan(value))
		{
			return make_value_stream <double>({
				0.0,
				std::numeric_limits <double>::infinity(),
				-std::numeric_limits <double>::infinity()
			});
		}
		
		if (std::isinf(value))
			return make_value_stream <double>({std::copysign(std::numeric_limits <double>::max(), value)});
			
		std::vector <double> prefix;
		if (value < 0.0)
			prefix.push_back(-value);
		prefix.push_back(0.0);
		
		std::vector <stream_fn> stream_fns;
		if (std::fabs(value) < INTEGRAL_PART_LIMIT)
		{
			auto const nn(integer_type(std::trunc(value)));
			auto const yy{double(nn)};
			if (value != yy)
				prefix.push_back(yy);
				
			stream_fns.emplace_back([prefix = std::move(prefix)](){ return make_value_stream(prefix); });
			
			// Keep the fractional part and simplify the integral part.
			stream_fns.emplace_back([value, nn](){
				return transform_stream <double>(simplify_integer(nn), [value, nn](integer_type const mm){
					return value + (double(mm) - double(nn));
				});
			});
		}
		else
		{
			stream_fns.emplace_back([prefix = std::move(prefix)](){ return make_value_stream(prefix); });
		}
		
		if (1.0 < std::fabs(value))
			stream_fns.emplace_back([value](){ return make_value_stream <double>({value / 2.0}); });
			
		return chain_streams <double>(std::move(stream_fns));
	}
	
	
	double float_strategy::from_basic(basic_value const &data) const
	{
		if (data.is_unsigned())
			return bits_to_float(data.as_unsigned());
			
		if (data.is_integer())
		{
			auto const value(data.as_integer());
			if (value < 0)
				throw bad_data("Negative value " + std::to_string(value) + " is not a bit pattern");
			return bits_to_float(bits_type(value));
		}
		
		throw bad_data("Expected an IEEE 754 bit pattern");
	}
	
	
	gaussian_float_strategy::gaussian_float_strategy():
		float_strategy(make_composite_parameter({
			{"mean", make_parameter <normal_parameter>(0.0, 1.0)}
		}))
	{
	}
	
	
	double gaussian_float_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		return dist::normal_variate(rng, pv["mean"].as_double(), 1.0);
	}
	
	
	fixed_bounded_float_strategy::fixed_bounded_float_strategy(double const lb, double const ub):
		float_strategy(
			std::make_shared <float_range>(lb, ub),
			make_composite_parameter({
				{"cut",			make_parameter <uniform_float_parameter>(0.0, 1.0)},
				{"leftwards",	make_parameter <biased_coin_parameter>(0.5)}
			})
		),
		m_lb(lb),
		m_ub(ub)
	{
		if (! (std::isfinite(lb) && std::isfinite(ub) && lb <= ub))
			throw invalid_range(boost::str(boost::format("Invalid range [%g, %g]") % lb % ub));
	}
	
	
	double fixed_bounded_float_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		// The cut is a fraction of the interval.
		auto const cut_point(std::lerp(m_lb, m_ub, pv["cut"].as_double()));
		auto const is_leftwards(pv["leftwards"].as_bool());
		auto const left(is_leftwards ? m_lb : cut_point);
		auto const right(is_leftwards ? cut_point : m_ub);
		auto const value(std::lerp(left, right, dist::random_unit(rng)));
		return std::clamp(value, m_lb, m_ub);
	}
	
	
	simplify_stream <double> fixed_bounded_float_strategy::simplify(double const &value) const
	{
		if (value == m_lb || !could_have_produced(value))
			return {};
			
		std::vector <double> candidates{m_lb};
		if (value != m_ub)
		{
			candidates.push_back(m_ub);
			auto const mid(std::lerp(m_lb, m_ub, 0.5));
			if (value != mid)
				candidates.push_back(mid);
		}
		
		return make_value_stream(std::move(candidates));
	}
	
	
	double fixed_bounded_float_strategy::from_basic(basic_value const &data) const
	{
		auto const value(float_strategy::from_basic(data));
		if (!could_have_produced(value))
			throw bad_data(boost::str(boost::format("Value %g not in range [%g, %g]") % value % m_lb % m_ub));
		return value;
	}
	
	
	bounded_float_strategy::bounded_float_strategy(std::shared_ptr <fixed_bounded_float_strategy const> inner):
		float_strategy(make_composite_parameter({
			{"left",	make_parameter <normal_parameter>(0.0, 1.0)},
			{"length",	make_parameter <exponential_parameter>(1.0)},
			{"spread",	inner->get_parameter_ptr()}
		})),
		m_inner(std::move(inner))
	{
	}
	
	
	double bounded_float_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		return pv["left"].as_double() + m_inner->produce_template(rng, pv["spread"]) * pv["length"].as_double();
	}
	
	
	exponential_float_strategy::exponential_float_strategy():
		float_strategy(make_composite_parameter({
			{"lambd",		make_parameter <gamma_parameter>(2.0, 50.0)},
			{"zero_point",	make_parameter <normal_parameter>(0.0, 1.0)},
			{"negative",	make_parameter <biased_coin_parameter>(0.5)}
		}))
	{
	}
	
	
	double exponential_float_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		auto value(dist::exponential_variate(rng, pv["lambd"].as_double()));
		if (pv["negative"].as_bool())
			value = -value;
		return pv["zero_point"].as_double() + value;
	}
	
	
	full_range_float_strategy::full_range_float_strategy():
		float_strategy(make_composite_parameter({
			{"negative_probability",	make_parameter <uniform_float_parameter>(0.0, 1.0)},
			{"subnormal_probability",	make_parameter <uniform_float_parameter>(0.0, 0.5)}
		}))
	{
	}
	
	
	double full_range_float_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		bits_type const sign(dist::biased_coin(rng, pv["negative_probability"].as_double()));
		bits_type exponent(0);
		if (!dist::biased_coin(rng, pv["subnormal_probability"].as_double()))
			exponent = dist::random_bits(rng, 11);
			
		return compose_float(sign, exponent, dist::random_bits(rng, 52));
	}
	
	
	small_float_strategy::small_float_strategy():
		float_strategy(make_composite_parameter({
			{"negative_probability",	make_parameter <uniform_float_parameter>(0.0, 1.0)},
			{"min_exponent",			make_parameter <uniform_int_parameter>(0, max_exponent())}
		}))
	{
	}
	
	
	int small_float_strategy::max_exponent()
	{
		static int const retval(find_max_exponent());
		return retval;
	}
	
	
	double small_float_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		auto const exponent(dist::uniform_int(rng, pv["min_exponent"].as_integer(), max_exponent()));
		auto value(std::ldexp(dist::random_unit(rng), -int(exponent)));
		if (dist::biased_coin(rng, pv["negative_probability"].as_double()))
			value = -value;
		return value;
	}
	
	
	just_int_float_strategy::just_int_float_strategy(search_strategy_ptr <integer_type> int_strategy):
		float_strategy(int_strategy->get_parameter_ptr()),
		m_int_strategy(std::move(int_strategy))
	{
	}
	
	
	double just_int_float_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		return double(m_int_strategy->reify(m_int_strategy->produce_template(rng, pv)));
	}
	
	
	nasty_float_strategy::nasty_float_strategy():
		float_strategy(make_parameter <non_empty_subset_parameter>(0, integer_type(elements().size() - 1)))
	{
	}
	
	
	auto nasty_float_strategy::elements() -> element_array const &
	{
		static element_array const retval{
			0.0,
			std::numeric_limits <double>::min(),
			-std::numeric_limits <double>::min(),
			std::numeric_limits <double>::infinity(),
			-std::numeric_limits <double>::infinity(),
			std::numeric_limits <double>::quiet_NaN()
		};
		return retval;
	}
	
	
	double nasty_float_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		auto const &subset(pv.as_subset());
		libbio_assert(!subset.empty());
		auto const idx(subset[dist::uniform_int(rng, 0, integer_type(subset.size() - 1))]);
		libbio_assert_lt(std::size_t(idx), elements().size());
		return elements()[idx];
	}
	
	
	wrapper_float_strategy::wrapper_float_strategy(search_strategy_ptr <double> sub_strategy):
		float_strategy(sub_strategy->get_parameter_ptr()),
		m_sub_strategy(std::move(sub_strategy))
	{
	}
	
	
	double wrapper_float_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		return m_sub_strategy->reify(m_sub_strategy->produce_template(rng, pv));
	}
}
