/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <algorithm>
#include <catch2/catch.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <quickshrink/find.hh>
#include <quickshrink/float_strategies.hh>
#include <quickshrink/integer_strategies.hh>
#include <quickshrink/strategy_table.hh>
#include <rapidcheck.h>
#include <rapidcheck/catch.h>
#include <vector>
#include "rapidcheck_additions.hh"

namespace qs	= quickshrink;


namespace {

	typedef std::vector <double>	double_vector;
	
	
	double_vector simplify_all(double const value)
	{
		return qs::simplify_float(value).take();
	}
	
	
	bool is_same_bits(double const lhs, double const rhs)
	{
		return qs::float_to_bits(lhs) == qs::float_to_bits(rhs);
	}
	
	
	void test_bit_fidelity(qs::float_strategy const &strategy, double const value)
	{
		WHEN("the value is converted to the basic form and back")
		{
			auto const basic(strategy.to_basic(value));
			auto const value_(strategy.from_basic(basic));
			
			THEN("the bit pattern is preserved")
			{
				CHECK(basic.is_unsigned());
				CHECK(is_same_bits(value, value_));
			}
		}
	}
	
	
	// Checks produce, reify and the basic form of the given strategy with a few parameters.
	void check_produced_values(qs::float_strategy const &strategy, std::uint64_t const seed)
	{
		qs::random_source rng(seed);
		for (std::size_t i(0); i < 5; ++i)
		{
			auto const pv(strategy.draw_parameter(rng));
			for (std::size_t j(0); j < 10; ++j)
			{
				auto const value(strategy.produce_template(rng, pv));
				RC_ASSERT(strategy.could_have_produced(value));
				RC_ASSERT(is_same_bits(value, strategy.reify(value)));
				RC_ASSERT(is_same_bits(value, strategy.from_basic(strategy.to_basic(value))));
			}
		}
	}
	
	
	// The longest chain goes from negative infinity to zero via the largest finite values.
	template <typename t_strategy>
	void check_produced_chains(t_strategy const &strategy, std::uint64_t const seed, std::size_t const max_steps = 3)
	{
		qs::random_source rng(seed);
		for (std::size_t i(0); i < 5; ++i)
		{
			auto const pv(strategy.draw_parameter(rng));
			for (std::size_t j(0); j < 5; ++j)
				qs::tests::check_first_candidate_chain(strategy, strategy.produce_template(rng, pv), max_steps);
		}
	}
}


SCENARIO("Float bit patterns survive the basic form", "[float_strategies]")
{
	qs::gaussian_float_strategy const strategy;
	
	GIVEN("Zero")
	{
		test_bit_fidelity(strategy, 0.0);
	}
	
	GIVEN("Negative zero")
	{
		test_bit_fidelity(strategy, -0.0);
	}
	
	GIVEN("NaN")
	{
		test_bit_fidelity(strategy, std::numeric_limits <double>::quiet_NaN());
	}
	
	GIVEN("Positive infinity")
	{
		test_bit_fidelity(strategy, std::numeric_limits <double>::infinity());
	}
	
	GIVEN("Negative infinity")
	{
		test_bit_fidelity(strategy, -std::numeric_limits <double>::infinity());
	}
	
	GIVEN("The largest finite value")
	{
		test_bit_fidelity(strategy, std::numeric_limits <double>::max());
	}
	
	GIVEN("The smallest positive subnormal value")
	{
		test_bit_fidelity(strategy, std::numeric_limits <double>::denorm_min());
	}
}


TEST_CASE("Arbitrary bit patterns survive the basic form", "[float_strategies]")
{
	rc::prop("from_basic(to_basic(x)) preserves the bits of x", [](qs::tests::float_bits const fb){
		qs::full_range_float_strategy const strategy;
		auto const value(fb.value());
		return is_same_bits(value, strategy.from_basic(strategy.to_basic(value)));
	}, true);
}


SCENARIO("Float basic forms are validated", "[float_strategies]")
{
	qs::gaussian_float_strategy const strategy;
	
	GIVEN("A non-negative signed integer")
	{
		THEN("it is accepted as a bit pattern")
		{
			auto const bits(qs::float_to_bits(1.5));
			CHECK(1.5 == strategy.from_basic(qs::basic_value(qs::integer_type(bits))));
		}
	}
	
	GIVEN("A negative signed integer")
	{
		THEN("it is rejected")
		{
			CHECK_THROWS_AS(strategy.from_basic(qs::basic_value(qs::integer_type(-1))), qs::bad_data);
		}
	}
	
	GIVEN("A list")
	{
		THEN("it is rejected")
		{
			CHECK_THROWS_AS(strategy.from_basic(qs::basic_value(qs::basic_value::list_type{})), qs::bad_data);
		}
	}
}


SCENARIO("Special floats are simplified", "[float_strategies]")
{
	GIVEN("Zero")
	{
		THEN("there are no candidates")
		{
			CHECK(simplify_all(0.0).empty());
		}
	}
	
	GIVEN("NaN")
	{
		THEN("the candidates are zero and the infinities")
		{
			auto const candidates(simplify_all(std::numeric_limits <double>::quiet_NaN()));
			REQUIRE(3 == candidates.size());
			CHECK(0.0 == candidates[0]);
			CHECK(std::numeric_limits <double>::infinity() == candidates[1]);
			CHECK(-std::numeric_limits <double>::infinity() == candidates[2]);
		}
	}
	
	GIVEN("Positive infinity")
	{
		THEN("the candidate is the largest finite value")
		{
			CHECK(simplify_all(std::numeric_limits <double>::infinity()) == double_vector{std::numeric_limits <double>::max()});
		}
	}
	
	GIVEN("Negative infinity")
	{
		THEN("the candidate is the most negative finite value")
		{
			CHECK(simplify_all(-std::numeric_limits <double>::infinity()) == double_vector{-std::numeric_limits <double>::max()});
		}
	}
}


SCENARIO("Finite floats are simplified via their integral part", "[float_strategies]")
{
	GIVEN("A positive value with a fractional part")
	{
		THEN("zero, the truncated value, the integral candidates with the fraction and the half follow")
		{
			CHECK(simplify_all(1.5) == double_vector{0.0, 1.0, 0.5, 0.75});
		}
	}
	
	GIVEN("A negative value with a fractional part")
	{
		THEN("the positive counterpart comes first")
		{
			CHECK(simplify_all(-2.5) == double_vector{2.5, 0.0, -2.0, 1.5, -0.5, -1.5, -1.25});
		}
	}
	
	GIVEN("An integral value")
	{
		THEN("the value itself is not yielded")
		{
			CHECK(simplify_all(3.0) == double_vector{0.0, 0.0, 1.0, 2.0, 1.5});
		}
	}
	
	GIVEN("A value between zero and one")
	{
		THEN("zero is yielded both as itself and as the truncated value")
		{
			CHECK(simplify_all(0.25) == double_vector{0.0, 0.0});
		}
	}
	
	GIVEN("A value too large for the integral part to be simplified")
	{
		THEN("zero and the half are yielded")
		{
			CHECK(simplify_all(0x1p70) == double_vector{0.0, 0x1p69});
		}
	}
}


SCENARIO("Fixed interval floats", "[float_strategies]")
{
	GIVEN("An interval")
	{
		qs::fixed_bounded_float_strategy const strategy(-1.0, 3.0);
		
		THEN("the bounds are reported")
		{
			CHECK(-1.0 == strategy.lower_bound());
			CHECK(3.0 == strategy.upper_bound());
		}
		
		THEN("the candidates are the bounds and the midpoint")
		{
			CHECK(strategy.simplify(2.5).take() == double_vector{-1.0, 3.0, 1.0});
		}
		
		THEN("the upper bound is simplified to the lower bound only")
		{
			CHECK(strategy.simplify(3.0).take() == double_vector{-1.0});
		}
		
		THEN("the midpoint is simplified to the bounds")
		{
			CHECK(strategy.simplify(1.0).take() == double_vector{-1.0, 3.0});
		}
		
		THEN("the lower bound cannot be simplified")
		{
			CHECK(strategy.simplify(-1.0).take().empty());
		}
		
		THEN("values outside the interval are rejected")
		{
			CHECK_THROWS_AS(strategy.from_basic(strategy.to_basic(3.5)), qs::bad_data);
			CHECK(!strategy.could_have_produced(-1.5));
		}
	}
	
	GIVEN("Invalid bounds")
	{
		THEN("construction fails")
		{
			CHECK_THROWS_AS(qs::fixed_bounded_float_strategy(1.0, 0.0), qs::invalid_range);
			CHECK_THROWS_AS(qs::fixed_bounded_float_strategy(0.0, std::numeric_limits <double>::infinity()), qs::invalid_range);
			CHECK_THROWS_AS(qs::fixed_bounded_float_strategy(std::numeric_limits <double>::quiet_NaN(), 0.0), qs::invalid_range);
		}
	}
}


TEST_CASE("Fixed interval floats stay in the interval", "[float_strategies]")
{
	rc::prop("Produced values are in the interval", [](std::uint64_t const seed){
		auto const lb(*rc::gen::inRange(-1000, 1000));
		auto const length(*rc::gen::inRange(0, 1000));
		qs::fixed_bounded_float_strategy const strategy(lb, lb + length);
		qs::random_source rng(seed);
		for (std::size_t i(0); i < 5; ++i)
		{
			auto const pv(strategy.draw_parameter(rng));
			for (std::size_t j(0); j < 10; ++j)
			{
				auto const value(strategy.produce_template(rng, pv));
				RC_ASSERT(double(lb) <= value);
				RC_ASSERT(value <= double(lb + length));
				
				for (auto const candidate : strategy.simplify(value).take())
					RC_ASSERT(strategy.could_have_produced(candidate));
			}
		}
	}, true);
}


TEST_CASE("Float strategies produce values that survive the basic form", "[float_strategies]")
{
	rc::prop("Gaussian", [](std::uint64_t const seed){ check_produced_values(qs::gaussian_float_strategy(), seed); }, true);
	rc::prop("Bounded", [](std::uint64_t const seed){ check_produced_values(qs::bounded_float_strategy(), seed); }, true);
	rc::prop("Exponential", [](std::uint64_t const seed){ check_produced_values(qs::exponential_float_strategy(), seed); }, true);
	rc::prop("Full range", [](std::uint64_t const seed){ check_produced_values(qs::full_range_float_strategy(), seed); }, true);
	rc::prop("Small", [](std::uint64_t const seed){ check_produced_values(qs::small_float_strategy(), seed); }, true);
	rc::prop("Nasty", [](std::uint64_t const seed){ check_produced_values(qs::nasty_float_strategy(), seed); }, true);
}


TEST_CASE("Repeatedly taking the first float candidate terminates", "[float_strategies]")
{
	rc::prop("Arbitrary bit patterns", [](qs::tests::float_bits const fb){
		qs::tests::check_first_candidate_chain(qs::full_range_float_strategy(), fb.value(), 3);
	}, true);
	
	rc::prop("Gaussian", [](std::uint64_t const seed){ check_produced_chains(qs::gaussian_float_strategy(), seed); }, true);
	rc::prop("Bounded", [](std::uint64_t const seed){ check_produced_chains(qs::bounded_float_strategy(), seed); }, true);
	rc::prop("Exponential", [](std::uint64_t const seed){ check_produced_chains(qs::exponential_float_strategy(), seed); }, true);
	rc::prop("Full range", [](std::uint64_t const seed){ check_produced_chains(qs::full_range_float_strategy(), seed); }, true);
	rc::prop("Small", [](std::uint64_t const seed){ check_produced_chains(qs::small_float_strategy(), seed); }, true);
	rc::prop("Nasty", [](std::uint64_t const seed){ check_produced_chains(qs::nasty_float_strategy(), seed); }, true);
	
	rc::prop("Integer-derived", [](std::uint64_t const seed){
		check_produced_chains(qs::just_int_float_strategy(std::make_shared <qs::random_geometric_int_strategy const>()), seed);
	}, true);
	
	rc::prop("Fixed interval", [](std::uint64_t const seed){
		auto const lb(*rc::gen::inRange(-1000, 1000));
		auto const length(*rc::gen::inRange(0, 1000));
		check_produced_chains(qs::fixed_bounded_float_strategy(lb, lb + length), seed, 1);
	}, true);
	
	rc::prop("Default float strategy", [](std::uint64_t const seed){
		auto const table(qs::make_default_strategy_table());
		auto const strategy(table.resolve_as <double>(qs::type_descriptor::of <double>()));
		check_produced_chains(*strategy, seed);
	}, true);
}


SCENARIO("A NaN can be found", "[float_strategies]")
{
	GIVEN("The default float strategy")
	{
		auto const table(qs::make_default_strategy_table());
		auto const strategy(table.resolve_as <double>(qs::type_descriptor::of <double>()));
		
		WHEN("only NaNs are accepted")
		{
			qs::search_settings settings;
			settings.max_examples = 2000;
			
			THEN("the result is a NaN")
			{
				auto const value(qs::find(strategy, [](double const val){ return std::isnan(val); }, settings, qs::random_source(67)));
				CHECK(std::isnan(value));
			}
		}
	}
}


SCENARIO("Small floats", "[float_strategies]")
{
	GIVEN("The maximum exponent")
	{
		auto const max_exponent(qs::small_float_strategy::max_exponent());
		
		THEN("it is the exponent of the smallest subnormal value")
		{
			CHECK(1074 == max_exponent);
			CHECK(0.0 < std::ldexp(1.0, -max_exponent));
			CHECK(0.0 == std::ldexp(1.0, -max_exponent - 1));
		}
	}
	
	GIVEN("A small float strategy")
	{
		qs::small_float_strategy const strategy;
		qs::random_source rng(5);
		
		THEN("the produced values are less than one in magnitude")
		{
			for (std::size_t i(0); i < 10; ++i)
			{
				auto const pv(strategy.draw_parameter(rng));
				for (std::size_t j(0); j < 10; ++j)
					CHECK(std::fabs(strategy.produce_template(rng, pv)) < 1.0);
			}
		}
	}
}


SCENARIO("Nasty floats", "[float_strategies]")
{
	GIVEN("A nasty float strategy")
	{
		qs::nasty_float_strategy const strategy;
		qs::random_source rng(7);
		
		THEN("every produced value is one of the elements")
		{
			auto const &elements(qs::nasty_float_strategy::elements());
			for (std::size_t i(0); i < 20; ++i)
			{
				auto const pv(strategy.draw_parameter(rng));
				for (std::size_t j(0); j < 10; ++j)
				{
					auto const value(strategy.produce_template(rng, pv));
					auto const it(std::find_if(elements.begin(), elements.end(), [value](double const element){
						return is_same_bits(element, value);
					}));
					CHECK(elements.end() != it);
				}
			}
		}
		
		THEN("the elements cover the edge cases")
		{
			auto const &elements(qs::nasty_float_strategy::elements());
			CHECK(std::count_if(elements.begin(), elements.end(), [](double const val){ return std::isnan(val); }) == 1);
			CHECK(std::count_if(elements.begin(), elements.end(), [](double const val){ return std::isinf(val); }) == 2);
			CHECK(std::count(elements.begin(), elements.end(), std::numeric_limits <double>::min()) == 1);
			CHECK(std::count(elements.begin(), elements.end(), -std::numeric_limits <double>::min()) == 1);
		}
	}
}


SCENARIO("Integer-derived and wrapped floats", "[float_strategies]")
{
	GIVEN("A float strategy over geometric integers")
	{
		qs::just_int_float_strategy const strategy(std::make_shared <qs::random_geometric_int_strategy const>());
		qs::random_source rng(11);
		
		THEN("the produced values are integral")
		{
			for (std::size_t i(0); i < 10; ++i)
			{
				auto const pv(strategy.draw_parameter(rng));
				for (std::size_t j(0); j < 10; ++j)
				{
					auto const value(strategy.produce_template(rng, pv));
					CHECK(std::trunc(value) == value);
				}
			}
		}
	}
	
	GIVEN("A wrapper around a fixed interval strategy")
	{
		auto const inner(std::make_shared <qs::fixed_bounded_float_strategy const>(2.0, 4.0));
		qs::wrapper_float_strategy const strategy(inner);
		qs::random_source rng(13);
		
		THEN("the values come from the wrapped strategy")
		{
			CHECK(&strategy.sub_strategy() == inner.get());
			auto const pv(strategy.draw_parameter(rng));
			for (std::size_t i(0); i < 10; ++i)
			{
				auto const value(strategy.produce_template(rng, pv));
				CHECK(2.0 <= value);
				CHECK(value <= 4.0);
			}
		}
		
		THEN("the values are simplified as floats")
		{
			CHECK(strategy.simplify(3.0).take() == simplify_all(3.0));
		}
	}
}
