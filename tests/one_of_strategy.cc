/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <catch2/catch.hpp>
#include <cstdint>
#include <quickshrink/integer_strategies.hh>
#include <quickshrink/one_of_strategy.hh>
#include <rapidcheck.h>
#include <rapidcheck/catch.h>
#include <stdexcept>
#include <vector>
#include "rapidcheck_additions.hh"

namespace qs	= quickshrink;


namespace {

	typedef qs::one_of_strategy <qs::integer_type>	integer_union;
	typedef std::vector <qs::integer_type>			integer_vector;
	
	
	qs::search_strategy_ptr <qs::integer_type> make_bounded(qs::integer_type const start, qs::integer_type const end)
	{
		return std::make_shared <qs::bounded_int_strategy const>(start, end);
	}
	
	
	std::shared_ptr <integer_union const> make_two_ranges(double const lhs_weight = 1.0, double const rhs_weight = 1.0)
	{
		return std::make_shared <integer_union const>(integer_union::branch_vector{
			{lhs_weight, make_bounded(0, 10)},
			{rhs_weight, make_bounded(100, 110)}
		});
	}
}


TEST_CASE("Union draws from its branches", "[one_of_strategy]")
{
	rc::prop("Produced values belong to some branch", [](std::uint64_t const seed){
		auto const strategy(make_two_ranges());
		qs::random_source rng(seed);
		auto const pv(strategy->draw_parameter(rng));
		for (std::size_t i(0); i < 20; ++i)
		{
			auto const value(strategy->produce_template(rng, pv));
			RC_ASSERT(((0 <= value && value <= 10) || (100 <= value && value <= 110)));
			RC_ASSERT(strategy->could_have_produced(value));
			RC_ASSERT(strategy->from_basic(strategy->to_basic(value)) == value);
			RC_ASSERT(strategy->reify(value) == value);
		}
	}, true);
	
	rc::prop("Simplification stays in the branch that produced the value", [](std::uint64_t const seed){
		auto const strategy(make_two_ranges());
		qs::random_source rng(seed);
		auto const pv(strategy->draw_parameter(rng));
		auto const value(strategy->produce_template(rng, pv));
		auto const is_high(100 <= value);
		for (auto const candidate : strategy->simplify(value).take())
		{
			if (is_high)
				RC_ASSERT((100 <= candidate && candidate <= 110));
			else
				RC_ASSERT((0 <= candidate && candidate <= 10));
		}
	}, true);
	
	rc::prop("Repeatedly taking the first candidate terminates", [](std::uint64_t const seed){
		auto const strategy(make_two_ranges());
		qs::random_source rng(seed);
		auto const pv(strategy->draw_parameter(rng));
		for (std::size_t i(0); i < 10; ++i)
			qs::tests::check_first_candidate_chain(*strategy, strategy->produce_template(rng, pv), 10);
	}, true);
	
	SECTION("Only enabled branches are used")
	{
		auto const strategy(make_two_ranges());
		qs::random_source rng(29);
		
		// Draw until a parameter enables exactly one branch.
		for (std::size_t i(0); i < 1000; ++i)
		{
			auto const pv(strategy->draw_parameter(rng));
			auto const &enabled(pv["enabled_children"].as_subset());
			if (1 != enabled.size())
				continue;
				
			auto const is_high(1 == enabled.front());
			for (std::size_t j(0); j < 20; ++j)
			{
				auto const value(strategy->produce_template(rng, pv));
				CHECK(is_high == (100 <= value));
			}
			break;
		}
	}
}


SCENARIO("Union simplifies with the attributed branch", "[one_of_strategy]")
{
	GIVEN("A union of two integer ranges")
	{
		auto const strategy(make_two_ranges());
		
		WHEN("a value of the second range is simplified")
		{
			THEN("the candidates are those of the second range")
			{
				CHECK(strategy->simplify(108).take() == integer_vector{107, 106, 105, 104, 103, 102, 101, 100, 102, 109, 110});
			}
		}
		
		WHEN("a value of the first range is simplified")
		{
			THEN("the candidates are those of the first range")
			{
				CHECK(strategy->simplify(3).take() == integer_vector{2, 1, 0});
			}
		}
		
		WHEN("the simplest value of a range is simplified")
		{
			THEN("there are no candidates")
			{
				CHECK(strategy->simplify(0).take().empty());
				CHECK(strategy->simplify(100).take().empty());
			}
		}
		
		WHEN("a value of neither range is given")
		{
			THEN("there are no candidates and the basic form cannot be made")
			{
				CHECK(!strategy->could_have_produced(50));
				CHECK(strategy->simplify(50).take().empty());
				CHECK_THROWS_AS(strategy->to_basic(50), qs::bad_data);
			}
		}
	}
	
	GIVEN("A union of overlapping ranges")
	{
		auto const strategy(std::make_shared <integer_union const>(integer_union::branch_vector{
			{1.0, make_bounded(5, 5)},
			{1.0, make_bounded(0, 10)}
		}));
		
		THEN("the first branch with candidates is used")
		{
			CHECK(strategy->simplify(5).take() == integer_vector{4, 3, 2, 1, 0});
		}
	}
}


SCENARIO("Union accepts the basic forms of its branches", "[one_of_strategy]")
{
	GIVEN("A union of two integer ranges")
	{
		auto const strategy(make_two_ranges());
		
		THEN("each branch is tried")
		{
			CHECK(5 == strategy->from_basic(qs::basic_value(qs::integer_type(5))));
			CHECK(105 == strategy->from_basic(qs::basic_value(qs::integer_type(105))));
		}
		
		THEN("data accepted by no branch is rejected")
		{
			CHECK_THROWS_AS(strategy->from_basic(qs::basic_value(qs::integer_type(50))), qs::bad_data);
			CHECK_THROWS_AS(strategy->from_basic(qs::basic_value(qs::bits_type(5))), qs::bad_data);
		}
	}
}


SCENARIO("Union validates its branches", "[one_of_strategy]")
{
	GIVEN("Invalid branch lists")
	{
		THEN("construction fails")
		{
			CHECK_THROWS_AS(integer_union(integer_union::branch_vector{}), std::invalid_argument);
			CHECK_THROWS_AS(make_two_ranges(0.0, 1.0), std::invalid_argument);
			CHECK_THROWS_AS(make_two_ranges(1.0, -2.0), std::invalid_argument);
			CHECK_THROWS_AS(integer_union(integer_union::branch_vector{{1.0, nullptr}}), std::invalid_argument);
		}
	}
	
	GIVEN("A valid union")
	{
		auto const strategy(make_two_ranges(1.0, 3.0));
		
		THEN("the descriptor lists the alternatives")
		{
			CHECK("one_of(integers_in_range(0, 10) | integers_in_range(100, 110))" == qs::to_string(strategy->get_descriptor()));
		}
		
		THEN("the parameter has the child parameters")
		{
			qs::random_source rng(31);
			auto const pv(strategy->draw_parameter(rng));
			CHECK(2 == pv["child_parameters"].as_composite().size());
			auto const &enabled(pv["enabled_children"].as_subset());
			REQUIRE(!enabled.empty());
			CHECK(0 <= enabled.front());
			CHECK(enabled.back() <= 1);
		}
	}
}
