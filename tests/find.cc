/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <algorithm>
#include <catch2/catch.hpp>
#include <optional>
#include <quickshrink/executor.hh>
#include <quickshrink/find.hh>
#include <quickshrink/integer_strategies.hh>
#include <quickshrink/strategy_table.hh>
#include <stdexcept>
#include <vector>

namespace qs	= quickshrink;


namespace {

	typedef qs::search_strategy_ptr <qs::integer_type>	integer_strategy_ptr;
	
	
	class test_error : public std::runtime_error
	{
	public:
		using std::runtime_error::runtime_error;
	};
	
	
	struct recording_delegate final : public qs::search_delegate
	{
		std::optional <qs::basic_value>	found;
		std::vector <qs::basic_value>	simplified;
		std::optional <qs::basic_value>	finished;
		std::size_t						examples_tried{};
		std::size_t						finished_shrink_count{};
		
		void found_satisfying_example(qs::basic_value const &example, std::size_t const examples_tried_) override
		{
			CHECK(!found);
			found = example;
			examples_tried = examples_tried_;
		}
		
		void simplified_example(qs::basic_value const &example, std::size_t const shrink_count) override
		{
			simplified.push_back(example);
			CHECK(simplified.size() == shrink_count);
		}
		
		void finished_simplifying(qs::basic_value const &example, std::size_t const shrink_count) override
		{
			CHECK(!finished);
			finished = example;
			finished_shrink_count = shrink_count;
		}
	};
	
	
	integer_strategy_ptr make_default_int_strategy()
	{
		auto const table(qs::make_default_strategy_table());
		return table.resolve_as <qs::integer_type>(qs::type_descriptor::of <qs::integer_type>());
	}
	
	
	qs::search_settings make_settings(std::size_t const max_examples, std::size_t const max_shrinks = 10'000)
	{
		qs::search_settings retval;
		retval.max_examples = max_examples;
		retval.max_shrinks = max_shrinks;
		return retval;
	}
}


SCENARIO("The simplest satisfying integer is found", "[find]")
{
	GIVEN("The default integer strategy")
	{
		auto const strategy(make_default_int_strategy());
		
		WHEN("any value is accepted")
		{
			THEN("the result is zero")
			{
				CHECK(0 == qs::find(strategy, [](qs::integer_type const) { return true; }));
			}
		}
		
		WHEN("values not less than 13 are accepted")
		{
			THEN("the result is 13")
			{
				CHECK(13 == qs::find(strategy, [](qs::integer_type const val) { return 13 <= val; }, make_settings(2000), qs::random_source(59)));
			}
		}
		
		WHEN("negative values are accepted")
		{
			THEN("the result is -1")
			{
				CHECK(-1 == qs::find(strategy, [](qs::integer_type const val) { return val < 0; }, make_settings(2000), qs::random_source(61)));
			}
		}
		
		WHEN("no value is accepted")
		{
			THEN("the search fails")
			{
				CHECK_THROWS_AS(qs::find(strategy, [](qs::integer_type const) { return false; }, make_settings(50)), qs::no_such_example);
			}
		}
		
		WHEN("the condition throws")
		{
			THEN("the exception is propagated")
			{
				CHECK_THROWS_AS(
					qs::find(strategy, [](qs::integer_type const) -> bool { throw test_error("condition failed"); }),
					test_error
				);
			}
		}
	}
	
	GIVEN("A bounded integer strategy")
	{
		integer_strategy_ptr const strategy(std::make_shared <qs::bounded_int_strategy const>(0, 1000));
		
		THEN("the least value that satisfies the condition is found")
		{
			CHECK(13 == qs::find(strategy, [](qs::integer_type const val) { return 13 <= val; }, make_settings(2000), qs::random_source(67)));
		}
		
		THEN("the number of simplifications is limited")
		{
			recording_delegate delegate;
			auto const res(qs::find(strategy, [](qs::integer_type const val) { return 13 <= val; }, make_settings(2000, 3), qs::random_source(67), delegate));
			REQUIRE(delegate.found);
			REQUIRE(delegate.finished);
			// Each successful simplification decrements the value by one.
			auto const found(delegate.found->as_integer());
			auto const expected_count(std::min <std::size_t>(3, found - 13));
			CHECK(expected_count == delegate.simplified.size());
			CHECK(expected_count == delegate.finished_shrink_count);
			CHECK(res == delegate.finished->as_integer());
			CHECK(qs::integer_type(found - expected_count) == res);
		}
	}
	
	GIVEN("Invalid settings")
	{
		qs::search_settings settings;
		settings.examples_per_parameter = 0;
		
		THEN("the search is not started")
		{
			CHECK_THROWS_AS(qs::find(make_default_int_strategy(), [](qs::integer_type const) { return true; }, settings), std::invalid_argument);
		}
	}
}


SCENARIO("The search delegate is notified", "[find]")
{
	GIVEN("A recording delegate")
	{
		recording_delegate delegate;
		auto const strategy(make_default_int_strategy());
		
		WHEN("a value is searched")
		{
			auto const res(qs::find(strategy, [](qs::integer_type const val) { return 13 <= val; }, make_settings(2000), qs::random_source(71), delegate));
			
			THEN("each phase has been reported")
			{
				REQUIRE(delegate.found);
				REQUIRE(delegate.finished);
				CHECK(13 == res);
				CHECK(13 == delegate.finished->as_integer());
				CHECK(1 <= delegate.examples_tried);
				CHECK(delegate.simplified.size() == delegate.finished_shrink_count);
				
				if (13 == delegate.found->as_integer())
					CHECK(delegate.simplified.empty());
				else
					CHECK(13 == delegate.simplified.back().as_integer());
					
				for (auto const &example : delegate.simplified)
					CHECK(13 <= example.as_integer());
			}
		}
	}
}


SCENARIO("The search can wait for the condition", "[find]")
{
	GIVEN("A condition evaluated on a run loop")
	{
		qs::run_loop loop;
		auto const strategy(make_default_int_strategy());
		std::size_t evaluation_count(0);
		
		WHEN("the search is started")
		{
			auto res(qs::find_async(
				strategy,
				[&loop, &evaluation_count](qs::integer_type const val){
					return qs::defer(loop, [&evaluation_count, val](){
						++evaluation_count;
						return 13 <= val;
					});
				},
				make_settings(2000),
				qs::random_source(73)
			));
			
			THEN("the result is available after running the loop")
			{
				CHECK(!res.is_complete());
				auto const task_count(loop.run());
				REQUIRE(res.is_complete());
				CHECK(13 == res.get());
				CHECK(evaluation_count == task_count);
			}
		}
		
		WHEN("the condition fails asynchronously")
		{
			auto res(qs::find_async(
				strategy,
				[&loop](qs::integer_type const) {
					return qs::defer(loop, []() -> bool { throw test_error("condition failed"); });
				}
			));
			
			THEN("the failure is propagated")
			{
				CHECK(1 == loop.run());
				REQUIRE(res.is_complete());
				CHECK(res.has_failed());
				CHECK_THROWS_AS(res.get(), test_error);
			}
		}
	}
	
	GIVEN("A custom driver")
	{
		auto const strategy(make_default_int_strategy());
		std::size_t driver_call_count(0);
		qs::driver_fn <qs::integer_type, bool> const driver([&driver_call_count](qs::suspendable_ptr <qs::integer_type, bool> body){
			++driver_call_count;
			return qs::drive <qs::integer_type, bool>(std::move(body));
		});
		
		THEN("the custom driver is used")
		{
			auto res(qs::find_async(
				strategy,
				[](qs::integer_type const) { return qs::pending_result <bool>::ready(true); },
				qs::search_settings(),
				qs::random_source(79),
				qs::default_search_delegate(),
				driver
			));
			
			CHECK(1 == driver_call_count);
			REQUIRE(res.is_complete());
			CHECK(0 == res.get());
		}
	}
	
	GIVEN("A driver that gives up")
	{
		auto const strategy(make_default_int_strategy());
		qs::driver_fn <qs::integer_type, bool> const driver([](qs::suspendable_ptr <qs::integer_type, bool>){
			return qs::pending_result <std::optional <qs::integer_type>>::ready(std::nullopt);
		});
		
		THEN("the search fails")
		{
			auto res(qs::find_async(
				strategy,
				[](qs::integer_type const) { return qs::pending_result <bool>::ready(true); },
				qs::search_settings(),
				qs::random_source(83),
				qs::default_search_delegate(),
				driver
			));
			
			REQUIRE(res.is_complete());
			CHECK_THROWS_AS(res.get(), qs::no_such_example);
		}
	}
}
