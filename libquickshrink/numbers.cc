/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <quickshrink/complex_strategy.hh>
#include <quickshrink/float_strategies.hh>
#include <quickshrink/integer_strategies.hh>
#include <quickshrink/one_of_strategy.hh>
#include <quickshrink/strategy_table.hh>


namespace {

	namespace qs = quickshrink;
	
	
	qs::search_strategy_ptr <double> make_float_strategy(qs::strategy_table const &table)
	{
		typedef qs::one_of_strategy <double> union_type;
		
		auto const int_strategy(table.resolve_as <qs::integer_type>(qs::type_descriptor::of <qs::integer_type>()));
		
		// Nasty floats are listed twice to over-represent them.
		auto const nasty_floats(std::make_shared <qs::nasty_float_strategy const>());
		auto const float_union(qs::make_one_of_strategy <double>(union_type::branch_vector{
			{1.0, std::make_shared <qs::gaussian_float_strategy const>()},
			{1.0, std::make_shared <qs::bounded_float_strategy const>()},
			{1.0, std::make_shared <qs::exponential_float_strategy const>()},
			{1.0, std::make_shared <qs::just_int_float_strategy const>(int_strategy)},
			{1.0, nasty_floats},
			{1.0, nasty_floats},
			{1.0, std::make_shared <qs::full_range_float_strategy const>()},
			{1.0, std::make_shared <qs::small_float_strategy const>()}
		}));
		
		return std::make_shared <qs::wrapper_float_strategy const>(float_union);
	}
}


namespace quickshrink {

	void register_numeric_strategies(strategy_table &table)
	{
		table.register_for_type <integer_type>([](strategy_table const &, descriptor const &){
			return std::make_shared <random_geometric_int_strategy const>();
		});
		
		table.register_for_type <double>([](strategy_table const &table_, descriptor const &){
			return make_float_strategy(table_);
		});
		
		table.register_for_type <std::complex <double>>([](strategy_table const &table_, descriptor const &){
			return std::make_shared <complex_strategy const>(table_.resolve_as <double>(type_descriptor::of <double>()));
		});
		
		table.register_for_instances <integer_range>([](strategy_table const &, descriptor const &desc){
			auto const &range(static_cast <integer_range const &>(desc));
			return std::make_shared <bounded_int_strategy const>(range.start(), range.end());
		});
		
		table.register_for_instances <float_range>([](strategy_table const &, descriptor const &desc){
			auto const &range(static_cast <float_range const &>(desc));
			return std::make_shared <fixed_bounded_float_strategy const>(range.start(), range.end());
		});
	}
}
