/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_STRATEGY_TABLE_HH
#define QUICKSHRINK_STRATEGY_TABLE_HH

#include <functional>
#include <memory>
#include <quickshrink/descriptors.hh>
#include <quickshrink/errors.hh>
#include <quickshrink/search_strategy.hh>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>


namespace quickshrink {

	// Resolves descriptors to strategies. Populate before use; resolving
	// from multiple threads is safe as long as nothing is registered at the same time.
	class strategy_table
	{
	public:
		typedef std::function <search_strategy_base_ptr(strategy_table const &, descriptor const &)>	factory_type;
		typedef std::function <bool(descriptor const &)>												predicate_type;
		
	protected:
		typedef std::unordered_map <std::type_index, factory_type>	type_factory_map;
		typedef std::pair <predicate_type, factory_type>			instance_rule;
		typedef std::vector <instance_rule>							instance_rule_vector;
		
	protected:
		type_factory_map		m_type_factories;
		instance_rule_vector	m_instance_rules;
		
	public:
		// Matched against type_descriptors with the given type.
		void register_for_type(std::type_index const type, factory_type factory) { m_type_factories.insert_or_assign(type, std::move(factory)); }
		
		template <typename t_type>
		void register_for_type(factory_type factory) { register_for_type(typeid(t_type), std::move(factory)); }
		
		// Matched against instances of t_descriptor (including subclasses) in registration order.
		template <typename t_descriptor>
		void register_for_instances(factory_type factory);
		
		// Throws descriptor_not_found.
		search_strategy_base_ptr resolve(descriptor const &desc) const;
		
		// Throws descriptor_not_found or strategy_type_mismatch.
		template <typename t_template, typename t_value = t_template>
		search_strategy_ptr <t_template, t_value> resolve_as(descriptor const &desc) const;
	};
	
	
	// Adds the strategies for int, float, complex, integer_range and float_range.
	void register_numeric_strategies(strategy_table &table);
	
	strategy_table make_default_strategy_table();
	
	
	template <typename t_descriptor>
	void strategy_table::register_for_instances(factory_type factory)
	{
		m_instance_rules.emplace_back(
			[](descriptor const &desc){ return nullptr != dynamic_cast <t_descriptor const *>(&desc); },
			std::move(factory)
		);
	}
	
	
	template <typename t_template, typename t_value>
	search_strategy_ptr <t_template, t_value> strategy_table::resolve_as(descriptor const &desc) const
	{
		auto strategy(resolve(desc));
		auto retval(std::dynamic_pointer_cast <search_strategy <t_template, t_value> const>(std::move(strategy)));
		if (!retval)
			throw strategy_type_mismatch("Strategy for " + to_string(desc) + " does not have the requested types");
		return retval;
	}
}

#endif
