/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <libbio/assert.hh>
#include <quickshrink/strategy_table.hh>


namespace quickshrink {

	search_strategy_base_ptr strategy_table::resolve(descriptor const &desc) const
	{
		// Exact type match first.
		if (auto const *type_desc = dynamic_cast <type_descriptor const *>(&desc))
		{
			auto const it(m_type_factories.find(type_desc->type()));
			if (m_type_factories.end() != it)
			{
				auto retval(it->second(*this, desc));
				libbio_assert(retval);
				return retval;
			}
		}
		
		for (auto const &[predicate, factory] : m_instance_rules)
		{
			if (predicate(desc))
			{
				auto retval(factory(*this, desc));
				libbio_assert(retval);
				return retval;
			}
		}
		
		throw descriptor_not_found("No strategy registered for " + to_string(desc));
	}
	
	
	strategy_table make_default_strategy_table()
	{
		strategy_table retval;
		register_numeric_strategies(retval);
		return retval;
	}
}
