/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_SEARCH_STRATEGY_HH
#define QUICKSHRINK_SEARCH_STRATEGY_HH

#include <memory>
#include <quickshrink/basic_types.hh>
#include <quickshrink/basic_value.hh>
#include <quickshrink/descriptors.hh>
#include <quickshrink/parameters.hh>
#include <quickshrink/simplify_stream.hh>
#include <typeindex>


namespace quickshrink {

	// Type-independent part of a strategy. Strategies are immutable after construction
	// and may be shared between concurrent runs that use separate random sources.
	class search_strategy_base
	{
	protected:
		descriptor_ptr	m_descriptor;
		parameter_ptr	m_parameter;
		
	public:
		search_strategy_base() = default;
		
		search_strategy_base(descriptor_ptr desc, parameter_ptr param):
			m_descriptor(std::move(desc)),
			m_parameter(std::move(param))
		{
		}
		
		virtual ~search_strategy_base() {}
		
		descriptor const &get_descriptor() const { return *m_descriptor; }
		descriptor_ptr const &get_descriptor_ptr() const { return m_descriptor; }
		parameter const &get_parameter() const { return *m_parameter; }
		parameter_ptr const &get_parameter_ptr() const { return m_parameter; }
		
		// Draw the parameter for one run.
		parameter_value draw_parameter(random_source &rng) const { return m_parameter->draw(rng); }
		
		virtual std::type_index template_type_index() const = 0;
		virtual std::type_index value_type_index() const = 0;
	};
	
	
	template <typename t_template, typename t_value = t_template>
	class search_strategy : public search_strategy_base
	{
	public:
		typedef t_template	template_type;
		typedef t_value		value_type;
		
	public:
		using search_strategy_base::search_strategy_base;
		
		std::type_index template_type_index() const final { return typeid(template_type); }
		std::type_index value_type_index() const final { return typeid(value_type); }
		
		virtual template_type produce_template(random_source &rng, parameter_value const &pv) const = 0;
		
		// Pure; calling again with the same template yields the same sequence.
		virtual simplify_stream <template_type> simplify(template_type const &) const { return {}; }
		
		virtual basic_value to_basic(template_type const &tpl) const = 0;
		virtual template_type from_basic(basic_value const &data) const = 0; // Throws bad_data.
		
		virtual value_type reify(template_type const &tpl) const = 0;
		
		virtual bool could_have_produced(template_type const &) const { return true; }
	};
	
	
	// Strategies whose templates are already the final values.
	template <typename t_value>
	class direct_search_strategy : public search_strategy <t_value, t_value>
	{
	public:
		using search_strategy <t_value, t_value>::search_strategy;
		
		t_value reify(t_value const &tpl) const override { return tpl; }
	};
	
	
	template <typename t_template, typename t_value = t_template>
	using search_strategy_ptr = std::shared_ptr <search_strategy <t_template, t_value> const>;
	
	typedef std::shared_ptr <search_strategy_base const>	search_strategy_base_ptr;
}

#endif
