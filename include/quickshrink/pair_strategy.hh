/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_PAIR_STRATEGY_HH
#define QUICKSHRINK_PAIR_STRATEGY_HH

#include <quickshrink/search_strategy.hh>
#include <utility>


namespace quickshrink {

	template <typename t_first, typename t_second>
	using pair_strategy_base = search_strategy <
		std::pair <typename t_first::template_type, typename t_second::template_type>,
		std::pair <typename t_first::value_type, typename t_second::value_type>
	>;
	
	
	// Templates are pairs of the component templates.
	// The basic form is a list with two items.
	template <typename t_first, typename t_second = t_first>
	class pair_strategy final : public pair_strategy_base <t_first, t_second>
	{
	public:
		typedef pair_strategy_base <t_first, t_second>	base_type;
		typedef typename base_type::template_type		template_type;
		typedef typename base_type::value_type			value_type;
		typedef std::shared_ptr <t_first const>			first_ptr;
		typedef std::shared_ptr <t_second const>		second_ptr;
		
	protected:
		first_ptr	m_first;
		second_ptr	m_second;
		
	public:
		pair_strategy(first_ptr first, second_ptr second):
			base_type(
				std::make_shared <pair_descriptor>(first->get_descriptor_ptr(), second->get_descriptor_ptr()),
				make_composite_parameter({
					{"first",	first->get_parameter_ptr()},
					{"second",	second->get_parameter_ptr()}
				})
			),
			m_first(std::move(first)),
			m_second(std::move(second))
		{
		}
		
		t_first const &first_strategy() const { return *m_first; }
		t_second const &second_strategy() const { return *m_second; }
		
		template_type produce_template(random_source &rng, parameter_value const &pv) const override
		{
			// Evaluation order of braced initializers is left to right.
			return template_type{
				m_first->produce_template(rng, pv["first"]),
				m_second->produce_template(rng, pv["second"])
			};
		}
		
		simplify_stream <template_type> simplify(template_type const &tpl) const override;
		
		basic_value to_basic(template_type const &tpl) const override
		{
			return basic_value(basic_value::list_type{m_first->to_basic(tpl.first), m_second->to_basic(tpl.second)});
		}
		
		template_type from_basic(basic_value const &data) const override
		{
			auto const &list(data.as_list(2));
			return template_type{m_first->from_basic(list[0]), m_second->from_basic(list[1])};
		}
		
		value_type reify(template_type const &tpl) const override
		{
			return value_type{m_first->reify(tpl.first), m_second->reify(tpl.second)};
		}
		
		bool could_have_produced(template_type const &tpl) const override
		{
			return m_first->could_have_produced(tpl.first) && m_second->could_have_produced(tpl.second);
		}
	};
	
	
	template <typename t_first, typename t_second>
	auto pair_strategy <t_first, t_second>::simplify(template_type const &tpl) const -> simplify_stream <template_type>
	{
		typedef std::function <simplify_stream <template_type>()> stream_fn;
		
		return chain_streams <template_type>(std::vector <stream_fn>{
			[first = m_first, tpl](){
				return transform_stream <template_type>(first->simplify(tpl.first), [tpl](auto const &val){
					return template_type{val, tpl.second};
				});
			},
			[second = m_second, tpl](){
				return transform_stream <template_type>(second->simplify(tpl.second), [tpl](auto const &val){
					return template_type{tpl.first, val};
				});
			}
		});
	}
	
	
	template <typename t_first, typename t_second>
	std::shared_ptr <pair_strategy <t_first, t_second> const> make_pair_strategy(
		std::shared_ptr <t_first const> first,
		std::shared_ptr <t_second const> second
	)
	{
		return std::make_shared <pair_strategy <t_first, t_second> const>(std::move(first), std::move(second));
	}
}

#endif
