/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_MAPPED_STRATEGY_HH
#define QUICKSHRINK_MAPPED_STRATEGY_HH

#include <quickshrink/search_strategy.hh>


namespace quickshrink {

	// Uses the templates of the inner strategy and packs the inner values
	// into the final value in reify(). Everything else is delegated.
	template <typename t_inner, typename t_value>
	class mapped_search_strategy : public search_strategy <typename t_inner::template_type, t_value>
	{
	public:
		typedef search_strategy <typename t_inner::template_type, t_value>	base_type;
		typedef typename t_inner::template_type								template_type;
		typedef typename t_inner::value_type								inner_value_type;
		typedef std::shared_ptr <t_inner const>								inner_ptr;
		
	protected:
		inner_ptr	m_inner;
		
	public:
		mapped_search_strategy(descriptor_ptr desc, inner_ptr inner):
			base_type(std::move(desc), inner->get_parameter_ptr()),
			m_inner(std::move(inner))
		{
		}
		
		t_inner const &inner_strategy() const { return *m_inner; }
		
		virtual t_value pack(inner_value_type const &value) const = 0;
		
		template_type produce_template(random_source &rng, parameter_value const &pv) const override { return m_inner->produce_template(rng, pv); }
		simplify_stream <template_type> simplify(template_type const &tpl) const override { return m_inner->simplify(tpl); }
		basic_value to_basic(template_type const &tpl) const override { return m_inner->to_basic(tpl); }
		template_type from_basic(basic_value const &data) const override { return m_inner->from_basic(data); }
		t_value reify(template_type const &tpl) const override { return pack(m_inner->reify(tpl)); }
		bool could_have_produced(template_type const &tpl) const override { return m_inner->could_have_produced(tpl); }
	};
}

#endif
