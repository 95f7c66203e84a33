/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_ONE_OF_STRATEGY_HH
#define QUICKSHRINK_ONE_OF_STRATEGY_HH

#include <libbio/assert.hh>
#include <quickshrink/distributions.hh>
#include <quickshrink/errors.hh>
#include <quickshrink/search_strategy.hh>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>


namespace quickshrink {

	// Weighted union of strategies with the same template and value types.
	// The parameter enables a random non-empty subset of the branches for each run
	// and carries the parameters of every branch.
	template <typename t_template, typename t_value = t_template>
	class one_of_strategy final : public search_strategy <t_template, t_value>
	{
	public:
		typedef search_strategy <t_template, t_value>		base_type;
		typedef search_strategy_ptr <t_template, t_value>	strategy_ptr;
		
		struct weighted_branch
		{
			double			weight{1.0};
			strategy_ptr	strategy;
		};
		
		typedef std::vector <weighted_branch>				branch_vector;
		
	protected:
		branch_vector	m_branches;
		
	public:
		// Throws std::invalid_argument if there are no branches or some weight is not positive.
		explicit one_of_strategy(branch_vector branches);
		
		branch_vector const &branches() const { return m_branches; }
		
		t_template produce_template(random_source &rng, parameter_value const &pv) const override;
		simplify_stream <t_template> simplify(t_template const &tpl) const override;
		basic_value to_basic(t_template const &tpl) const override { return attribute(tpl).to_basic(tpl); }
		t_template from_basic(basic_value const &data) const override;
		t_value reify(t_template const &tpl) const override { return attribute(tpl).reify(tpl); }
		bool could_have_produced(t_template const &tpl) const override;
		
	protected:
		static descriptor_ptr make_descriptor(branch_vector const &branches);
		static parameter_ptr make_parameter(branch_vector const &branches);
		
		// The first branch that could have produced the template.
		base_type const &attribute(t_template const &tpl) const;
	};
	
	
	template <typename t_template, typename t_value>
	one_of_strategy <t_template, t_value>::one_of_strategy(branch_vector branches):
		base_type(make_descriptor(branches), make_parameter(branches)),
		m_branches(std::move(branches))
	{
	}
	
	
	template <typename t_template, typename t_value>
	descriptor_ptr one_of_strategy <t_template, t_value>::make_descriptor(branch_vector const &branches)
	{
		if (branches.empty())
			throw std::invalid_argument("A union needs at least one branch");
			
		std::vector <descriptor_ptr> alternatives;
		alternatives.reserve(branches.size());
		for (auto const &branch : branches)
		{
			if (!branch.strategy)
				throw std::invalid_argument("Union branch strategy not set");
			if (! (0.0 < branch.weight))
				throw std::invalid_argument("Union branch weights must be positive");
			alternatives.push_back(branch.strategy->get_descriptor_ptr());
		}
		
		return std::make_shared <one_of_descriptor>(std::move(alternatives));
	}
	
	
	template <typename t_template, typename t_value>
	parameter_ptr one_of_strategy <t_template, t_value>::make_parameter(branch_vector const &branches)
	{
		composite_parameter::field_vector child_fields;
		child_fields.reserve(branches.size());
		for (std::size_t i(0); i < branches.size(); ++i)
			child_fields.emplace_back(std::to_string(i), branches[i].strategy->get_parameter_ptr());
			
		return make_composite_parameter({
			{"enabled_children",	quickshrink::make_parameter <non_empty_subset_parameter>(0, integer_type(branches.size() - 1), 0.5)},
			{"child_parameters",	make_composite_parameter(std::move(child_fields))}
		});
	}
	
	
	template <typename t_template, typename t_value>
	t_template one_of_strategy <t_template, t_value>::produce_template(random_source &rng, parameter_value const &pv) const
	{
		auto const &enabled(pv["enabled_children"].as_subset());
		libbio_assert(!enabled.empty());
		
		std::size_t branch_idx(enabled.front());
		if (1 < enabled.size())
		{
			std::vector <double> weights;
			weights.reserve(enabled.size());
			for (auto const idx : enabled)
				weights.push_back(m_branches[idx].weight);
				
			std::discrete_distribution <std::size_t> dist(weights.begin(), weights.end());
			branch_idx = enabled[dist(rng)];
		}
		
		libbio_assert_lt(branch_idx, m_branches.size());
		return m_branches[branch_idx].strategy->produce_template(rng, pv["child_parameters"][branch_idx]);
	}
	
	
	template <typename t_template, typename t_value>
	simplify_stream <t_template> one_of_strategy <t_template, t_value>::simplify(t_template const &tpl) const
	{
		// Use the first branch that accepts the template and has something to offer.
		for (auto const &branch : m_branches)
		{
			if (!branch.strategy->could_have_produced(tpl))
				continue;
				
			auto stream(branch.strategy->simplify(tpl));
			t_template head;
			if (stream.next(head))
				return prepend_to_stream(std::move(head), std::move(stream));
		}
		
		return {};
	}
	
	
	template <typename t_template, typename t_value>
	t_template one_of_strategy <t_template, t_value>::from_basic(basic_value const &data) const
	{
		for (auto const &branch : m_branches)
		{
			try
			{
				return branch.strategy->from_basic(data);
			}
			catch (bad_data const &)
			{
				// Try the next branch.
			}
		}
		
		throw bad_data("No branch of the union accepts the given data");
	}
	
	
	template <typename t_template, typename t_value>
	bool one_of_strategy <t_template, t_value>::could_have_produced(t_template const &tpl) const
	{
		for (auto const &branch : m_branches)
		{
			if (branch.strategy->could_have_produced(tpl))
				return true;
		}
		
		return false;
	}
	
	
	template <typename t_template, typename t_value>
	auto one_of_strategy <t_template, t_value>::attribute(t_template const &tpl) const -> base_type const &
	{
		for (auto const &branch : m_branches)
		{
			if (branch.strategy->could_have_produced(tpl))
				return *branch.strategy;
		}
		
		throw bad_data("No branch of the union could have produced the template");
	}
	
	
	template <typename t_template, typename t_value>
	search_strategy_ptr <t_template, t_value> make_one_of_strategy(typename one_of_strategy <t_template, t_value>::branch_vector branches)
	{
		return std::make_shared <one_of_strategy <t_template, t_value>>(std::move(branches));
	}
}

#endif
