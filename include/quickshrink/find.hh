/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_FIND_HH
#define QUICKSHRINK_FIND_HH

#include <cstddef>
#include <functional>
#include <libbio/assert.hh>
#include <optional>
#include <quickshrink/async_driver.hh>
#include <quickshrink/basic_value.hh>
#include <quickshrink/errors.hh>
#include <quickshrink/search_strategy.hh>
#include <set>
#include <string>
#include <type_traits>
#include <utility>


namespace quickshrink {

	struct search_settings
	{
		std::size_t	max_examples{200};
		std::size_t	examples_per_parameter{10};	// A new parameter is drawn after this many examples.
		std::size_t	max_shrinks{500};			// Successful simplifications.
	};
	
	
	struct search_delegate
	{
		virtual ~search_delegate() {}
		virtual void found_satisfying_example(basic_value const &, std::size_t const) {}
		virtual void simplified_example(basic_value const &, std::size_t const) {}
		virtual void finished_simplifying(basic_value const &, std::size_t const) {}
	};
	
	// Does nothing.
	search_delegate &default_search_delegate();
	
	
	template <typename t_value>
	using async_condition_fn = std::function <pending_result <bool>(t_value const &)>;
	
	
	// Draws examples until one satisfies the condition, then simplifies it greedily.
	// Fails with no_such_example if none of max_examples draws satisfied the condition.
	template <typename t_template, typename t_value>
	class find_body final : public suspendable <t_value, bool>
	{
	public:
		typedef suspendable <t_value, bool>					base_type;
		typedef typename base_type::step_type				step_type;
		typedef typename base_type::resumption_type			resumption_type;
		typedef search_strategy_ptr <t_template, t_value>	strategy_ptr;
		
	protected:
		enum class phase : std::uint8_t
		{
			SEARCHING,
			SIMPLIFYING
		};
		
	protected:
		strategy_ptr					m_strategy;
		async_condition_fn <t_value>	m_condition;
		search_settings					m_settings;
		random_source					m_rng;
		search_delegate					*m_delegate{};		// Not owned.
		parameter_value					m_parameter;
		std::optional <t_template>		m_candidate;
		std::optional <t_template>		m_best;
		simplify_stream <t_template>	m_stream;
		std::set <basic_value>			m_seen;
		std::size_t						m_examples_tried{};
		std::size_t						m_shrink_count{};
		phase							m_phase{phase::SEARCHING};
		
	public:
		find_body(
			strategy_ptr strategy,
			async_condition_fn <t_value> condition,
			search_settings const &settings,
			random_source rng,
			search_delegate &delegate
		):
			m_strategy(std::move(strategy)),
			m_condition(std::move(condition)),
			m_settings(settings),
			m_rng(std::move(rng)),
			m_delegate(&delegate)
		{
			if (0 == m_settings.examples_per_parameter)
				throw std::invalid_argument("examples_per_parameter must be positive");
		}
		
		step_type start() override { return draw_next(); }
		step_type resume(resumption_type &res) override;
		
	protected:
		step_type draw_next();
		step_type try_next_simplification();
		step_type test_candidate(t_template &&tpl);
		void start_simplifying(t_template &&tpl);
	};
	
	
	template <typename t_template, typename t_value>
	auto find_body <t_template, t_value>::resume(resumption_type &res) -> step_type
	{
		libbio_assert(m_candidate);
		auto const is_satisfied(res.get()); // Rethrows failures of the condition.
		
		switch (m_phase)
		{
			case phase::SEARCHING:
			{
				if (!is_satisfied)
					return draw_next();
					
				auto tpl(std::move(*m_candidate));
				m_candidate.reset();
				auto basic(m_strategy->to_basic(tpl));
				m_delegate->found_satisfying_example(basic, m_examples_tried);
				m_seen.insert(std::move(basic));
				m_phase = phase::SIMPLIFYING;
				start_simplifying(std::move(tpl));
				return try_next_simplification();
			}
			
			case phase::SIMPLIFYING:
			{
				if (is_satisfied)
				{
					++m_shrink_count;
					auto tpl(std::move(*m_candidate));
					m_candidate.reset();
					m_delegate->simplified_example(m_strategy->to_basic(tpl), m_shrink_count);
					start_simplifying(std::move(tpl));
				}
				else
				{
					m_candidate.reset();
				}
				
				return try_next_simplification();
			}
		}
		
		throw std::logic_error("Unexpected search phase");
	}
	
	
	template <typename t_template, typename t_value>
	auto find_body <t_template, t_value>::draw_next() -> step_type
	{
		if (m_settings.max_examples <= m_examples_tried)
			throw no_such_example("No example satisfied the condition after " + std::to_string(m_examples_tried) + " draws");
			
		if (0 == m_examples_tried % m_settings.examples_per_parameter)
			m_parameter = m_strategy->draw_parameter(m_rng);
			
		++m_examples_tried;
		return test_candidate(m_strategy->produce_template(m_rng, m_parameter));
	}
	
	
	template <typename t_template, typename t_value>
	void find_body <t_template, t_value>::start_simplifying(t_template &&tpl)
	{
		m_stream = m_strategy->simplify(tpl);
		m_best.emplace(std::move(tpl));
	}
	
	
	template <typename t_template, typename t_value>
	auto find_body <t_template, t_value>::try_next_simplification() -> step_type
	{
		libbio_assert(m_best);
		if (m_shrink_count < m_settings.max_shrinks)
		{
			t_template tpl;
			while (m_stream.next(tpl))
			{
				// Skip candidates that have already been tried.
				if (!m_seen.insert(m_strategy->to_basic(tpl)).second)
					continue;
					
				return test_candidate(std::move(tpl));
			}
		}
		
		m_delegate->finished_simplifying(m_strategy->to_basic(*m_best), m_shrink_count);
		return step_type::done(m_strategy->reify(*m_best));
	}
	
	
	template <typename t_template, typename t_value>
	auto find_body <t_template, t_value>::test_candidate(t_template &&tpl) -> step_type
	{
		auto const value(m_strategy->reify(tpl));
		m_candidate.emplace(std::move(tpl));
		return step_type::await(m_condition(value));
	}
	
	
	// Returns the simplest value found that satisfies the condition.
	// The condition returns a pending_result <bool> and is driven with the given driver.
	template <typename t_template, typename t_value>
	pending_result <t_value> find_async(
		search_strategy_ptr <t_template, t_value> strategy,
		std::type_identity_t <async_condition_fn <t_value>> condition,
		search_settings const &settings,
		random_source rng,
		search_delegate &delegate,
		std::type_identity_t <driver_fn <t_value, bool>> const &driver = {}
	)
	{
		auto body(std::make_shared <find_body <t_template, t_value>>(
			std::move(strategy),
			std::move(condition),
			settings,
			std::move(rng),
			delegate
		));
		
		auto driven(driver ? driver(std::move(body)) : drive <t_value, bool>(std::move(body)));
		
		pending_result <t_value> retval;
		driven.add_callback([retval](pending_result <std::optional <t_value>> const &pr) mutable {
			if (auto error = pr.error())
				retval.fail(std::move(error));
			else if (pr.get())
				retval.complete(*pr.get());
			else
				retval.fail(std::make_exception_ptr(no_such_example("The search finished without a value")));
		});
		return retval;
	}
	
	
	template <typename t_template, typename t_value>
	pending_result <t_value> find_async(
		search_strategy_ptr <t_template, t_value> strategy,
		std::type_identity_t <async_condition_fn <t_value>> condition,
		search_settings const &settings = {},
		random_source rng = random_source()
	)
	{
		return find_async(std::move(strategy), std::move(condition), settings, std::move(rng), default_search_delegate());
	}
	
	
	// Synchronous variant; exceptions thrown by the condition are rethrown unchanged.
	template <typename t_template, typename t_value, typename t_condition>
	t_value find(
		search_strategy_ptr <t_template, t_value> strategy,
		t_condition &&condition,
		search_settings const &settings,
		random_source rng,
		search_delegate &delegate
	)
	{
		async_condition_fn <t_value> async_condition([condition = std::forward <t_condition>(condition)](t_value const &value){
			return pending_result <bool>::ready(bool(condition(value)));
		});
		
		auto const res(find_async(std::move(strategy), std::move(async_condition), settings, std::move(rng), delegate));
		libbio_always_assert(res.is_complete());
		return res.get();
	}
	
	
	template <typename t_template, typename t_value, typename t_condition>
	t_value find(
		search_strategy_ptr <t_template, t_value> strategy,
		t_condition &&condition,
		search_settings const &settings = {},
		random_source rng = random_source()
	)
	{
		return find(std::move(strategy), std::forward <t_condition>(condition), settings, std::move(rng), default_search_delegate());
	}
}

#endif
