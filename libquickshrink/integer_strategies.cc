/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <algorithm>
#include <boost/format.hpp>
#include <libbio/assert.hh>
#include <quickshrink/distributions.hh>
#include <quickshrink/integer_strategies.hh>
#include <set>

namespace dist	= quickshrink::distributions;
namespace qs	= quickshrink;


namespace {

	class positive_integer_simplifier final : public qs::simplify_cursor <qs::integer_type>
	{
	protected:
		enum class state
		{
			ZERO,
			HALF,
			DESCENDING,
			SAMPLING,
			DONE
		};
		
	protected:
		qs::random_source			m_rng;
		std::set <qs::integer_type>	m_seen;
		qs::integer_type			m_value{};
		qs::integer_type			m_half{};
		qs::integer_type			m_next{};
		std::size_t					m_iterations{};
		state						m_state{state::ZERO};
		
	public:
		explicit positive_integer_simplifier(qs::integer_type const value):
			m_value(value),
			m_half(value / 2)
		{
			libbio_assert_lt(0, value);
		}
		
		bool next(qs::integer_type &dst) override;
	};
	
	
	bool positive_integer_simplifier::next(qs::integer_type &dst)
	{
		while (true)
		{
			switch (m_state)
			{
				case state::ZERO:
					dst = 0;
					m_state = (1 == m_value ? state::DONE : state::HALF);
					return true;
					
				case state::HALF:
				{
					dst = m_half;
					if (2 == m_value)
						m_state = state::DONE;
					else if (m_value <= qs::integer_type(qs::MAX_INTEGER_SIMPLIFY_ITERATIONS))
					{
						m_next = m_value - 1;
						m_state = state::DESCENDING;
					}
					else
					{
						// Seed with the value itself so that the sequence is reproducible.
						m_rng.seed(m_value);
						m_seen.insert(0);
						m_seen.insert(m_half);
						m_state = state::SAMPLING;
					}
					return true;
				}
				
				case state::DESCENDING:
				{
					while (0 < m_next)
					{
						auto const candidate(m_next--);
						if (candidate != m_half)
						{
							dst = candidate;
							return true;
						}
					}
					
					m_state = state::DONE;
					break;
				}
				
				case state::SAMPLING:
				{
					while (m_iterations < qs::MAX_INTEGER_SIMPLIFY_ITERATIONS)
					{
						++m_iterations;
						auto const candidate(dist::uniform_int(m_rng, 0, m_value - 1));
						if (m_seen.insert(candidate).second)
						{
							dst = candidate;
							return true;
						}
					}
					
					m_state = state::DONE;
					break;
				}
				
				case state::DONE:
					return false;
			}
		}
	}
	
	
	// Towards the start first, then the reflection and the upper part if the value is in the upper half.
	class bounded_integer_simplifier final : public qs::simplify_cursor <qs::integer_type>
	{
	protected:
		enum class state
		{
			DESCENDING,
			REFLECTION,
			ASCENDING,
			DONE
		};
		
	protected:
		qs::integer_type	m_start{};
		qs::integer_type	m_end{};
		qs::integer_type	m_value{};
		qs::integer_type	m_next{};
		state				m_state{state::DESCENDING};
		
	public:
		bounded_integer_simplifier(qs::integer_type const start, qs::integer_type const end, qs::integer_type const value):
			m_start(start),
			m_end(end),
			m_value(value),
			m_next(value)
		{
			libbio_assert_lte(start, value);
			libbio_assert_lte(value, end);
		}
		
		bool next(qs::integer_type &dst) override;
		
	protected:
		// Calculate in unsigned arithmetic to avoid overflow with wide ranges.
		qs::integer_type midpoint() const { return qs::integer_type(qs::bits_type(m_start) + (qs::bits_type(m_end) - qs::bits_type(m_start)) / 2); }
		qs::integer_type reflection() const { return qs::integer_type(qs::bits_type(m_start) + (qs::bits_type(m_end) - qs::bits_type(m_value))); }
	};
	
	
	bool bounded_integer_simplifier::next(qs::integer_type &dst)
	{
		while (true)
		{
			switch (m_state)
			{
				case state::DESCENDING:
				{
					if (m_next != m_start)
					{
						--m_next;
						dst = m_next;
						return true;
					}
					
					m_state = (midpoint() < m_value ? state::REFLECTION : state::DONE);
					break;
				}
				
				case state::REFLECTION:
				{
					dst = reflection();
					m_next = m_value;
					m_state = state::ASCENDING;
					return true;
				}
				
				case state::ASCENDING:
				{
					if (m_next != m_end)
					{
						++m_next;
						dst = m_next;
						return true;
					}
					
					m_state = state::DONE;
					break;
				}
				
				case state::DONE:
					return false;
			}
		}
	}
	
	
	qs::parameter_ptr make_bounded_int_parameter(qs::integer_type const start, qs::integer_type const end)
	{
		if (end < start)
			throw qs::invalid_range(boost::str(boost::format("Invalid range [%d, %d]") % start % end));
		
		// Expect a small subset.
		auto const size(1.0 + double(qs::bits_type(end) - qs::bits_type(start)));
		auto const activation_chance(std::min(0.5, 3.0 / size));
		return qs::make_parameter <qs::non_empty_subset_parameter>(start, end, activation_chance);
	}
}


namespace quickshrink {

	simplify_stream <integer_type> simplify_integer(integer_type const value)
	{
		if (0 == value)
			return {};
			
		if (0 < value)
			return simplify_stream <integer_type>(std::make_unique <positive_integer_simplifier>(value));
			
		// The most negative value has no positive counterpart; use the closest one.
		auto const magnitude(INTEGER_MIN == value ? INTEGER_MAX : -value);
		return chain_streams <integer_type>({
			[magnitude](){ return make_value_stream <integer_type>({magnitude}); },
			[magnitude](){
				return transform_stream <integer_type>(simplify_integer(magnitude), [](integer_type const val){ return -val; });
			}
		});
	}
	
	
	random_geometric_int_strategy::random_geometric_int_strategy():
		int_strategy(make_composite_parameter({
			{"negative_probability",	make_parameter <beta_parameter>(0.5, 0.5)},
			{"p",						make_parameter <beta_parameter>(0.2, 1.8)}
		}))
	{
	}
	
	
	integer_type random_geometric_int_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		// geometric() returns at most INTEGER_MAX, so negating is safe.
		auto value(integer_type(dist::geometric(rng, pv["p"].as_double())));
		if (dist::biased_coin(rng, pv["negative_probability"].as_double()))
			value = -value;
		return value;
	}
	
	
	bounded_int_strategy::bounded_int_strategy(integer_type const start, integer_type const end):
		direct_search_strategy <integer_type>(std::make_shared <integer_range>(start, end), make_bounded_int_parameter(start, end)),
		m_start(start),
		m_end(end)
	{
	}
	
	
	integer_type bounded_int_strategy::produce_template(random_source &rng, parameter_value const &pv) const
	{
		if (m_start == m_end)
			return m_start;
			
		auto const &subset(pv.as_subset());
		libbio_assert(!subset.empty());
		auto const idx(dist::uniform_int(rng, 0, integer_type(subset.size() - 1)));
		return subset[idx];
	}
	
	
	simplify_stream <integer_type> bounded_int_strategy::simplify(integer_type const &value) const
	{
		if (value == m_start || !could_have_produced(value))
			return {};
			
		return simplify_stream <integer_type>(std::make_unique <bounded_integer_simplifier>(m_start, m_end, value));
	}
	
	
	integer_type bounded_int_strategy::from_basic(basic_value const &data) const
	{
		auto const value(data.as_integer());
		if (!could_have_produced(value))
			throw bad_data(boost::str(boost::format("Value %d not in range [%d, %d]") % value % m_start % m_end));
		return value;
	}
}
