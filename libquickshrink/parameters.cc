/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <algorithm>
#include <boost/format.hpp>
#include <cmath>
#include <libbio/assert.hh>
#include <quickshrink/distributions.hh>
#include <quickshrink/errors.hh>
#include <quickshrink/parameters.hh>

namespace dist	= quickshrink::distributions;


namespace {

	void check_probability(double const probability, char const *name)
	{
		if (! (0.0 <= probability && probability <= 1.0))
			throw std::invalid_argument(boost::str(boost::format("Invalid %s %g; expected a value in [0, 1]") % name % probability));
	}
	
	
	void check_positive(double const value, char const *name)
	{
		if (! (0.0 < value))
			throw std::invalid_argument(boost::str(boost::format("Invalid %s %g; expected a positive value") % name % value));
	}
	
	
	template <typename t_value>
	void check_range(t_value const lb, t_value const ub)
	{
		if (! (lb <= ub))
			throw quickshrink::invalid_range(boost::str(boost::format("Invalid range [%s, %s]") % lb % ub));
	}
}


namespace quickshrink {

	parameter_value const &parameter_value::operator[](std::string_view const name) const
	{
		return as_composite().get(name);
	}
	
	
	parameter_value const &parameter_value::operator[](std::size_t const idx) const
	{
		return as_composite().get(idx);
	}
	
	
	composite_value::composite_value(name_vector names, value_vector values):
		m_names(std::move(names)),
		m_values(std::move(values))
	{
		libbio_always_assert_eq(m_names.size(), m_values.size());
	}
	
	
	parameter_value const &composite_value::get(std::string_view const name) const
	{
		auto const it(std::find(m_names.begin(), m_names.end(), name));
		if (m_names.end() == it)
			throw std::out_of_range("No parameter field named “" + std::string(name) + "”");
			
		return m_values[std::distance(m_names.begin(), it)];
	}
	
	
	uniform_float_parameter::uniform_float_parameter(double const lb, double const ub):
		m_lb(lb),
		m_ub(ub)
	{
		check_range(lb, ub);
	}
	
	
	parameter_value uniform_float_parameter::draw(random_source &rng) const
	{
		return parameter_value(dist::uniform_float(rng, m_lb, m_ub));
	}
	
	
	uniform_int_parameter::uniform_int_parameter(integer_type const lb, integer_type const ub):
		m_lb(lb),
		m_ub(ub)
	{
		check_range(lb, ub);
	}
	
	
	parameter_value uniform_int_parameter::draw(random_source &rng) const
	{
		return parameter_value(dist::uniform_int(rng, m_lb, m_ub));
	}
	
	
	normal_parameter::normal_parameter(double const mean, double const sd):
		m_mean(mean),
		m_sd(sd)
	{
		if (! (0.0 <= sd))
			throw std::invalid_argument("Standard deviation must be non-negative");
	}
	
	
	parameter_value normal_parameter::draw(random_source &rng) const
	{
		return parameter_value(dist::normal_variate(rng, m_mean, m_sd));
	}
	
	
	beta_parameter::beta_parameter(double const alpha, double const beta):
		m_alpha(alpha),
		m_beta(beta)
	{
		check_positive(alpha, "alpha");
		check_positive(beta, "beta");
	}
	
	
	parameter_value beta_parameter::draw(random_source &rng) const
	{
		return parameter_value(dist::beta_variate(rng, m_alpha, m_beta));
	}
	
	
	gamma_parameter::gamma_parameter(double const shape, double const scale):
		m_shape(shape),
		m_scale(scale)
	{
		check_positive(shape, "shape");
		check_positive(scale, "scale");
	}
	
	
	parameter_value gamma_parameter::draw(random_source &rng) const
	{
		return parameter_value(dist::gamma_variate(rng, m_shape, m_scale));
	}
	
	
	exponential_parameter::exponential_parameter(double const rate):
		m_rate(rate)
	{
		check_positive(rate, "rate");
	}
	
	
	parameter_value exponential_parameter::draw(random_source &rng) const
	{
		return parameter_value(dist::exponential_variate(rng, m_rate));
	}
	
	
	biased_coin_parameter::biased_coin_parameter(double const probability):
		m_probability(probability)
	{
		check_probability(probability, "probability");
	}
	
	
	parameter_value biased_coin_parameter::draw(random_source &rng) const
	{
		return parameter_value(dist::biased_coin(rng, m_probability));
	}
	
	
	non_empty_subset_parameter::non_empty_subset_parameter(
		integer_type const lb,
		integer_type const ub,
		double const activation_chance
	):
		m_lb(lb),
		m_ub(ub),
		m_activation_chance(activation_chance)
	{
		check_range(lb, ub);
		check_probability(activation_chance, "activation chance");
	}
	
	
	void non_empty_subset_parameter::draw_dense(random_source &rng, parameter_value::subset_type &dst) const
	{
		for (integer_type val(m_lb); true; ++val)
		{
			if (dist::biased_coin(rng, m_activation_chance))
				dst.push_back(val);
				
			if (val == m_ub)
				break;
		}
	}
	
	
	void non_empty_subset_parameter::draw_sparse(random_source &rng, parameter_value::subset_type &dst) const
	{
		// The element count is binomially distributed; take the same number of uniform samples.
		// The width does not count the last element but the difference is negligible here.
		bits_type const width(bits_type(m_ub) - bits_type(m_lb));
		std::binomial_distribution <bits_type> count_dist(width, m_activation_chance);
		auto const count(std::min(count_dist(rng), MAX_SPARSE_SIZE));
		
		dst.reserve(count);
		for (bits_type i(0); i < count; ++i)
			dst.push_back(dist::uniform_int(rng, m_lb, m_ub));
			
		std::sort(dst.begin(), dst.end());
		dst.erase(std::unique(dst.begin(), dst.end()), dst.end());
	}
	
	
	parameter_value non_empty_subset_parameter::draw(random_source &rng) const
	{
		parameter_value::subset_type retval;
		bits_type const width(bits_type(m_ub) - bits_type(m_lb));
		if (width <= DENSE_WIDTH_LIMIT)
			draw_dense(rng, retval);
		else
			draw_sparse(rng, retval);
			
		if (retval.empty())
			retval.push_back(dist::uniform_int(rng, m_lb, m_ub));
			
		libbio_assert(std::is_sorted(retval.begin(), retval.end()));
		return parameter_value(std::move(retval));
	}
	
	
	composite_parameter::composite_parameter(field_vector fields):
		m_fields(std::move(fields))
	{
		for (auto const &field : m_fields)
		{
			if (!field.second)
				throw std::invalid_argument("Composite parameter field “" + field.first + "” has no parameter");
		}
	}
	
	
	parameter_value composite_parameter::draw(random_source &rng) const
	{
		composite_value::name_vector names;
		composite_value::value_vector values;
		names.reserve(m_fields.size());
		values.reserve(m_fields.size());
		
		for (auto const &[name, param] : m_fields)
		{
			names.push_back(name);
			values.push_back(param->draw(rng));
		}
		
		return parameter_value(std::make_shared <composite_value const>(std::move(names), std::move(values)));
	}
}
