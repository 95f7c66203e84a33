/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_PARAMETERS_HH
#define QUICKSHRINK_PARAMETERS_HH

#include <memory>
#include <quickshrink/basic_types.hh>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>


namespace quickshrink {

	class composite_value; // Fwd.
	
	
	// A sampled parameter. Drawn once and then shared read-only by the draws of one run.
	class parameter_value
	{
	public:
		typedef std::vector <integer_type>				subset_type;	// Sorted, non-empty.
		typedef std::shared_ptr <composite_value const>	composite_ptr;
		typedef std::variant <
			double,
			integer_type,
			bool,
			subset_type,
			composite_ptr
		>												variant_type;
		
	protected:
		variant_type	m_value{};
		
	public:
		parameter_value() = default;
		explicit parameter_value(double const value): m_value(value) {}
		explicit parameter_value(integer_type const value): m_value(value) {}
		explicit parameter_value(bool const value): m_value(value) {}
		explicit parameter_value(subset_type &&value): m_value(std::move(value)) {}
		explicit parameter_value(composite_ptr value): m_value(std::move(value)) {}
		
		double as_double() const { return std::get <double>(m_value); }
		integer_type as_integer() const { return std::get <integer_type>(m_value); }
		bool as_bool() const { return std::get <bool>(m_value); }
		subset_type const &as_subset() const { return std::get <subset_type>(m_value); }
		composite_value const &as_composite() const { return *std::get <composite_ptr>(m_value); }
		
		// Field access for composite values.
		parameter_value const &operator[](std::string_view const name) const;
		parameter_value const &operator[](std::size_t const idx) const;
		
		variant_type const &value() const { return m_value; }
	};
	
	
	class composite_value
	{
	public:
		typedef std::vector <std::string>		name_vector;
		typedef std::vector <parameter_value>	value_vector;
		
	protected:
		name_vector		m_names;
		value_vector	m_values;
		
	public:
		composite_value() = default;
		
		composite_value(name_vector names, value_vector values);
		
		std::size_t size() const { return m_values.size(); }
		name_vector const &names() const { return m_names; }
		
		// Throws std::out_of_range if there is no field with the given name.
		parameter_value const &get(std::string_view const name) const;
		parameter_value const &get(std::size_t const idx) const { return m_values.at(idx); }
	};
	
	
	// Parameter specification, i.e. a distribution over parameter values.
	class parameter
	{
	public:
		virtual ~parameter() {}
		virtual parameter_value draw(random_source &rng) const = 0;
	};
	
	typedef std::shared_ptr <parameter const>	parameter_ptr;
	
	
	class uniform_float_parameter final : public parameter
	{
	protected:
		double	m_lb{};
		double	m_ub{};
		
	public:
		uniform_float_parameter(double const lb, double const ub);
		parameter_value draw(random_source &rng) const override;
	};
	
	
	class uniform_int_parameter final : public parameter
	{
	protected:
		integer_type	m_lb{};
		integer_type	m_ub{};
		
	public:
		uniform_int_parameter(integer_type const lb, integer_type const ub);
		parameter_value draw(random_source &rng) const override;
	};
	
	
	class normal_parameter final : public parameter
	{
	protected:
		double	m_mean{};
		double	m_sd{};
		
	public:
		normal_parameter(double const mean, double const sd);
		parameter_value draw(random_source &rng) const override;
	};
	
	
	class beta_parameter final : public parameter
	{
	protected:
		double	m_alpha{};
		double	m_beta{};
		
	public:
		beta_parameter(double const alpha, double const beta);
		parameter_value draw(random_source &rng) const override;
	};
	
	
	class gamma_parameter final : public parameter
	{
	protected:
		double	m_shape{};
		double	m_scale{};
		
	public:
		gamma_parameter(double const shape, double const scale);
		parameter_value draw(random_source &rng) const override;
	};
	
	
	class exponential_parameter final : public parameter
	{
	protected:
		double	m_rate{};
		
	public:
		explicit exponential_parameter(double const rate);
		parameter_value draw(random_source &rng) const override;
	};
	
	
	class biased_coin_parameter final : public parameter
	{
	protected:
		double	m_probability{};
		
	public:
		explicit biased_coin_parameter(double const probability);
		parameter_value draw(random_source &rng) const override;
	};
	
	
	// Each element of [lb, ub] is included with the activation chance.
	// If none was, one element is chosen uniformly.
	class non_empty_subset_parameter final : public parameter
	{
	public:
		// Ranges wider than this are sampled sparsely.
		constexpr static inline bits_type const DENSE_WIDTH_LIMIT{255};
		constexpr static inline bits_type const MAX_SPARSE_SIZE{1024};
		
	protected:
		integer_type	m_lb{};
		integer_type	m_ub{};
		double			m_activation_chance{};
		
	public:
		non_empty_subset_parameter(integer_type const lb, integer_type const ub, double const activation_chance = 0.5);
		parameter_value draw(random_source &rng) const override;
		
	protected:
		void draw_dense(random_source &rng, parameter_value::subset_type &dst) const;
		void draw_sparse(random_source &rng, parameter_value::subset_type &dst) const;
	};
	
	
	// Named aggregate. The fields are drawn independently in declaration order.
	class composite_parameter final : public parameter
	{
	public:
		typedef std::pair <std::string, parameter_ptr>	field_type;
		typedef std::vector <field_type>				field_vector;
		
	protected:
		field_vector	m_fields;
		
	public:
		composite_parameter() = default;
		explicit composite_parameter(field_vector fields);
		
		field_vector const &fields() const { return m_fields; }
		parameter_value draw(random_source &rng) const override;
	};
	
	
	template <typename t_parameter, typename ... t_args>
	parameter_ptr make_parameter(t_args && ... args)
	{
		return std::make_shared <t_parameter>(std::forward <t_args>(args)...);
	}
	
	
	inline parameter_ptr make_composite_parameter(composite_parameter::field_vector fields)
	{
		return std::make_shared <composite_parameter>(std::move(fields));
	}
}

#endif
