/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_DESCRIPTORS_HH
#define QUICKSHRINK_DESCRIPTORS_HH

#include <complex>
#include <memory>
#include <ostream>
#include <quickshrink/basic_types.hh>
#include <string>
#include <typeindex>
#include <vector>


namespace quickshrink {

	// Describes the shape of a value. Used as a key in strategy_table.
	class descriptor
	{
	public:
		virtual ~descriptor() {}
		virtual void output(std::ostream &os) const = 0;
	};
	
	typedef std::shared_ptr <descriptor const>	descriptor_ptr;
	
	
	inline std::ostream &operator<<(std::ostream &os, descriptor const &desc)
	{
		desc.output(os);
		return os;
	}
	
	std::string to_string(descriptor const &desc);
	
	
	template <typename t_type>
	struct type_name
	{
		static char const *name() { return typeid(t_type).name(); }
	};
	
	template <> struct type_name <integer_type> { static char const *name() { return "int"; } };
	template <> struct type_name <double> { static char const *name() { return "float"; } };
	template <> struct type_name <std::complex <double>> { static char const *name() { return "complex"; } };
	
	
	// Stands for “any value of the given type”; matched exactly.
	class type_descriptor final : public descriptor
	{
	protected:
		std::type_index	m_type;
		std::string		m_name;
		
	public:
		type_descriptor(std::type_index const type, std::string name):
			m_type(type),
			m_name(std::move(name))
		{
		}
		
		template <typename t_type>
		static type_descriptor of() { return type_descriptor(typeid(t_type), type_name <t_type>::name()); }
		
		template <typename t_type>
		static descriptor_ptr make() { return std::make_shared <type_descriptor>(of <t_type>()); }
		
		std::type_index type() const { return m_type; }
		std::string const &name() const { return m_name; }
		void output(std::ostream &os) const override { os << m_name; }
	};
	
	
	// Closed range.
	class integer_range final : public descriptor
	{
	protected:
		integer_type	m_start{};
		integer_type	m_end{};
		
	public:
		integer_range(integer_type const start, integer_type const end):
			m_start(start),
			m_end(end)
		{
		}
		
		integer_type start() const { return m_start; }
		integer_type end() const { return m_end; }
		void output(std::ostream &os) const override { os << "integers_in_range(" << m_start << ", " << m_end << ')'; }
	};
	
	
	// Closed range.
	class float_range final : public descriptor
	{
	protected:
		double	m_start{};
		double	m_end{};
		
	public:
		float_range(double const start, double const end):
			m_start(start),
			m_end(end)
		{
		}
		
		double start() const { return m_start; }
		double end() const { return m_end; }
		void output(std::ostream &os) const override { os << "floats_in_range(" << m_start << ", " << m_end << ')'; }
	};
	
	
	class pair_descriptor final : public descriptor
	{
	protected:
		descriptor_ptr	m_first;
		descriptor_ptr	m_second;
		
	public:
		pair_descriptor(descriptor_ptr first, descriptor_ptr second):
			m_first(std::move(first)),
			m_second(std::move(second))
		{
		}
		
		descriptor const &first() const { return *m_first; }
		descriptor const &second() const { return *m_second; }
		void output(std::ostream &os) const override { os << '(' << *m_first << ", " << *m_second << ')'; }
	};
	
	
	class one_of_descriptor final : public descriptor
	{
	protected:
		std::vector <descriptor_ptr>	m_alternatives;
		
	public:
		explicit one_of_descriptor(std::vector <descriptor_ptr> alternatives):
			m_alternatives(std::move(alternatives))
		{
		}
		
		std::vector <descriptor_ptr> const &alternatives() const { return m_alternatives; }
		void output(std::ostream &os) const override;
	};
}

#endif
