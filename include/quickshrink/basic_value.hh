/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_BASIC_VALUE_HH
#define QUICKSHRINK_BASIC_VALUE_HH

#include <algorithm>
#include <cereal/cereal.hpp>
#include <cereal/types/common.hpp>
#include <cstdint>
#include <istream>
#include <ostream>
#include <quickshrink/basic_types.hh>
#include <quickshrink/errors.hh>
#include <string>
#include <variant>
#include <vector>


namespace quickshrink {

	// Primitive encoding of a template, suitable for persisting.
	class basic_value
	{
	public:
		typedef std::vector <basic_value>	list_type;
		typedef std::variant <
			integer_type,
			bits_type,
			list_type
		>									variant_type;
		
		// Tags in the serialized form.
		enum class value_tag : std::uint8_t
		{
			INTEGER		= 1,
			UNSIGNED	= 2,
			LIST		= 3
		};
		
		// Deeper lists are rejected when loading.
		constexpr static inline std::size_t const MAX_LIST_DEPTH{32};
		
		friend bool operator==(basic_value const &lhs, basic_value const &rhs);
		friend bool operator<(basic_value const &lhs, basic_value const &rhs);
		
	protected:
		variant_type	m_value{};
		
	public:
		basic_value() = default;
		explicit basic_value(integer_type const value): m_value(value) {}
		explicit basic_value(bits_type const value): m_value(value) {}
		explicit basic_value(list_type value): m_value(std::move(value)) {}
		
		bool is_integer() const { return std::holds_alternative <integer_type>(m_value); }
		bool is_unsigned() const { return std::holds_alternative <bits_type>(m_value); }
		bool is_list() const { return std::holds_alternative <list_type>(m_value); }
		
		// These throw bad_data on mismatch.
		integer_type as_integer() const;
		bits_type as_unsigned() const;
		list_type const &as_list() const;
		list_type const &as_list(std::size_t const expected_size) const;
		
		variant_type const &value() const { return m_value; }
		
		template <typename t_archive>
		void save(t_archive &archive) const;
		
		// Throws bad_data if the lists are nested too deeply.
		template <typename t_archive>
		void load(t_archive &archive, std::size_t const depth = 0);
	};
	
	
	bool operator==(basic_value const &lhs, basic_value const &rhs);
	bool operator<(basic_value const &lhs, basic_value const &rhs);
	inline bool operator!=(basic_value const &lhs, basic_value const &rhs) { return !(lhs == rhs); }
	
	std::ostream &operator<<(std::ostream &os, basic_value const &value);
	
	
	// Postcondition: the values have been written to the stream with a portable binary archive.
	void save_basic_values(std::ostream &os, std::vector <basic_value> const &values);
	
	// Throws bad_data if the stream cannot be parsed.
	void load_basic_values(std::istream &is, std::vector <basic_value> &dst);
	
	
	template <typename t_archive>
	void basic_value::save(t_archive &archive) const
	{
		std::visit([&archive](auto const &val){
			typedef std::remove_cvref_t <decltype(val)> value_type;
			if constexpr (std::is_same_v <value_type, integer_type>)
				archive(value_tag::INTEGER, val);
			else if constexpr (std::is_same_v <value_type, bits_type>)
				archive(value_tag::UNSIGNED, val);
			else
			{
				archive(value_tag::LIST, cereal::make_size_tag(static_cast <cereal::size_type>(val.size())));
				for (auto const &item : val)
					item.save(archive);
			}
		}, m_value);
	}
	
	
	template <typename t_archive>
	void basic_value::load(t_archive &archive, std::size_t const depth)
	{
		value_tag tag{};
		archive(tag);
		switch (tag)
		{
			case value_tag::INTEGER:
			{
				integer_type val{};
				archive(val);
				m_value = val;
				break;
			}
			
			case value_tag::UNSIGNED:
			{
				bits_type val{};
				archive(val);
				m_value = val;
				break;
			}
			
			case value_tag::LIST:
			{
				if (MAX_LIST_DEPTH <= depth)
					throw bad_data("Basic value lists nested more than " + std::to_string(MAX_LIST_DEPTH) + " levels deep");
					
				cereal::size_type size{};
				archive(cereal::make_size_tag(size));
				list_type list;
				list.reserve(std::min(size, cereal::size_type(1024))); // Do not trust the size before reading.
				for (cereal::size_type i(0); i < size; ++i)
					list.emplace_back().load(archive, 1 + depth);
				m_value = std::move(list);
				break;
			}
			
			default:
				throw bad_data("Unknown basic value tag " + std::to_string(+static_cast <std::uint8_t>(tag)));
		}
	}
}

#endif
