/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <algorithm>
#include <cereal/archives/portable_binary.hpp>
#include <ios>
#include <quickshrink/basic_value.hh>


namespace quickshrink {

	integer_type basic_value::as_integer() const
	{
		if (auto const *val = std::get_if <integer_type>(&m_value))
			return *val;
		throw bad_data("Expected a signed integer");
	}
	
	
	bits_type basic_value::as_unsigned() const
	{
		if (auto const *val = std::get_if <bits_type>(&m_value))
			return *val;
		throw bad_data("Expected an unsigned integer");
	}
	
	
	auto basic_value::as_list() const -> list_type const &
	{
		if (auto const *val = std::get_if <list_type>(&m_value))
			return *val;
		throw bad_data("Expected a list");
	}
	
	
	auto basic_value::as_list(std::size_t const expected_size) const -> list_type const &
	{
		auto const &list(as_list());
		if (list.size() != expected_size)
			throw bad_data("Expected a list of " + std::to_string(expected_size) + " items, got " + std::to_string(list.size()));
		return list;
	}
	
	
	bool operator==(basic_value const &lhs, basic_value const &rhs)
	{
		if (lhs.m_value.index() != rhs.m_value.index())
			return false;
			
		if (auto const *lhs_list = std::get_if <basic_value::list_type>(&lhs.m_value))
		{
			auto const &rhs_list(std::get <basic_value::list_type>(rhs.m_value));
			return std::equal(lhs_list->begin(), lhs_list->end(), rhs_list.begin(), rhs_list.end());
		}
		
		if (lhs.is_integer())
			return std::get <integer_type>(lhs.m_value) == std::get <integer_type>(rhs.m_value);
			
		return std::get <bits_type>(lhs.m_value) == std::get <bits_type>(rhs.m_value);
	}
	
	
	// Orders by kind first.
	bool operator<(basic_value const &lhs, basic_value const &rhs)
	{
		auto const lhs_idx(lhs.m_value.index());
		auto const rhs_idx(rhs.m_value.index());
		if (lhs_idx != rhs_idx)
			return lhs_idx < rhs_idx;
			
		if (auto const *lhs_list = std::get_if <basic_value::list_type>(&lhs.m_value))
		{
			auto const &rhs_list(std::get <basic_value::list_type>(rhs.m_value));
			return std::lexicographical_compare(lhs_list->begin(), lhs_list->end(), rhs_list.begin(), rhs_list.end());
		}
		
		if (lhs.is_integer())
			return std::get <integer_type>(lhs.m_value) < std::get <integer_type>(rhs.m_value);
			
		return std::get <bits_type>(lhs.m_value) < std::get <bits_type>(rhs.m_value);
	}
	
	
	std::ostream &operator<<(std::ostream &os, basic_value const &value)
	{
		std::visit([&os](auto const &val){
			typedef std::remove_cvref_t <decltype(val)> value_type;
			if constexpr (std::is_same_v <value_type, integer_type>)
				os << val;
			else if constexpr (std::is_same_v <value_type, bits_type>)
			{
				auto const flags(os.flags());
				os << "0x" << std::hex << val;
				os.flags(flags);
			}
			else
			{
				os << '[';
				bool is_first(true);
				for (auto const &item : val)
				{
					if (!is_first)
						os << ", ";
					os << item;
					is_first = false;
				}
				os << ']';
			}
		}, value.value());
		return os;
	}
	
	
	void save_basic_values(std::ostream &os, std::vector <basic_value> const &values)
	{
		cereal::PortableBinaryOutputArchive archive(os);
		archive(cereal::make_size_tag(static_cast <cereal::size_type>(values.size())));
		for (auto const &value : values)
			value.save(archive);
	}
	
	
	void load_basic_values(std::istream &is, std::vector <basic_value> &dst)
	{
		try
		{
			cereal::PortableBinaryInputArchive archive(is);
			cereal::size_type size{};
			archive(cereal::make_size_tag(size));
			dst.clear();
			for (cereal::size_type i(0); i < size; ++i)
				dst.emplace_back().load(archive);
		}
		catch (cereal::Exception const &exc)
		{
			throw bad_data(exc.what());
		}
	}
}
