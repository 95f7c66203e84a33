/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <boost/format.hpp>
#include <quickshrink/descriptors.hh>


namespace quickshrink {

	std::string to_string(descriptor const &desc)
	{
		return boost::str(boost::format("%s") % desc);
	}
	
	
	void one_of_descriptor::output(std::ostream &os) const
	{
		os << "one_of(";
		bool is_first(true);
		for (auto const &alt : m_alternatives)
		{
			if (!is_first)
				os << " | ";
			os << *alt;
			is_first = false;
		}
		os << ')';
	}
}
