/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_BASIC_TYPES_HH
#define QUICKSHRINK_BASIC_TYPES_HH

#include <cstdint>
#include <limits>
#include <random>
#include <utility>	// std::pair


namespace quickshrink {

	typedef std::mt19937_64	random_source;
	typedef std::int64_t	integer_type;
	typedef std::uint64_t	bits_type;
	
	constexpr inline auto INTEGER_MIN{std::numeric_limits <integer_type>::min()};
	constexpr inline auto INTEGER_MAX{std::numeric_limits <integer_type>::max()};
	
	template <typename t_item>
	using pair = std::pair <t_item, t_item>;
}

#endif
