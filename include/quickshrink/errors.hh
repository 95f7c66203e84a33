/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_ERRORS_HH
#define QUICKSHRINK_ERRORS_HH

#include <stdexcept>


namespace quickshrink {

	// Persisted or transported data does not match the strategy.
	// Callers should discard the example.
	class bad_data : public std::runtime_error
	{
	public:
		using std::runtime_error::runtime_error;
	};
	
	
	class invalid_range : public std::invalid_argument
	{
	public:
		using std::invalid_argument::invalid_argument;
	};
	
	
	class descriptor_not_found : public std::out_of_range
	{
	public:
		using std::out_of_range::out_of_range;
	};
	
	
	class strategy_type_mismatch : public std::logic_error
	{
	public:
		using std::logic_error::logic_error;
	};
	
	
	class no_such_example : public std::runtime_error
	{
	public:
		using std::runtime_error::runtime_error;
	};
}

#endif
