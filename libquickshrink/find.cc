/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <quickshrink/find.hh>


namespace quickshrink {

	search_delegate &default_search_delegate()
	{
		static search_delegate retval;
		return retval;
	}
}
