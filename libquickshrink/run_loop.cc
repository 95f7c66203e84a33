/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <quickshrink/executor.hh>


namespace quickshrink {

	bool run_loop::run_one()
	{
		if (m_tasks.empty())
			return false;
			
		auto task(std::move(m_tasks.front()));
		m_tasks.pop_front();
		task();
		return true;
	}
	
	
	std::size_t run_loop::run()
	{
		std::size_t retval(0);
		while (run_one())
			++retval;
		return retval;
	}
}
