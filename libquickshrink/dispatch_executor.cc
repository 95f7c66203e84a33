/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <libbio/dispatch/dispatch_fn.hh>
#include <quickshrink/dispatch_executor.hh>

namespace lb	= libbio;


namespace quickshrink {

	dispatch_executor::dispatch_executor(char const *label)
	{
		m_queue.reset(dispatch_queue_create(label, DISPATCH_QUEUE_SERIAL));
	}
	
	
	void dispatch_executor::submit(task_type task)
	{
		lb::dispatch_async_fn(*m_queue, std::move(task));
	}
}
