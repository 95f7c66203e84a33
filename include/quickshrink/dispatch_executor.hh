/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_DISPATCH_EXECUTOR_HH
#define QUICKSHRINK_DISPATCH_EXECUTOR_HH

#include <dispatch/dispatch.h>
#include <libbio/dispatch/dispatch_ptr.hh>
#include <quickshrink/executor.hh>


namespace quickshrink {

	// Runs the tasks on a serial libdispatch queue.
	class dispatch_executor final : public executor
	{
	protected:
		libbio::dispatch_ptr <dispatch_queue_t>	m_queue;
		
	public:
		explicit dispatch_executor(char const *label);
		
		explicit dispatch_executor(libbio::dispatch_ptr <dispatch_queue_t> queue):
			m_queue(std::move(queue))
		{
		}
		
		dispatch_queue_t queue() const { return *m_queue; }
		void submit(task_type task) override;
	};
}

#endif
