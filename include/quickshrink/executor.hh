/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_EXECUTOR_HH
#define QUICKSHRINK_EXECUTOR_HH

#include <deque>
#include <exception>
#include <functional>
#include <optional>
#include <quickshrink/pending_result.hh>
#include <type_traits>


namespace quickshrink {

	class executor
	{
	public:
		typedef std::function <void()>	task_type;
		
	public:
		virtual ~executor() {}
		virtual void submit(task_type task) = 0;
	};
	
	
	// Single-threaded FIFO queue of tasks, run by the owner.
	class run_loop final : public executor
	{
	protected:
		std::deque <task_type>	m_tasks;
		
	public:
		void submit(task_type task) override { m_tasks.emplace_back(std::move(task)); }
		
		bool empty() const { return m_tasks.empty(); }
		std::size_t size() const { return m_tasks.size(); }
		
		// Returns false if there was nothing to run.
		bool run_one();
		
		// Runs until the queue is empty, including tasks submitted by the tasks.
		// Returns the number of tasks run.
		std::size_t run();
	};
	
	
	// Calls fn on the executor and completes the returned result with its return value
	// or with the exception it threw.
	template <typename t_fn, typename t_value = std::invoke_result_t <t_fn>>
	pending_result <t_value> defer(executor &exec, t_fn &&fn)
	{
		pending_result <t_value> retval;
		exec.submit([retval, fn = std::forward <t_fn>(fn)]() mutable {
			std::exception_ptr error;
			std::optional <t_value> value;
			try
			{
				value.emplace(fn());
			}
			catch (...)
			{
				error = std::current_exception();
			}
			
			// Complete outside the try block so that exceptions from callbacks are not caught.
			if (error)
				retval.fail(std::move(error));
			else
				retval.complete(std::move(*value));
		});
		return retval;
	}
}

#endif
