/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_PENDING_RESULT_HH
#define QUICKSHRINK_PENDING_RESULT_HH

#include <exception>
#include <functional>
#include <libbio/assert.hh>
#include <libbio/dispatch.hh>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>


namespace quickshrink {

	// One-shot result of an asynchronous operation. Copies share the state.
	// Callbacks are called in registration order by the thread that completes the result,
	// or immediately by add_callback() if the result has already been completed.
	template <typename t_value>
	class pending_result
	{
	public:
		typedef t_value										value_type;
		typedef std::function <void(pending_result const &)>	callback_type;
		
	protected:
		struct shared_state
		{
			libbio::dispatch_semaphore_lock	mutex;
			std::optional <t_value>			value;
			std::exception_ptr				error;
			std::vector <callback_type>		callbacks;
			bool							is_complete{};
			
			shared_state():
				mutex(1)
			{
			}
		};
		
		typedef std::lock_guard <libbio::dispatch_semaphore_lock>	lock_guard_type;
		
	protected:
		std::shared_ptr <shared_state>	m_state;
		
	public:
		pending_result():
			m_state(std::make_shared <shared_state>())
		{
		}
		
		static pending_result ready(t_value value) { pending_result retval; retval.complete(std::move(value)); return retval; }
		static pending_result failed(std::exception_ptr error) { pending_result retval; retval.fail(std::move(error)); return retval; }
		
		bool is_complete() const { lock_guard_type const lock(m_state->mutex); return m_state->is_complete; }
		bool has_value() const { lock_guard_type const lock(m_state->mutex); return m_state->value.has_value(); }
		bool has_failed() const { lock_guard_type const lock(m_state->mutex); return bool(m_state->error); }
		
		void complete(t_value value);
		void fail(std::exception_ptr error);
		void add_callback(callback_type cb);
		
		// Precondition: is_complete(). Rethrows the failure if there was one.
		t_value const &get() const;
		std::exception_ptr error() const { lock_guard_type const lock(m_state->mutex); return m_state->error; }
		
	protected:
		template <typename t_fn>
		void finish(t_fn &&store);
	};
	
	
	template <typename t_value>
	void pending_result <t_value>::complete(t_value value)
	{
		finish([&value](shared_state &state){ state.value.emplace(std::move(value)); });
	}
	
	
	template <typename t_value>
	void pending_result <t_value>::fail(std::exception_ptr error)
	{
		libbio_assert(error);
		finish([&error](shared_state &state){ state.error = std::move(error); });
	}
	
	
	template <typename t_value>
	template <typename t_fn>
	void pending_result <t_value>::finish(t_fn &&store)
	{
		std::vector <callback_type> callbacks;
		
		{
			lock_guard_type const lock(m_state->mutex);
			libbio_always_assert(!m_state->is_complete);
			store(*m_state);
			m_state->is_complete = true;
			
			// Clearing the vector also releases whatever the callbacks captured.
			callbacks = std::move(m_state->callbacks);
			m_state->callbacks.clear();
		}
		
		// Call outside the lock; the callbacks may inspect this result.
		for (auto &cb : callbacks)
			cb(*this);
	}
	
	
	template <typename t_value>
	void pending_result <t_value>::add_callback(callback_type cb)
	{
		{
			lock_guard_type const lock(m_state->mutex);
			if (!m_state->is_complete)
			{
				m_state->callbacks.emplace_back(std::move(cb));
				return;
			}
		}
		
		cb(*this);
	}
	
	
	template <typename t_value>
	t_value const &pending_result <t_value>::get() const
	{
		lock_guard_type const lock(m_state->mutex);
		libbio_always_assert(m_state->is_complete);
		if (m_state->error)
			std::rethrow_exception(m_state->error);
		return *m_state->value;
	}
}

#endif
