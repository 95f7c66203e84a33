/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_ASYNC_DRIVER_HH
#define QUICKSHRINK_ASYNC_DRIVER_HH

#include <cstdint>
#include <exception>
#include <functional>
#include <libbio/assert.hh>
#include <libbio/dispatch.hh>
#include <memory>
#include <mutex>
#include <optional>
#include <quickshrink/pending_result.hh>
#include <stdexcept>
#include <utility>


namespace quickshrink {

	// The outcome of an awaited operation as seen by the body.
	template <typename t_awaited>
	class resumption
	{
	protected:
		std::optional <t_awaited>	m_value;
		std::exception_ptr			m_error;
		
	public:
		resumption() = default;
		
		explicit resumption(pending_result <t_awaited> const &pr):
			m_error(pr.error())
		{
			if (!m_error)
				m_value.emplace(pr.get());
		}
		
		bool has_failed() const { return bool(m_error); }
		std::exception_ptr error() const { return m_error; }
		
		// Rethrows inside the body if the awaited operation failed.
		t_awaited &get()
		{
			if (m_error)
				std::rethrow_exception(m_error);
			libbio_assert(m_value);
			return *m_value;
		}
	};
	
	
	enum class step_kind : std::uint8_t
	{
		DONE,		// The body produced a value.
		EXHAUSTED,	// The body ran to the end without producing a value.
		FAILED,
		AWAIT
	};
	
	
	template <typename t_value, typename t_awaited>
	struct step
	{
		step_kind						kind{step_kind::EXHAUSTED};
		std::optional <t_value>			value;
		std::exception_ptr				error;
		std::optional <pending_result <t_awaited>>	awaited;
		
		static step done(t_value value) { step retval; retval.kind = step_kind::DONE; retval.value.emplace(std::move(value)); return retval; }
		static step exhausted() { return step(); }
		static step failed(std::exception_ptr error) { step retval; retval.kind = step_kind::FAILED; retval.error = std::move(error); return retval; }
		static step await(pending_result <t_awaited> pr) { step retval; retval.kind = step_kind::AWAIT; retval.awaited.emplace(std::move(pr)); return retval; }
	};
	
	
	// A computation that may suspend on pending_results of type t_awaited.
	// start() is called once, then resume() once for each AWAIT step.
	template <typename t_value, typename t_awaited>
	class suspendable
	{
	public:
		typedef t_value							value_type;
		typedef t_awaited						awaited_type;
		typedef step <t_value, t_awaited>		step_type;
		typedef resumption <t_awaited>			resumption_type;
		
	public:
		virtual ~suspendable() {}
		virtual step_type start() = 0;
		virtual step_type resume(resumption_type &res) = 0;
	};
	
	
	template <typename t_value, typename t_awaited>
	using suspendable_ptr = std::shared_ptr <suspendable <t_value, t_awaited>>;
	
	
	namespace detail {
	
		// Trampoline. If the loop in run() is still active when the awaited result is completed,
		// the callback only stores the resumption and the loop picks it up, so the stack does not grow.
		// Otherwise the thread that completes the result continues the loop. The body is resumed
		// by one thread at a time.
		template <typename t_value, typename t_awaited>
		class driver final : public std::enable_shared_from_this <driver <t_value, t_awaited>>
		{
		public:
			typedef suspendable <t_value, t_awaited>		body_type;
			typedef typename body_type::step_type			step_type;
			typedef typename body_type::resumption_type		resumption_type;
			typedef pending_result <std::optional <t_value>>	result_type;
			typedef std::lock_guard <libbio::dispatch_semaphore_lock>	lock_guard_type;
			
		protected:
			suspendable_ptr <t_value, t_awaited>	m_body;
			result_type								m_result;
			libbio::dispatch_semaphore_lock			m_mutex;	// Protects m_next and m_is_running.
			std::optional <resumption_type>			m_next;
			bool									m_has_started{};
			bool									m_is_running{};
			
		public:
			explicit driver(suspendable_ptr <t_value, t_awaited> body):
				m_body(std::move(body)),
				m_mutex(1)
			{
			}
			
			result_type const &result() const { return m_result; }
			
			void start();
			void resume_with(resumption_type &&res);
			
		protected:
			void run();
			bool handle_step(step_type &&st);
			bool should_continue();
		};
		
		
		template <typename t_value, typename t_awaited>
		void driver <t_value, t_awaited>::start()
		{
			{
				lock_guard_type const lock(m_mutex);
				libbio_assert(!m_is_running);
				m_is_running = true;
			}
			
			run();
		}
		
		
		template <typename t_value, typename t_awaited>
		void driver <t_value, t_awaited>::resume_with(resumption_type &&res)
		{
			{
				lock_guard_type const lock(m_mutex);
				libbio_assert(!m_next);
				m_next.emplace(std::move(res));
				
				// The active loop picks up the resumption.
				if (m_is_running)
					return;
					
				m_is_running = true;
			}
			
			run();
		}
		
		
		// Stops the loop unless a resumption is already available.
		template <typename t_value, typename t_awaited>
		bool driver <t_value, t_awaited>::should_continue()
		{
			lock_guard_type const lock(m_mutex);
			if (m_next)
				return true;
				
			m_is_running = false;
			return false;
		}
		
		
		// Precondition: m_is_running has been set by the caller.
		template <typename t_value, typename t_awaited>
		void driver <t_value, t_awaited>::run()
		{
			auto self(this->shared_from_this()); // Keep alive until the loop exits.
			while (true)
			{
				step_type st;
				try
				{
					if (m_has_started)
					{
						std::optional <resumption_type> res;
						
						{
							lock_guard_type const lock(m_mutex);
							libbio_assert(m_next);
							res.swap(m_next);
						}
						
						st = m_body->resume(*res);
					}
					else
					{
						m_has_started = true;
						st = m_body->start();
					}
				}
				catch (...)
				{
					m_result.fail(std::current_exception());
					break;
				}
				
				if (!handle_step(std::move(st)))
					break;
					
				if (!should_continue())
					break;
			}
		}
		
		
		// Returns true if the body is waiting.
		template <typename t_value, typename t_awaited>
		bool driver <t_value, t_awaited>::handle_step(step_type &&st)
		{
			switch (st.kind)
			{
				case step_kind::DONE:
					libbio_assert(st.value);
					m_result.complete(std::optional <t_value>(std::move(*st.value)));
					return false;
					
				case step_kind::EXHAUSTED:
					m_result.complete(std::nullopt);
					return false;
					
				case step_kind::FAILED:
					m_result.fail(st.error);
					return false;
					
				case step_kind::AWAIT:
				{
					libbio_assert(st.awaited);
					auto self(this->shared_from_this());
					st.awaited->add_callback([self](pending_result <t_awaited> const &pr){
						self->resume_with(resumption_type(pr));
					});
					return true;
				}
			}
			
			throw std::logic_error("Unexpected step kind");
		}
	}
	
	
	// Runs the body until it finishes; nullopt stands for exhaustion.
	template <typename t_value, typename t_awaited>
	pending_result <std::optional <t_value>> drive(suspendable_ptr <t_value, t_awaited> body)
	{
		auto drv(std::make_shared <detail::driver <t_value, t_awaited>>(std::move(body)));
		auto retval(drv->result());
		drv->start();
		return retval;
	}
	
	
	// Type-erased drive, for substituting a custom driver.
	template <typename t_value, typename t_awaited>
	using driver_fn = std::function <pending_result <std::optional <t_value>>(suspendable_ptr <t_value, t_awaited>)>;
}

#endif
