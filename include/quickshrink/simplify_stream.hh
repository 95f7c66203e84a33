/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#ifndef QUICKSHRINK_SIMPLIFY_STREAM_HH
#define QUICKSHRINK_SIMPLIFY_STREAM_HH

#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>


namespace quickshrink {

	// Produces simplification candidates one at a time.
	template <typename t_value>
	class simplify_cursor
	{
	public:
		virtual ~simplify_cursor() {}
		
		// Returns false when there are no more candidates.
		virtual bool next(t_value &dst) = 0;
	};
	
	
	// Finite, single-pass sequence of candidates, most preferred first.
	// Obtain a new stream from the strategy to start over.
	template <typename t_value>
	class simplify_stream
	{
	public:
		typedef t_value								value_type;
		typedef simplify_cursor <t_value>			cursor_type;
		typedef std::unique_ptr <cursor_type>		cursor_ptr;
		
		class iterator
		{
		public:
			typedef std::input_iterator_tag	iterator_category;
			typedef t_value					value_type;
			typedef std::ptrdiff_t			difference_type;
			typedef t_value const			*pointer;
			typedef t_value const			&reference;
			
		protected:
			simplify_stream					*m_stream{};
			std::optional <t_value>			m_current;
			
		public:
			iterator() = default;
			
			explicit iterator(simplify_stream &stream):
				m_stream(&stream)
			{
				advance();
			}
			
			reference operator*() const { return *m_current; }
			pointer operator->() const { return &(*m_current); }
			iterator &operator++() { advance(); return *this; }
			void operator++(int) { advance(); }
			
			bool operator==(iterator const &other) const { return !m_current && !other.m_current; }
			bool operator!=(iterator const &other) const { return !(*this == other); }
			
		protected:
			void advance()
			{
				t_value val;
				if (m_stream && m_stream->next(val))
					m_current = std::move(val);
				else
					m_current.reset();
			}
		};
		
	protected:
		cursor_ptr	m_cursor;
		
	public:
		simplify_stream() = default;
		
		explicit simplify_stream(cursor_ptr &&cursor):
			m_cursor(std::move(cursor))
		{
		}
		
		bool next(t_value &dst)
		{
			if (!m_cursor)
				return false;
				
			if (m_cursor->next(dst))
				return true;
				
			m_cursor.reset();
			return false;
		}
		
		std::vector <t_value> take(std::size_t const limit = SIZE_MAX)
		{
			std::vector <t_value> retval;
			t_value val;
			while (retval.size() < limit && next(val))
				retval.push_back(std::move(val));
			return retval;
		}
		
		iterator begin() { return iterator(*this); }
		iterator end() { return iterator(); }
	};
	
	
	namespace detail {
	
		template <typename t_value, typename t_fn>
		class function_cursor final : public simplify_cursor <t_value>
		{
		protected:
			t_fn	m_fn;
			
		public:
			explicit function_cursor(t_fn &&fn):
				m_fn(std::move(fn))
			{
			}
			
			bool next(t_value &dst) override { return m_fn(dst); }
		};
		
		
		template <typename t_value>
		class value_list_cursor final : public simplify_cursor <t_value>
		{
		protected:
			std::vector <t_value>	m_values;
			std::size_t				m_idx{};
			
		public:
			explicit value_list_cursor(std::vector <t_value> &&values):
				m_values(std::move(values))
			{
			}
			
			bool next(t_value &dst) override
			{
				if (m_idx == m_values.size())
					return false;
					
				dst = m_values[m_idx++];
				return true;
			}
		};
		
		
		// Streams are made only when the previous ones have been exhausted.
		template <typename t_value>
		class chain_cursor final : public simplify_cursor <t_value>
		{
		public:
			typedef std::function <simplify_stream <t_value>()>	stream_fn;
			
		protected:
			std::vector <stream_fn>		m_stream_fns;
			simplify_stream <t_value>	m_current;
			std::size_t					m_idx{};
			
		public:
			explicit chain_cursor(std::vector <stream_fn> &&stream_fns):
				m_stream_fns(std::move(stream_fns))
			{
			}
			
			bool next(t_value &dst) override
			{
				while (true)
				{
					if (m_current.next(dst))
						return true;
						
					if (m_idx == m_stream_fns.size())
						return false;
						
					m_current = m_stream_fns[m_idx++]();
				}
			}
		};
		
		
		template <typename t_src, typename t_dst, typename t_fn>
		class transform_cursor final : public simplify_cursor <t_dst>
		{
		protected:
			simplify_stream <t_src>	m_src;
			t_fn					m_fn;
			
		public:
			transform_cursor(simplify_stream <t_src> &&src, t_fn &&fn):
				m_src(std::move(src)),
				m_fn(std::move(fn))
			{
			}
			
			bool next(t_dst &dst) override
			{
				t_src val;
				if (!m_src.next(val))
					return false;
					
				dst = m_fn(val);
				return true;
			}
		};
		
		
		template <typename t_value>
		class prepend_cursor final : public simplify_cursor <t_value>
		{
		protected:
			std::optional <t_value>		m_head;
			simplify_stream <t_value>	m_tail;
			
		public:
			prepend_cursor(t_value &&head, simplify_stream <t_value> &&tail):
				m_head(std::move(head)),
				m_tail(std::move(tail))
			{
			}
			
			bool next(t_value &dst) override
			{
				if (m_head)
				{
					dst = std::move(*m_head);
					m_head.reset();
					return true;
				}
				
				return m_tail.next(dst);
			}
		};
	}
	
	
	// fn is called as bool(t_value &dst) until it returns false.
	template <typename t_value, typename t_fn>
	simplify_stream <t_value> make_simplify_stream(t_fn &&fn)
	{
		typedef std::remove_cvref_t <t_fn> fn_type;
		return simplify_stream <t_value>(std::make_unique <detail::function_cursor <t_value, fn_type>>(fn_type(std::forward <t_fn>(fn))));
	}
	
	
	template <typename t_value>
	simplify_stream <t_value> make_value_stream(std::vector <t_value> values)
	{
		if (values.empty())
			return {};
		return simplify_stream <t_value>(std::make_unique <detail::value_list_cursor <t_value>>(std::move(values)));
	}
	
	
	template <typename t_value>
	simplify_stream <t_value> chain_streams(std::vector <std::function <simplify_stream <t_value>()>> stream_fns)
	{
		return simplify_stream <t_value>(std::make_unique <detail::chain_cursor <t_value>>(std::move(stream_fns)));
	}
	
	
	template <typename t_dst, typename t_src, typename t_fn>
	simplify_stream <t_dst> transform_stream(simplify_stream <t_src> &&src, t_fn &&fn)
	{
		typedef std::remove_cvref_t <t_fn> fn_type;
		typedef detail::transform_cursor <t_src, t_dst, fn_type> cursor_type;
		return simplify_stream <t_dst>(std::make_unique <cursor_type>(std::move(src), fn_type(std::forward <t_fn>(fn))));
	}
	
	
	template <typename t_value>
	simplify_stream <t_value> prepend_to_stream(t_value head, simplify_stream <t_value> &&tail)
	{
		return simplify_stream <t_value>(std::make_unique <detail::prepend_cursor <t_value>>(std::move(head), std::move(tail)));
	}
}

#endif
