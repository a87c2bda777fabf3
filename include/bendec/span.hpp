/*

Copyright (c) 2016-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_SPAN_HPP_INCLUDED
#define BENDEC_SPAN_HPP_INCLUDED

#include <string>
#include <array>
#include <cstddef>
#include <type_traits>
#include "bendec/assert.hpp"

namespace bendec {

namespace aux {

	template <typename From, typename To>
	struct compatible_type
	{
		// conversions that are OK
		// int -> int
		// int const -> int const
		// int -> int const

		static const bool value = std::is_same<From, To>::value
			|| std::is_same<From, typename std::remove_const<To>::type>::value
			;
	};
}

	// a non-owning view of a contiguous range. The decoder never copies the
	// input buffer, every byte string it produces is a sub-span of it
	template <typename T>
	struct span
	{
		using difference_type = std::ptrdiff_t;
		using index_type = std::ptrdiff_t;

		span() noexcept : m_ptr(nullptr), m_len(0) {}

		template <typename U, typename
			= typename std::enable_if<aux::compatible_type<U, T>::value>::type>
		span(span<U> const& v) noexcept // NOLINT
			: m_ptr(v.data()), m_len(v.size()) {}

		span(T* p, difference_type const l) noexcept : m_ptr(p), m_len(l) // NOLINT
		{ BENDEC_ASSERT(l >= 0); }

		template <typename U, std::size_t N>
		span(std::array<U, N>& arr) noexcept // NOLINT
			: m_ptr(arr.data()), m_len(static_cast<difference_type>(arr.size())) {}

		// anything with a .data() member function is considered a container
		// but only if the value type is compatible with T
		template <typename Cont
			, typename U = typename std::remove_reference<decltype(*std::declval<Cont>().data())>::type
			, typename = typename std::enable_if<aux::compatible_type<U, T>::value>::type>
		span(Cont& c) // NOLINT
			: m_ptr(c.data()), m_len(static_cast<difference_type>(c.size())) {}

		// allow construction from const containers if T is const
		// this allows const spans to be constructed from a temporary container
		template <typename Cont
			, typename U = typename std::remove_reference<decltype(*std::declval<Cont>().data())>::type
			, typename = typename std::enable_if<aux::compatible_type<U, T>::value
				&& std::is_const<T>::value>::type>
		span(Cont const& c) // NOLINT
			: m_ptr(c.data()), m_len(static_cast<difference_type>(c.size())) {}

		index_type size() const noexcept { return m_len; }
		bool empty() const noexcept { return m_len == 0; }
		T* data() const noexcept { return m_ptr; }

		using iterator = T*;

		T* begin() const noexcept { return m_ptr; }
		T* end() const noexcept { return m_ptr + m_len; }

		T& front() const noexcept { BENDEC_ASSERT(m_len > 0); return m_ptr[0]; }

		span<T> first(difference_type const n) const
		{
			BENDEC_ASSERT(size() >= n);
			return { data(), n };
		}

		span<T> subspan(index_type const offset) const
		{
			BENDEC_ASSERT(size() >= offset);
			return { data() + offset, size() - offset };
		}

	private:
		T* m_ptr;
		difference_type m_len;
	};
}

#endif // BENDEC_SPAN_HPP_INCLUDED
