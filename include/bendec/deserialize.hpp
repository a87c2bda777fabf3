/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_DESERIALIZE_HPP_INCLUDED
#define BENDEC_DESERIALIZE_HPP_INCLUDED

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "bendec/config.hpp"
#include "bendec/decoder.hpp"
#include "bendec/error_code.hpp"
#include "bendec/span.hpp"
#include "bendec/string_view.hpp"
#include "bendec/visitor.hpp"
#include "bendec/aux_/throw.hpp"

namespace bendec {

	// a deserializer is a visitor that fills in an object of type T. It's
	// constructed from a reference to that object. Specialize this template
	// to decode your own types, typically by deriving from record<T> (see
	// record.hpp).
	//
	// There is no support for enums or tagged unions, since bencode has no
	// convention for encoding them.
	template <typename T, typename Enable = void>
	struct deserializer;

	template <typename T>
	void deserialize(decoder& d, T& out)
	{
		deserializer<T> v(out);
		v.decode_from(d);
	}

namespace aux {

	template <typename T>
	struct is_plain_integer : std::integral_constant<bool
		, std::is_integral<T>::value && !std::is_same<T, bool>::value> {};

	// e.g. "a 32-bit signed integer"
	BENDEC_EXTRA_EXPORT std::string integer_name(bool is_signed, int bits);

	// "invalid length <got>, expected <expected>"
	BENDEC_EXTRA_EXPORT std::string invalid_length(std::size_t got, std::string const& expected);

	template <typename T>
	bool next_element(list_reader& list, T& out)
	{
		deserializer<T> v(out);
		return list.next_element(v);
	}

	template <typename Map>
	struct map_deserializer : visitor
	{
		explicit map_deserializer(Map& out) : m_out(out) {}

		void decode_from(decoder& d) override { d.decode_dict(*this); }

		void on_dict(decoder& d, dict_reader& dict) override
		{
			using key_type = typename Map::key_type;
			using mapped_type = typename Map::mapped_type;

			m_out.clear();
			for (;;)
			{
				key_type key{};
				deserializer<key_type> kv(key);
				if (!dict.next_key(kv)) break;

				mapped_type value{};
				deserializer<mapped_type> vv(value);
				dict.next_value(vv);
				if (d.failed()) break;

				// a repeated key replaces the earlier value
				m_out.insert_or_assign(std::move(key), std::move(value));
			}
		}

		std::string expecting() const override { return "a dictionary"; }

	protected:
		~map_deserializer() = default;

	private:
		Map& m_out;
	};

	template <typename T> struct is_optional : std::false_type {};
	template <typename T> struct is_optional<std::optional<T>> : std::true_type {};
}

	template <typename T>
	struct deserializer<T, typename std::enable_if<aux::is_plain_integer<T>::value>::type> final
		: visitor
	{
		explicit deserializer(T& out) : m_out(out) {}

		void decode_from(decoder& d) override
		{
			// the integer token is parsed into 64 bits. Only a target of that
			// width insists on an integer, narrower ones take whatever comes
			// and check the range of the value
			if (std::is_signed<T>::value && sizeof(T) == sizeof(std::int64_t))
				d.decode_int(*this);
			else
				d.decode_any(*this);
		}

		void on_integer(decoder& d, std::int64_t const val) override
		{
			if (!in_range(val))
			{
				d.fail("invalid value: integer `" + std::to_string(val)
					+ "`, expected " + expecting());
				return;
			}
			m_out = static_cast<T>(val);
		}

		std::string expecting() const override
		{
			return aux::integer_name(std::is_signed<T>::value, int(sizeof(T) * 8));
		}

	private:

		static bool in_range(std::int64_t const val)
		{
			if constexpr (std::is_signed<T>::value)
			{
				return val >= std::int64_t(std::numeric_limits<T>::min())
					&& val <= std::int64_t(std::numeric_limits<T>::max());
			}
			else
			{
				return val >= 0
					&& std::uint64_t(val) <= std::uint64_t(std::numeric_limits<T>::max());
			}
		}

		T& m_out;
	};

	// the byte string is not copied, the view points into the decoded buffer
	template <>
	struct BENDEC_EXPORT deserializer<string_view> final : visitor
	{
		explicit deserializer(string_view& out) : m_out(out) {}
		void decode_from(decoder& d) override;
		void on_bytes(decoder& d, string_view val) override;
		std::string expecting() const override;
	private:
		string_view& m_out;
	};

	// the byte string must be valid UTF-8
	template <>
	struct BENDEC_EXPORT deserializer<std::string> final : visitor
	{
		explicit deserializer(std::string& out) : m_out(out) {}
		void on_bytes(decoder& d, string_view val) override;
		std::string expecting() const override;
	private:
		std::string& m_out;
	};

	template <typename T, typename A>
	struct deserializer<std::vector<T, A>> final : visitor
	{
		explicit deserializer(std::vector<T, A>& out) : m_out(out) {}

		void decode_from(decoder& d) override { d.decode_list(*this); }

		void on_list(decoder&, list_reader& list) override
		{
			m_out.clear();
			for (;;)
			{
				T elem{};
				if (!aux::next_element(list, elem)) break;
				m_out.push_back(std::move(elem));
			}
		}

		std::string expecting() const override { return "a list"; }

	private:
		std::vector<T, A>& m_out;
	};

	template <typename K, typename V, typename C, typename A>
	struct deserializer<std::map<K, V, C, A>> final
		: aux::map_deserializer<std::map<K, V, C, A>>
	{
		using aux::map_deserializer<std::map<K, V, C, A>>::map_deserializer;
	};

	template <typename K, typename V, typename H, typename E, typename A>
	struct deserializer<std::unordered_map<K, V, H, E, A>> final
		: aux::map_deserializer<std::unordered_map<K, V, H, E, A>>
	{
		using aux::map_deserializer<std::unordered_map<K, V, H, E, A>>::map_deserializer;
	};

	// a tuple is a list of exactly as many elements. Too few fail with an
	// invalid length message, too many with expected_list_end
	template <typename... Ts>
	struct deserializer<std::tuple<Ts...>> final : visitor
	{
		explicit deserializer(std::tuple<Ts...>& out) : m_out(out) {}

		void on_list(decoder& d, list_reader& list) override
		{
			read(d, list, std::index_sequence_for<Ts...>{});
		}

		std::string expecting() const override
		{
			return "a tuple of size " + std::to_string(sizeof...(Ts));
		}

	private:

		template <std::size_t... I>
		void read(decoder& d, list_reader& list, std::index_sequence<I...>)
		{
			std::size_t count = 0;
			bool const complete = ((aux::next_element(list, std::get<I>(m_out)) && ++count > 0) && ...);
			if (!complete && !d.failed())
				d.fail(aux::invalid_length(count, expecting()));
		}

		std::tuple<Ts...>& m_out;
	};

	template <typename A, typename B>
	struct deserializer<std::pair<A, B>> final : visitor
	{
		explicit deserializer(std::pair<A, B>& out) : m_out(out) {}

		void on_list(decoder& d, list_reader& list) override
		{
			std::size_t count = 0;
			if (aux::next_element(list, m_out.first)) ++count;
			if (count == 1 && aux::next_element(list, m_out.second)) ++count;
			if (count < 2 && !d.failed())
				d.fail(aux::invalid_length(count, expecting()));
		}

		std::string expecting() const override { return "a tuple of size 2"; }

	private:
		std::pair<A, B>& m_out;
	};

	// decodes a T if the value is present. As a member of a record, the key
	// may also be missing altogether
	template <typename T>
	struct deserializer<std::optional<T>> final : visitor
	{
		explicit deserializer(std::optional<T>& out) : m_out(out) {}

		void decode_from(decoder& d) override
		{
			T val{};
			deserialize(d, val);
			if (!d.failed()) m_out = std::move(val);
		}

		std::string expecting() const override { return "an optional value"; }

	private:
		std::optional<T>& m_out;
	};

	// This function decodes the bencoded ``buffer`` into a value of type
	// ``T``. The entire buffer must be consumed by exactly one value, any
	// bytes following it fail with trailing_characters. Byte strings decoded
	// into ``string_view`` point into ``buffer``, which must outlive them.
	//
	// If decoding fails, a default constructed ``T`` is returned and the
	// failure is described by ``err`` (or ``ec``). The overload without an
	// error argument throws a system_error instead.
	template <typename T>
	T decode(span<char const> const buffer, decode_error& err
		, decode_config const& cfg = {})
	{
		err.clear();
		decoder d(buffer, cfg);
		T ret{};
		deserialize(d, ret);
		d.finish();
		if (d.failed())
		{
			err = d.error();
			return T{};
		}
		return ret;
	}

	template <typename T>
	T decode(span<char const> const buffer, error_code& ec
		, decode_config const& cfg = {})
	{
		decode_error err;
		T ret = decode<T>(buffer, err, cfg);
		ec = err.ec;
		return ret;
	}

	template <typename T>
	T decode(span<char const> const buffer, decode_config const& cfg = {})
	{
		decode_error err;
		T ret = decode<T>(buffer, err, cfg);
		if (err) aux::throw_ex<system_error>(err.ec, err.what());
		return ret;
	}
}

#endif // BENDEC_DESERIALIZE_HPP_INCLUDED
