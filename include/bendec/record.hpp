/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENDEC_RECORD_HPP_INCLUDED
#define BENDEC_RECORD_HPP_INCLUDED

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

#include "bendec/config.hpp"
#include "bendec/decoder.hpp"
#include "bendec/deserialize.hpp"
#include "bendec/string_view.hpp"
#include "bendec/visitor.hpp"

/*

Records map the keys of a bencoded dictionary onto the members of a struct.
The mapping is spelled out by hand, by specializing deserializer<> and
listing the fields:

	struct info
	{
		std::int64_t piece_length;
		std::string name;
	};

	namespace bendec {
	template <>
	struct deserializer<info> final : record<info>
	{
		explicit deserializer(info& out) : record<info>(out, fields()) {}

		static record_fields<info> const& fields()
		{
			static record_fields<info> const f = record_fields<info>("info")
				.field("piece length", &info::piece_length)
				.field("name", &info::name);
			return f;
		}
	};
	}

*/

namespace bendec {

namespace aux {

	// captures a dictionary key as a view into the buffer
	struct BENDEC_EXTRA_EXPORT field_key final : visitor
	{
		explicit field_key(string_view& out) : m_out(out) {}
		void on_bytes(decoder& d, string_view val) override;
		std::string expecting() const override;
	private:
		string_view& m_out;
	};
}

	// the table of fields of a record of type ``T``
	template <typename T>
	struct record_fields
	{
		// decodes into a field, handing its visitor to the function. Returns
		// what the function returns
		using element_fun = std::function<bool(visitor&)>;

		struct entry
		{
			std::string key;
			bool required;
			std::function<bool(T&, element_fun const&)> decode;
		};

		explicit record_fields(std::string name) : m_name(std::move(name)) {}

		// maps the dictionary key ``key`` to ``member``. The field must be
		// present, unless it's a std::optional<>
		template <typename M>
		record_fields& field(std::string key, M T::* member)
		{
			m_entries.push_back({std::move(key), !aux::is_optional<M>::value
				, [member](T& obj, element_fun const& f)
				{
					deserializer<M> v(obj.*member);
					return f(v);
				}});
			return *this;
		}

		std::string const& name() const { return m_name; }
		std::vector<entry> const& entries() const { return m_entries; }

	private:
		std::string m_name;
		std::vector<entry> m_entries;
	};

	// a visitor decoding a struct from a dictionary, or from a list with the
	// fields in the order they were added to the record_fields.
	//
	// Dictionary keys with no matching field are skipped. A field appearing
	// twice fails with "duplicate field", a required field not appearing at
	// all fails with "missing field".
	template <typename T>
	struct record : visitor
	{
		record(T& out, record_fields<T> const& fields)
			: m_out(out), m_fields(fields) {}

		void on_dict(decoder& d, dict_reader& dict) override
		{
			auto const& entries = m_fields.entries();
			std::vector<bool> seen(entries.size(), false);

			string_view key;
			aux::field_key key_visitor(key);
			while (dict.next_key(key_visitor))
			{
				auto const it = std::find_if(entries.begin(), entries.end()
					, [&](typename record_fields<T>::entry const& e) { return e.key == key; });
				if (it == entries.end())
				{
					skip_visitor skip;
					dict.next_value(skip);
					continue;
				}

				auto const idx = std::size_t(it - entries.begin());
				if (seen[idx])
				{
					d.fail("duplicate field `" + it->key + "`");
					return;
				}
				seen[idx] = true;

				it->decode(m_out, [&](visitor& v)
				{
					dict.next_value(v);
					return !d.failed();
				});
			}
			if (d.failed()) return;

			for (std::size_t i = 0; i < entries.size(); ++i)
			{
				if (!entries[i].required || seen[i]) continue;
				d.fail("missing field `" + entries[i].key + "`");
				return;
			}
		}

		void on_list(decoder& d, list_reader& list) override
		{
			auto const& entries = m_fields.entries();
			for (std::size_t i = 0; i < entries.size(); ++i)
			{
				bool const got = entries[i].decode(m_out, [&](visitor& v)
				{ return list.next_element(v); });
				if (got) continue;
				if (!d.failed())
				{
					d.fail(aux::invalid_length(i, "struct " + m_fields.name()
						+ " with " + std::to_string(entries.size()) + " elements"));
				}
				return;
			}
		}

		std::string expecting() const override
		{
			return "struct " + m_fields.name();
		}

	private:
		T& m_out;
		record_fields<T> const& m_fields;
	};
}

#endif // BENDEC_RECORD_HPP_INCLUDED
