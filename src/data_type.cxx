/** Implementation of cqlxx::data_type.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include <algorithm>
#include <utility>

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/data_type.hxx"
#include "cqlxx/except.hxx"
#include "cqlxx/internal/concat.hxx"

#include "cqlxx/internal/header-post.hxx"


std::string_view cqlxx::name_of(type_kind kind) noexcept
{
  switch (kind)
  {
  case type_kind::ascii: return "ascii";
  case type_kind::bigint: return "bigint";
  case type_kind::blob: return "blob";
  case type_kind::boolean: return "boolean";
  case type_kind::counter: return "counter";
  case type_kind::date: return "date";
  case type_kind::decimal: return "decimal";
  case type_kind::double_: return "double";
  case type_kind::float_: return "float";
  case type_kind::inet: return "inet";
  case type_kind::int_: return "int";
  case type_kind::smallint: return "smallint";
  case type_kind::text: return "text";
  case type_kind::time: return "time";
  case type_kind::timestamp: return "timestamp";
  case type_kind::timeuuid: return "timeuuid";
  case type_kind::tinyint: return "tinyint";
  case type_kind::uuid: return "uuid";
  case type_kind::varint: return "varint";
  case type_kind::list: return "list";
  case type_kind::set: return "set";
  case type_kind::map: return "map";
  case type_kind::udt: return "udt";
  }
  return "unknown";
}


cqlxx::data_type::data_type(type_kind kind) : m_kind{kind}
{
  if (
    kind == type_kind::list or kind == type_kind::set or
    kind == type_kind::map or kind == type_kind::udt)
    throw usage_error{internal::concat(
      "Type '", name_of(kind), "' needs parameters; use its factory.")};
}


cqlxx::data_type::data_type(
  type_kind kind, bool frozen, std::vector<data_type> params) :
        m_kind{kind}, m_frozen{frozen}, m_params{std::move(params)}
{}


cqlxx::data_type cqlxx::data_type::list_of(data_type element, bool frozen)
{
  return {type_kind::list, frozen, {std::move(element)}};
}


cqlxx::data_type cqlxx::data_type::set_of(data_type element, bool frozen)
{
  return {type_kind::set, frozen, {std::move(element)}};
}


cqlxx::data_type
cqlxx::data_type::map_of(data_type key, data_type value, bool frozen)
{
  return {type_kind::map, frozen, {std::move(key), std::move(value)}};
}


cqlxx::data_type cqlxx::data_type::udt(
  std::string keyspace, std::string name,
  std::vector<field_descriptor> const &fields, bool frozen)
{
  if (std::empty(name))
    throw usage_error{"A user-defined type needs a name."};
  std::vector<data_type> types;
  std::vector<std::string> names;
  types.reserve(std::size(fields));
  names.reserve(std::size(fields));
  for (auto const &f : fields)
  {
    if (std::find(std::begin(names), std::end(names), f.name) != std::end(names))
      throw usage_error{internal::concat(
        "Duplicate field '", f.name, "' in user-defined type '", name, "'.")};
    names.push_back(f.name);
    types.push_back(f.type);
  }
  data_type out{type_kind::udt, frozen, std::move(types)};
  out.m_keyspace = std::move(keyspace);
  out.m_name = std::move(name);
  out.m_field_names = std::move(names);
  return out;
}


bool cqlxx::data_type::is_collection() const noexcept
{
  return m_kind == type_kind::list or m_kind == type_kind::set or
         m_kind == type_kind::map;
}


std::optional<std::size_t> cqlxx::data_type::fixed_width() const noexcept
{
  switch (m_kind)
  {
  case type_kind::boolean:
  case type_kind::tinyint: return 1u;
  case type_kind::smallint: return 2u;
  case type_kind::date:
  case type_kind::float_:
  case type_kind::int_: return 4u;
  case type_kind::bigint:
  case type_kind::counter:
  case type_kind::double_:
  case type_kind::time:
  case type_kind::timestamp: return 8u;
  case type_kind::timeuuid:
  case type_kind::uuid: return 16u;
  default: return {};
  }
}


void cqlxx::data_type::check_kind(type_kind wanted, char const what[]) const
{
  if (m_kind != wanted)
    throw usage_error{internal::concat(
      "Asked for ", what, " of type ", to_string(), ", which is not a ",
      name_of(wanted), ".")};
}


void cqlxx::data_type::check_udt(char const what[]) const
{
  check_kind(type_kind::udt, what);
}


cqlxx::data_type const &cqlxx::data_type::element() const
{
  if (m_kind != type_kind::list and m_kind != type_kind::set)
    throw usage_error{internal::concat(
      "Asked for element type of ", to_string(),
      ", which is not a list or set.")};
  return m_params[0];
}


cqlxx::data_type const &cqlxx::data_type::key() const
{
  check_kind(type_kind::map, "key type");
  return m_params[0];
}


cqlxx::data_type const &cqlxx::data_type::value() const
{
  check_kind(type_kind::map, "value type");
  return m_params[1];
}


std::string const &cqlxx::data_type::keyspace() const
{
  check_udt("keyspace");
  return m_keyspace;
}


std::string const &cqlxx::data_type::name() const
{
  check_udt("name");
  return m_name;
}


std::size_t cqlxx::data_type::field_count() const
{
  check_udt("field count");
  return std::size(m_field_names);
}


std::string const &cqlxx::data_type::field_name(std::size_t index) const
{
  check_udt("field name");
  return m_field_names.at(index);
}


cqlxx::data_type const &cqlxx::data_type::field_type(std::size_t index) const
{
  check_udt("field type");
  return m_params.at(index);
}


std::optional<std::size_t>
cqlxx::data_type::field_index(std::string_view name) const
{
  check_udt("field index");
  auto const here{
    std::find(std::begin(m_field_names), std::end(m_field_names), name)};
  if (here == std::end(m_field_names))
    return {};
  return static_cast<std::size_t>(here - std::begin(m_field_names));
}


std::vector<cqlxx::field_descriptor> cqlxx::data_type::fields() const
{
  check_udt("fields");
  std::vector<field_descriptor> out;
  out.reserve(std::size(m_field_names));
  for (std::size_t i{0}; i < std::size(m_field_names); ++i)
    out.push_back({m_field_names[i], m_params[i]});
  return out;
}


cqlxx::data_type
cqlxx::data_type::with_keyspace(std::string const &keyspace) const
{
  data_type out{*this};
  if (m_kind == type_kind::udt)
    out.m_keyspace = keyspace;
  return out;
}


cqlxx::data_type cqlxx::data_type::as_frozen(bool frozen) const
{
  data_type out{*this};
  out.m_frozen = frozen;
  return out;
}


std::string cqlxx::data_type::to_string() const
{
  std::string body;
  switch (m_kind)
  {
  case type_kind::list:
  case type_kind::set:
    body = internal::concat(
      name_of(m_kind), '<', m_params[0].to_string(), '>');
    break;
  case type_kind::map:
    body = internal::concat(
      "map<", m_params[0].to_string(), ", ", m_params[1].to_string(), '>');
    break;
  case type_kind::udt:
    body = std::empty(m_keyspace) ? m_name :
                                    internal::concat(m_keyspace, '.', m_name);
    break;
  default: return std::string{name_of(m_kind)};
  }
  return m_frozen ? internal::concat("frozen<", body, '>') : body;
}


std::string cqlxx::data_type::describe() const
{
  if (m_kind != type_kind::udt)
    return to_string();
  std::string out{to_string()};
  out.push_back('{');
  for (std::size_t i{0}; i < std::size(m_field_names); ++i)
  {
    if (i > 0)
      out.append(", ");
    out.append(internal::concat(m_field_names[i], ' ', m_params[i].describe()));
  }
  out.push_back('}');
  return out;
}


bool cqlxx::data_type::same_shape(data_type const &other) const
{
  if (m_kind != other.m_kind or std::size(m_params) != std::size(other.m_params))
    return false;
  if (m_kind == type_kind::udt)
  {
    if (m_name != other.m_name or m_field_names != other.m_field_names)
      return false;
    if (
      not std::empty(m_keyspace) and not std::empty(other.m_keyspace) and
      m_keyspace != other.m_keyspace)
      return false;
  }
  for (std::size_t i{0}; i < std::size(m_params); ++i)
    if (not m_params[i].same_shape(other.m_params[i]))
      return false;
  return true;
}


bool cqlxx::data_type::operator==(data_type const &rhs) const
{
  return m_kind == rhs.m_kind and m_frozen == rhs.m_frozen and
         m_params == rhs.m_params and m_keyspace == rhs.m_keyspace and
         m_name == rhs.m_name and m_field_names == rhs.m_field_names;
}
