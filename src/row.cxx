/** Implementation of the cqlxx::row class and the identity row mapper.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include <utility>

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/except.hxx"
#include "cqlxx/internal/concat.hxx"
#include "cqlxx/row.hxx"

#include "cqlxx/internal/header-post.hxx"


cqlxx::row::row(std::vector<column> columns) : m_columns{std::move(columns)}
{}


cqlxx::column const &cqlxx::row::operator[](std::size_t index) const
{
  if (index >= std::size(m_columns))
    throw argument_error{internal::concat(
      "Column number out of range: ", index, " (row has ",
      std::size(m_columns), " columns).")};
  return m_columns[index];
}


cqlxx::column const &cqlxx::row::at(std::string_view name) const
{
  auto const index{index_of(name)};
  if (not index.has_value())
    throw argument_error{
      internal::concat("Column not found: '", name, "'.")};
  return m_columns[*index];
}


std::optional<std::size_t>
cqlxx::row::index_of(std::string_view name) const noexcept
{
  for (std::size_t i{0}; i < std::size(m_columns); ++i)
    if (m_columns[i].name == name)
      return i;
  return {};
}


void cqlxx::row::throw_mismatch(column const &col, codec_base const &c)
{
  throw usage_error{internal::concat(
    "Column '", col.name, "' has type ", col.type.to_string(), "; ",
    c.describe(), " can't read it.")};
}


cqlxx::row cqlxx::identity_row_mapper::map(row const &r) const
{
  return r;
}
