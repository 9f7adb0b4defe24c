/** Implementation of the collection codecs' non-template helpers.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include <limits>

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/collection.hxx"

#include "cqlxx/internal/header-post.hxx"


void cqlxx::internal::write_count(bytes &out, std::size_t count)
{
  if (count > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()))
    throw illegal_value{
      concat("Collection of ", count, " elements is too large to encode.")};
  write_be(out, static_cast<std::int32_t>(count));
}


std::size_t
cqlxx::internal::read_count(wire_reader &in, data_type const &type)
{
  auto const count{in.read_int("element count")};
  if (count < 0)
    throw decode_error{
      concat("Negative element count ", count, " in ", type.to_string()), 0u,
      in.remaining()};
  auto const elements{static_cast<std::size_t>(count)};
  // Every element takes at least its 4-byte length prefix.
  if (elements > in.remaining() / sizeof(std::int32_t))
    throw decode_error{
      concat(
        "Element count ", count, " is too large for ", type.to_string(),
        " value"),
      elements * sizeof(std::int32_t), in.remaining()};
  return elements;
}


void cqlxx::internal::throw_null_element(
  data_type const &type, std::size_t position)
{
  throw illegal_value{concat(
    "Null element at position ", position, " of ", type.to_string(),
    ".  A collection can't contain nulls.")};
}


std::vector<std::string_view> cqlxx::internal::split_collection(
  data_type const &type, std::string_view text, char open, char close)
{
  auto const body{trim(text)};
  if (std::size(body) < 2 or body.front() != open or body.back() != close)
    throw_bad_literal(type, text);

  auto const inside{trim(body.substr(1, std::size(body) - 2))};
  if (std::empty(inside))
    return {};
  auto items{split_top_level(inside, ',')};
  if (not items.has_value())
    throw_bad_literal(type, text);
  return std::move(*items);
}
