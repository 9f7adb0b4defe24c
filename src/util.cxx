/** Various utility functions: wire framing, hex encoding.
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

#include "cqlxx/except.hxx"
#include "cqlxx/internal/concat.hxx"
#include "cqlxx/internal/wire.hxx"

#include "cqlxx/internal/header-post.hxx"


namespace
{
constexpr char hex_digit(int c) noexcept
{
  constexpr char hex[] = {'0', '1', '2', '3', '4', '5', '6', '7',
                          '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  return hex[c];
}


/// Translate a hex digit to a nibble.  Return -1 if it's not a valid digit.
constexpr int nibble(int c) noexcept
{
  if (c >= '0' and c <= '9')
    return c - '0';
  else if (c >= 'a' and c <= 'f')
    return 10 + (c - 'a');
  else if (c >= 'A' and c <= 'F')
    return 10 + (c - 'A');
  else
    return -1;
}
} // namespace


void cqlxx::internal::write_framed(bytes &out, std::optional<bytes_view> value)
{
  if (not value.has_value())
  {
    write_be(out, null_length);
    return;
  }
  auto const size{std::size(*value)};
  if (size > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()))
    throw illegal_value{
      concat("Value of ", size, " bytes is too large to encode.")};
  write_be(out, static_cast<std::int32_t>(size));
  out.insert(std::end(out), std::begin(*value), std::end(*value));
}


std::int32_t cqlxx::internal::wire_reader::read_int(std::string_view what)
{
  if (remaining() < sizeof(std::int32_t))
    throw decode_error{
      concat("Truncated ", what), sizeof(std::int32_t), remaining()};
  auto const value{read_be<std::int32_t>(m_data.subspan(m_pos))};
  m_pos += sizeof(std::int32_t);
  return value;
}


std::optional<cqlxx::bytes_view>
cqlxx::internal::wire_reader::read_framed(std::string_view what)
{
  auto const length{read_int(what)};
  if (length == null_length)
    return {};
  if (length < 0)
    throw decode_error{
      concat("Negative length ", length, " for ", what), 0u, remaining()};
  auto const size{static_cast<std::size_t>(length)};
  if (size > remaining())
    throw decode_error{concat("Truncated ", what), size, remaining()};
  auto const value{m_data.subspan(m_pos, size)};
  m_pos += size;
  return value;
}


void cqlxx::internal::wire_reader::expect_end(std::string_view what) const
{
  if (not at_end())
    throw decode_error{
      concat("Trailing bytes after ", what), m_pos, std::size(m_data)};
}


std::string cqlxx::internal::to_hex(bytes_view data)
{
  std::string out;
  out.reserve(2 * std::size(data));
  for (auto const b : data)
  {
    auto const uc{std::to_integer<int>(b)};
    out.push_back(hex_digit(uc >> 4));
    out.push_back(hex_digit(uc & 0x0f));
  }
  return out;
}


cqlxx::bytes cqlxx::internal::from_hex(std::string_view text)
{
  if ((std::size(text) % 2) != 0)
    throw argument_error{
      concat("Odd number of hex digits in '", text, "'.")};
  bytes out;
  out.reserve(std::size(text) / 2);
  for (std::size_t i{0}; i < std::size(text); i += 2)
  {
    int const hi{nibble(text[i])}, lo{nibble(text[i + 1])};
    if ((hi < 0) or (lo < 0))
      throw argument_error{concat("Invalid hex data: '", text, "'.")};
    out.push_back(static_cast<std::byte>((hi << 4) | lo));
  }
  return out;
}
