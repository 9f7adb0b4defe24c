/** Implementation of the non-template primitive codecs.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <limits>
#include <vector>

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/primitives.hxx"

#include "cqlxx/internal/header-post.hxx"


namespace
{
/// Append decimal digits to `value`.  False if `digits` holds anything else.
bool add_digits(cqlxx::varint &value, std::string_view digits)
{
  for (auto const c : digits)
  {
    if (c < '0' or c > '9')
      return false;
    value *= 10;
    value += c - '0';
  }
  return true;
}


/// Strip a leading sign off `text`.  Returns whether it was a minus.
bool take_sign(std::string_view &text) noexcept
{
  if (std::empty(text) or (text.front() != '-' and text.front() != '+'))
    return false;
  bool const negative{text.front() == '-'};
  text.remove_prefix(1);
  return negative;
}
} // namespace


void cqlxx::internal::throw_bad_literal(
  data_type const &type, std::string_view text)
{
  throw argument_error{
    concat("Invalid ", type.to_string(), " literal: '", text, "'.")};
}


bool cqlxx::internal::check_width(
  data_type const &type, std::optional<bytes_view> data)
{
  if (not data.has_value() or std::empty(*data))
    return false;
  auto const width{type.fixed_width()};
  if (width.has_value() and std::size(*data) != *width)
    throw decode_error{
      concat("Wrong size for ", type.to_string(), " value"), *width,
      std::size(*data)};
  return true;
}


cqlxx::data_type cqlxx::boolean_codec::cql_type() const
{
  return data_type{type_kind::boolean};
}


cqlxx::wire_value cqlxx::boolean_codec::encode(bool const &value) const
{
  return bytes{value ? std::byte{1} : std::byte{0}};
}


bool cqlxx::boolean_codec::decode(std::optional<bytes_view> data) const
{
  if (not internal::check_width(cql_type(), data))
    return false;
  return (*data)[0] != std::byte{0};
}


std::string cqlxx::boolean_codec::format(bool const &value) const
{
  return value ? "true" : "false";
}


bool cqlxx::boolean_codec::parse(std::string_view text) const
{
  if (internal::is_null_literal(text))
    return false;
  auto const body{internal::trim(text)};
  if (internal::iequals(body, "true"))
    return true;
  if (internal::iequals(body, "false"))
    return false;
  internal::throw_bad_literal(cql_type(), text);
}


cqlxx::text_codec::text_codec(type_kind kind) : m_kind{kind}
{
  if (kind != type_kind::text and kind != type_kind::ascii)
    throw usage_error{internal::concat(
      "Text codec can't serve type '", name_of(kind), "'.")};
}


cqlxx::data_type cqlxx::text_codec::cql_type() const
{
  return data_type{m_kind};
}


cqlxx::wire_value cqlxx::text_codec::encode(std::string const &value) const
{
  if (m_kind == type_kind::ascii)
  {
    auto const bad{std::find_if(std::begin(value), std::end(value), [](char c) {
      return static_cast<unsigned char>(c) > 0x7f;
    })};
    if (bad != std::end(value))
      throw illegal_value{internal::concat(
        "Non-ASCII byte at offset ", bad - std::begin(value), " of ",
        internal::quote(value), ".")};
  }
  return to_bytes(value);
}


std::string cqlxx::text_codec::decode(std::optional<bytes_view> data) const
{
  if (not data.has_value())
    return {};
  return std::string{as_text(*data)};
}


std::string cqlxx::text_codec::format(std::string const &value) const
{
  return internal::quote(value);
}


std::string cqlxx::text_codec::parse(std::string_view text) const
{
  if (internal::is_null_literal(text))
    return {};
  auto value{internal::unquote(text)};
  if (not value.has_value())
    internal::throw_bad_literal(cql_type(), text);
  return std::move(*value);
}


cqlxx::data_type cqlxx::blob_codec::cql_type() const
{
  return data_type{type_kind::blob};
}


cqlxx::wire_value cqlxx::blob_codec::encode(bytes const &value) const
{
  return value;
}


cqlxx::bytes cqlxx::blob_codec::decode(std::optional<bytes_view> data) const
{
  if (not data.has_value())
    return {};
  return {std::begin(*data), std::end(*data)};
}


std::string cqlxx::blob_codec::format(bytes const &value) const
{
  return "0x" + internal::to_hex(value);
}


cqlxx::bytes cqlxx::blob_codec::parse(std::string_view text) const
{
  if (internal::is_null_literal(text))
    return {};
  auto const body{internal::trim(text)};
  if (std::size(body) < 2 or body[0] != '0' or (body[1] != 'x' and body[1] != 'X'))
    internal::throw_bad_literal(cql_type(), text);
  try
  {
    return internal::from_hex(body.substr(2));
  }
  catch (argument_error const &)
  {
    internal::throw_bad_literal(cql_type(), text);
  }
}


cqlxx::timestamp_codec::timestamp_codec() :
        mapping_codec{
          default_codec<std::int64_t>(), data_type{type_kind::timestamp}}
{}


cqlxx::timestamp
cqlxx::timestamp_codec::inner_to_outer(std::int64_t const &millis) const
{
  return timestamp{std::chrono::milliseconds{millis}};
}


std::int64_t
cqlxx::timestamp_codec::outer_to_inner(timestamp const &value) const
{
  return value.time_since_epoch().count();
}


cqlxx::bytes cqlxx::internal::varint_bytes(varint const &value)
{
  // N bytes hold -2^(8N-1) up to 2^(8N-1)-1.
  varint const magnitude{(value < 0) ? varint{-value - 1} : value};
  std::size_t const width{
    (magnitude == 0) ?
      1u :
      (boost::multiprecision::msb(magnitude) + 1u) / 8u + 1u};
  varint const twos{
    (value < 0) ? varint{value + (varint{1} << (8u * width))} : value};

  std::vector<unsigned char> digits;
  boost::multiprecision::export_bits(twos, std::back_inserter(digits), 8);
  bytes out(width - std::size(digits), std::byte{0});
  for (auto const d : digits) out.push_back(static_cast<std::byte>(d));
  return out;
}


cqlxx::varint cqlxx::internal::read_varint(bytes_view data)
{
  varint out;
  if (std::empty(data))
    return out;
  auto const *const begin{
    reinterpret_cast<unsigned char const *>(std::data(data))};
  boost::multiprecision::import_bits(out, begin, begin + std::size(data), 8);
  if ((data[0] & std::byte{0x80}) != std::byte{0})
    out -= varint{1} << (8u * std::size(data));
  return out;
}


cqlxx::varint_codec::varint_codec() :
        mapping_codec{default_codec<bytes>(), data_type{type_kind::varint}}
{}


cqlxx::varint
cqlxx::varint_codec::decode(std::optional<bytes_view> data) const
{
  if (not data.has_value())
    return {};
  return mapping_codec::decode(data);
}


std::string cqlxx::varint_codec::format(varint const &value) const
{
  return value.str();
}


cqlxx::varint cqlxx::varint_codec::parse(std::string_view text) const
{
  if (internal::is_null_literal(text))
    return {};
  auto body{internal::trim(text)};
  bool const negative{take_sign(body)};
  varint value;
  if (std::empty(body) or not add_digits(value, body))
    internal::throw_bad_literal(cql_type(), text);
  if (negative)
    value = -value;
  return value;
}


cqlxx::varint cqlxx::varint_codec::inner_to_outer(bytes const &data) const
{
  return internal::read_varint(data);
}


cqlxx::bytes cqlxx::varint_codec::outer_to_inner(varint const &value) const
{
  return internal::varint_bytes(value);
}


cqlxx::decimal_codec::decimal_codec() :
        mapping_codec{default_codec<bytes>(), data_type{type_kind::decimal}}
{}


cqlxx::decimal
cqlxx::decimal_codec::decode(std::optional<bytes_view> data) const
{
  if (not data.has_value() or std::empty(*data))
    return {};
  return mapping_codec::decode(data);
}


/** Plain notation where that stays short, scientific notation otherwise, in
 * the same way as Java's BigDecimal.  Either way the literal parses back to
 * the same unscaled value and scale.
 */
std::string cqlxx::decimal_codec::format(decimal const &value) const
{
  auto digits{varint{boost::multiprecision::abs(value.unscaled)}.str()};
  auto const adjusted{
    static_cast<std::int64_t>(std::size(digits)) - 1 - value.scale};

  std::string body;
  if (value.scale >= 0 and adjusted >= -6)
  {
    auto const scale{static_cast<std::size_t>(value.scale)};
    if (scale > 0)
    {
      if (std::size(digits) <= scale)
        digits.insert(0, scale + 1 - std::size(digits), '0');
      digits.insert(std::size(digits) - scale, 1, '.');
    }
    body = std::move(digits);
  }
  else
  {
    body = digits.substr(0, 1);
    if (std::size(digits) > 1)
      body = internal::concat(body, '.', digits.substr(1));
    body = internal::concat(body, 'E', (adjusted >= 0) ? "+" : "", adjusted);
  }
  return (value.unscaled < 0) ? internal::concat('-', body) : body;
}


cqlxx::decimal cqlxx::decimal_codec::parse(std::string_view text) const
{
  if (internal::is_null_literal(text))
    return {};
  auto body{internal::trim(text)};
  bool const negative{take_sign(body)};

  std::int32_t exponent{0};
  if (auto const e{body.find_first_of("eE")}; e != std::string_view::npos)
  {
    auto power{body.substr(e + 1)};
    if (not std::empty(power) and power.front() == '+')
      power.remove_prefix(1);
    auto const end{std::data(power) + std::size(power)};
    auto const res{std::from_chars(std::data(power), end, exponent)};
    if (std::empty(power) or res.ec != std::errc{} or res.ptr != end)
      internal::throw_bad_literal(cql_type(), text);
    body = body.substr(0, e);
  }

  auto const point{body.find('.')};
  auto const whole{body.substr(0, point)};
  auto const fraction{
    (point == std::string_view::npos) ? std::string_view{} :
                                        body.substr(point + 1)};
  decimal out;
  if (
    (std::empty(whole) and std::empty(fraction)) or
    not add_digits(out.unscaled, whole) or
    not add_digits(out.unscaled, fraction))
    internal::throw_bad_literal(cql_type(), text);

  auto const scale{static_cast<std::int64_t>(std::size(fraction)) - exponent};
  if (
    scale < std::numeric_limits<std::int32_t>::min() or
    scale > std::numeric_limits<std::int32_t>::max())
    internal::throw_bad_literal(cql_type(), text);
  out.scale = static_cast<std::int32_t>(scale);
  if (negative)
    out.unscaled = -out.unscaled;
  return out;
}


cqlxx::decimal cqlxx::decimal_codec::inner_to_outer(bytes const &data) const
{
  constexpr std::size_t scale_size{sizeof(std::int32_t)};
  if (std::size(data) < scale_size)
    throw decode_error{
      "Decimal value too short to hold its scale", scale_size,
      std::size(data)};
  bytes_view const all{data};
  return {
    internal::read_varint(all.subspan(scale_size)),
    internal::read_be<std::int32_t>(all)};
}


cqlxx::bytes cqlxx::decimal_codec::outer_to_inner(decimal const &value) const
{
  bytes out;
  internal::write_be(out, value.scale);
  auto const digits{internal::varint_bytes(value.unscaled)};
  out.insert(std::end(out), std::begin(digits), std::end(digits));
  return out;
}
