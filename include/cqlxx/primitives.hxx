/* Codecs for CQL's primitive types.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/primitives instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_PRIMITIVES)
#  define CQLXX_H_PRIMITIVES

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <bit>
#  include <charconv>
#  include <chrono>
#  include <cmath>
#  include <concepts>
#  include <cstdint>
#  include <limits>
#  include <memory>
#  include <string>
#  include <system_error>
#  include <type_traits>

#  include <boost/multiprecision/cpp_int.hpp>

#  include "cqlxx/codec.hxx"
#  include "cqlxx/internal/literal.hxx"
#  include "cqlxx/internal/wire.hxx"
#  include "cqlxx/mapping_codec.hxx"


namespace cqlxx::internal
{
/// Throw @ref argument_error for an invalid literal of type `type`.
[[noreturn]] CQLXX_LIBEXPORT CQLXX_COLD void
throw_bad_literal(data_type const &type, std::string_view text);


/// Check wire data against a fixed-width type's width.
/** Returns false for an absent or empty value, which decodes as zero.
 */
CQLXX_LIBEXPORT bool
check_width(data_type const &type, std::optional<bytes_view> data);


/// Parse a numeric literal, taking up all of `text`.
template<typename TYPE>
[[nodiscard]] inline TYPE parse_number(data_type const &type, std::string_view text)
{
  auto const body{trim(text)};
  TYPE value{};
  auto const end{std::data(body) + std::size(body)};
  auto const res{std::from_chars(std::data(body), end, value)};
  if (res.ec != std::errc{} or res.ptr != end)
    throw_bad_literal(type, text);
  return value;
}
} // namespace cqlxx::internal


namespace cqlxx
{
/// Codec for the integral types: `tinyint`, `smallint`, `int`, `bigint`.
/** Also `counter`, which is a `bigint` on the wire.  Values are big-endian
 * two's complement.
 */
template<std::integral TYPE> class integral_codec final : public codec<TYPE>
{
public:
  explicit integral_codec(type_kind kind) : m_type{kind}
  {
    if (m_type.fixed_width() != sizeof(TYPE))
      throw usage_error{internal::concat(
        "C++ type ", typeid(TYPE).name(), " does not fit CQL type ",
        m_type.to_string(), ".")};
  }

  [[nodiscard]] data_type cql_type() const override { return m_type; }

  [[nodiscard]] wire_value encode(TYPE const &value) const override
  {
    bytes out;
    out.reserve(sizeof(TYPE));
    internal::write_be(out, value);
    return out;
  }

  [[nodiscard]] TYPE decode(std::optional<bytes_view> data) const override
  {
    if (not internal::check_width(m_type, data))
      return 0;
    return internal::read_be<TYPE>(*data);
  }

  [[nodiscard]] std::string format(TYPE const &value) const override
  {
    return internal::concat(value);
  }

  [[nodiscard]] TYPE parse(std::string_view text) const override
  {
    if (internal::is_null_literal(text))
      return 0;
    return internal::parse_number<TYPE>(m_type, text);
  }

private:
  data_type m_type;
};


/// Codec for `float` and `double`: IEEE 754, big-endian.
template<std::floating_point TYPE>
class floating_codec final : public codec<TYPE>
{
  using bits_type =
    std::conditional_t<sizeof(TYPE) == 4, std::uint32_t, std::uint64_t>;
  static_assert(sizeof(bits_type) == sizeof(TYPE));

public:
  floating_codec() :
          m_type{sizeof(TYPE) == 4 ? type_kind::float_ : type_kind::double_}
  {}

  [[nodiscard]] data_type cql_type() const override { return m_type; }

  [[nodiscard]] wire_value encode(TYPE const &value) const override
  {
    bytes out;
    out.reserve(sizeof(TYPE));
    internal::write_be(out, std::bit_cast<bits_type>(value));
    return out;
  }

  [[nodiscard]] TYPE decode(std::optional<bytes_view> data) const override
  {
    if (not internal::check_width(m_type, data))
      return 0;
    return std::bit_cast<TYPE>(internal::read_be<bits_type>(*data));
  }

  [[nodiscard]] std::string format(TYPE const &value) const override
  {
    if (std::isnan(value))
      return "NaN";
    if (std::isinf(value))
      return (value > 0) ? "Infinity" : "-Infinity";
    auto text{internal::concat(value)};
    // CQL needs a decimal point to tell a floating-point literal from an int.
    if (text.find_first_of(".e") == std::string::npos)
      text.append(".0");
    return text;
  }

  [[nodiscard]] TYPE parse(std::string_view text) const override
  {
    if (internal::is_null_literal(text))
      return 0;
    auto const body{internal::trim(text)};
    if (internal::iequals(body, "NaN"))
      return std::numeric_limits<TYPE>::quiet_NaN();
    if (internal::iequals(body, "Infinity"))
      return std::numeric_limits<TYPE>::infinity();
    if (internal::iequals(body, "-Infinity"))
      return -std::numeric_limits<TYPE>::infinity();
    return internal::parse_number<TYPE>(m_type, text);
  }

private:
  data_type m_type;
};


/// Codec for `boolean`: one byte, zero or one.
class CQLXX_LIBEXPORT boolean_codec final : public codec<bool>
{
public:
  [[nodiscard]] data_type cql_type() const override;
  [[nodiscard]] wire_value encode(bool const &value) const override;
  [[nodiscard]] bool decode(std::optional<bytes_view> data) const override;
  [[nodiscard]] std::string format(bool const &value) const override;
  [[nodiscard]] bool parse(std::string_view text) const override;
};


/// Codec for `text` (UTF-8) and `ascii`.
/** Literals are single-quoted, with any quotes inside doubled up.  The text
 * codec does not validate UTF-8; the ascii codec refuses to encode bytes
 * outside the 7-bit range.
 */
class CQLXX_LIBEXPORT text_codec final : public codec<std::string>
{
public:
  explicit text_codec(type_kind kind = type_kind::text);

  [[nodiscard]] data_type cql_type() const override;
  [[nodiscard]] wire_value encode(std::string const &value) const override;
  [[nodiscard]] std::string
  decode(std::optional<bytes_view> data) const override;
  [[nodiscard]] std::string format(std::string const &value) const override;
  [[nodiscard]] std::string parse(std::string_view text) const override;

private:
  type_kind m_kind;
};


/// Codec for `blob`: raw bytes.  Literals are hex, prefixed with "0x".
class CQLXX_LIBEXPORT blob_codec final : public codec<bytes>
{
public:
  [[nodiscard]] data_type cql_type() const override;
  [[nodiscard]] wire_value encode(bytes const &value) const override;
  [[nodiscard]] bytes decode(std::optional<bytes_view> data) const override;
  [[nodiscard]] std::string format(bytes const &value) const override;
  [[nodiscard]] bytes parse(std::string_view text) const override;
};


/// Point in time, as CQL's `timestamp` stores it: milliseconds since 1970.
/** The millisecond resolution covers CQL's full `bigint` range.  A
 * `system_clock::time_point` counts nanoseconds, and overflows after 2262.
 * Convert one using `std::chrono::time_point_cast<std::chrono::milliseconds>`.
 */
using timestamp = std::chrono::sys_time<std::chrono::milliseconds>;


/// Codec for `timestamp`: milliseconds since the epoch, as a `bigint`.
class CQLXX_LIBEXPORT timestamp_codec final
        : public mapping_codec<std::int64_t, timestamp>
{
public:
  timestamp_codec();

protected:
  [[nodiscard]] timestamp
  inner_to_outer(std::int64_t const &millis) const override;
  [[nodiscard]] std::int64_t
  outer_to_inner(timestamp const &value) const override;
};


/// Integer of any size, as CQL's `varint` stores it.
using varint = boost::multiprecision::cpp_int;


/// Decimal number of any size and precision, as CQL's `decimal` stores it.
/** The value is `unscaled` times ten to the power of minus `scale`: 123.45
 * is 12345 with scale 2, and 1200 can be 12 with scale -2.  Equality compares
 * both parts, so 1.0 and 1.00 are different values.
 */
struct CQLXX_LIBEXPORT decimal
{
  varint unscaled;
  std::int32_t scale{0};

  [[nodiscard]] bool operator==(decimal const &) const = default;
};
} // namespace cqlxx


namespace cqlxx::internal
{
/// Encode `value` as big-endian two's complement, in as few bytes as will do.
[[nodiscard]] CQLXX_LIBEXPORT bytes varint_bytes(varint const &value);

/// Decode big-endian two's complement of any length.  No bytes means zero.
[[nodiscard]] CQLXX_LIBEXPORT varint read_varint(bytes_view data);
} // namespace cqlxx::internal


namespace cqlxx
{
/// Codec for `varint`, on top of the blob codec.
/** Literals are plain decimal integers, with an optional sign.  An absent
 * value decodes as zero.
 */
class CQLXX_LIBEXPORT varint_codec final : public mapping_codec<bytes, varint>
{
public:
  varint_codec();

  [[nodiscard]] varint decode(std::optional<bytes_view> data) const override;
  [[nodiscard]] std::string format(varint const &value) const override;
  [[nodiscard]] varint parse(std::string_view text) const override;

protected:
  [[nodiscard]] varint inner_to_outer(bytes const &data) const override;
  [[nodiscard]] bytes outer_to_inner(varint const &value) const override;
};


/// Codec for `decimal`: a 4-byte scale, followed by the unscaled `varint`.
/** Literals look like `-12.50`, or `12E+3` for a negative scale.  An absent
 * or empty value decodes as zero.
 */
class CQLXX_LIBEXPORT decimal_codec final
        : public mapping_codec<bytes, decimal>
{
public:
  decimal_codec();

  [[nodiscard]] decimal decode(std::optional<bytes_view> data) const override;
  [[nodiscard]] std::string format(decimal const &value) const override;
  [[nodiscard]] decimal parse(std::string_view text) const override;

protected:
  [[nodiscard]] decimal inner_to_outer(bytes const &data) const override;
  [[nodiscard]] bytes outer_to_inner(decimal const &value) const override;
};


template<> struct natural_codec<std::int8_t>
{
  [[nodiscard]] static codec_ptr<std::int8_t> get()
  {
    static auto const c{
      std::make_shared<integral_codec<std::int8_t> const>(type_kind::tinyint)};
    return c;
  }
};


template<> struct natural_codec<std::int16_t>
{
  [[nodiscard]] static codec_ptr<std::int16_t> get()
  {
    static auto const c{std::make_shared<integral_codec<std::int16_t> const>(
      type_kind::smallint)};
    return c;
  }
};


template<> struct natural_codec<std::int32_t>
{
  [[nodiscard]] static codec_ptr<std::int32_t> get()
  {
    static auto const c{
      std::make_shared<integral_codec<std::int32_t> const>(type_kind::int_)};
    return c;
  }
};


template<> struct natural_codec<std::int64_t>
{
  [[nodiscard]] static codec_ptr<std::int64_t> get()
  {
    static auto const c{
      std::make_shared<integral_codec<std::int64_t> const>(type_kind::bigint)};
    return c;
  }
};


template<> struct natural_codec<float>
{
  [[nodiscard]] static codec_ptr<float> get()
  {
    static auto const c{std::make_shared<floating_codec<float> const>()};
    return c;
  }
};


template<> struct natural_codec<double>
{
  [[nodiscard]] static codec_ptr<double> get()
  {
    static auto const c{std::make_shared<floating_codec<double> const>()};
    return c;
  }
};


template<> struct natural_codec<bool>
{
  [[nodiscard]] static codec_ptr<bool> get()
  {
    static auto const c{std::make_shared<boolean_codec const>()};
    return c;
  }
};


template<> struct natural_codec<std::string>
{
  [[nodiscard]] static codec_ptr<std::string> get()
  {
    static auto const c{std::make_shared<text_codec const>()};
    return c;
  }
};


template<> struct natural_codec<bytes>
{
  [[nodiscard]] static codec_ptr<bytes> get()
  {
    static auto const c{std::make_shared<blob_codec const>()};
    return c;
  }
};


template<> struct natural_codec<timestamp>
{
  [[nodiscard]] static codec_ptr<timestamp> get()
  {
    static auto const c{std::make_shared<timestamp_codec const>()};
    return c;
  }
};


template<> struct natural_codec<varint>
{
  [[nodiscard]] static codec_ptr<varint> get()
  {
    static auto const c{std::make_shared<varint_codec const>()};
    return c;
  }
};


template<> struct natural_codec<decimal>
{
  [[nodiscard]] static codec_ptr<decimal> get()
  {
    static auto const c{std::make_shared<decimal_codec const>()};
    return c;
  }
};
} // namespace cqlxx
#endif
