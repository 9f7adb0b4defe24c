/* Low-level helpers for reading and writing the CQL binary format.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; other headers include it where needed.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_WIRE)
#  define CQLXX_H_WIRE

#  include <concepts>
#  include <cstdint>
#  include <string>
#  include <string_view>
#  include <type_traits>

#  include "cqlxx/types.hxx"

namespace cqlxx::internal
{
/// Length prefix which marks a framed value as absent.
inline constexpr std::int32_t null_length{-1};


/// Append `value` to `out`, in big-endian byte order.
template<std::integral TYPE> inline void write_be(bytes &out, TYPE value)
{
  using unsigned_type = std::make_unsigned_t<TYPE>;
  auto const u{static_cast<unsigned_type>(value)};
  for (std::size_t shift{sizeof(TYPE)}; shift > 0; --shift)
    out.push_back(static_cast<std::byte>((u >> (8 * (shift - 1))) & 0xff));
}


/// Read a big-endian integer.  The caller checks the length.
template<std::integral TYPE>
[[nodiscard]] inline TYPE read_be(bytes_view data) noexcept
{
  using unsigned_type = std::make_unsigned_t<TYPE>;
  unsigned_type u{0};
  for (auto const b : data.first(sizeof(TYPE)))
    u = static_cast<unsigned_type>(
      (u << 8) | std::to_integer<unsigned_type>(b));
  return static_cast<TYPE>(u);
}


/// Append a 4-byte length prefix and then the value itself.
/** An absent value is written as just the length `-1`.
 */
CQLXX_LIBEXPORT void write_framed(bytes &out, std::optional<bytes_view> value);


/// Sequential reader for a buffer of wire data.
/** Every read checks that there is enough data left, and throws
 * @ref decode_error if there isn't.  The `what` arguments describe the item
 * being read, for use in error messages.
 */
class CQLXX_LIBEXPORT wire_reader final
{
public:
  explicit wire_reader(bytes_view data) noexcept : m_data{data} {}

  /// Read a 4-byte big-endian signed integer.
  [[nodiscard]] std::int32_t read_int(std::string_view what);

  /// Read a length-prefixed value.  A length of -1 means "absent."
  [[nodiscard]] std::optional<bytes_view> read_framed(std::string_view what);

  [[nodiscard]] bool at_end() const noexcept
  {
    return m_pos == std::size(m_data);
  }

  [[nodiscard]] std::size_t remaining() const noexcept
  {
    return std::size(m_data) - m_pos;
  }

  /// Throw @ref decode_error if there is any data left over.
  void expect_end(std::string_view what) const;

private:
  bytes_view m_data;
  std::size_t m_pos{0};
};


/// Render binary data as lower-case hexadecimal, without prefix.
[[nodiscard]] CQLXX_LIBEXPORT std::string to_hex(bytes_view data);


/// Parse hexadecimal digits (either case) into binary data.
/** @throw argument_error if `text` contains a non-hex character, or has an
 * odd number of digits.
 */
[[nodiscard]] CQLXX_LIBEXPORT bytes from_hex(std::string_view text);
} // namespace cqlxx::internal
#endif
