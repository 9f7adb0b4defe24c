/* Internal string concatenation helper.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; other headers include it where needed.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_CONCAT)
#  define CQLXX_H_CONCAT

#  include <charconv>
#  include <concepts>
#  include <string>
#  include <string_view>
#  include <type_traits>

namespace cqlxx::internal
{
inline void append_to(std::string &out, std::string_view text)
{
  out.append(text);
}


inline void append_to(std::string &out, char c)
{
  out.push_back(c);
}


template<typename T>
  requires std::same_as<T, bool>
inline void append_to(std::string &out, T value)
{
  out.append(value ? "true" : "false");
}


template<typename T>
  requires(
    std::is_arithmetic_v<T> and not std::same_as<T, char> and
    not std::same_as<T, bool>)
inline void append_to(std::string &out, T value)
{
  // Large enough for any integral type, and for the shortest round-trip
  // representation of a double.
  char buf[64];
  auto const res{std::to_chars(buf, buf + sizeof(buf), value)};
  out.append(buf, res.ptr);
}


/// Efficiently combine a bunch of items into one big string.
/** Accepts anything that converts to `std::string_view`, individual `char`
 * values, and numbers.
 */
template<typename... TYPE>
[[nodiscard]] inline std::string concat(TYPE const &...item)
{
  std::string buf;
  (append_to(buf, item), ...);
  return buf;
}
} // namespace cqlxx::internal
#endif
