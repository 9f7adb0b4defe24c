/* Basic type aliases and forward declarations.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/types instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_TYPES)
#  define CQLXX_H_TYPES

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <cstddef>
#  include <memory>
#  include <optional>
#  include <source_location>
#  include <span>
#  include <string_view>
#  include <vector>

namespace cqlxx
{
/// Convenience alias for `std::source_location`.  It's just so long.
using sl = std::source_location;


/// Binary data, as it goes over the wire.
using bytes = std::vector<std::byte>;


/// Non-owning view on binary data.
using bytes_view = std::span<std::byte const>;


/// A value in wire format, or no value at all (a CQL null).
using wire_value = std::optional<bytes>;


class codec_base;
template<typename TYPE> class codec;
class codec_registry;
class data_type;
struct field_descriptor;
class naming_scheme;
class paging_state;
class page_source;
struct query_fingerprint;
class row;


/// Shared, immutable codec for values of type `TYPE`.
template<typename TYPE> using codec_ptr = std::shared_ptr<codec<TYPE> const>;


/// Shared, immutable codec of unknown value type.
using any_codec_ptr = std::shared_ptr<codec_base const>;


/// Copy text into a binary buffer, byte for byte.
[[nodiscard]] inline bytes to_bytes(std::string_view text)
{
  bytes out;
  out.reserve(std::size(text));
  for (char const c : text) out.push_back(static_cast<std::byte>(c));
  return out;
}


/// View binary data as text, byte for byte.
[[nodiscard]] inline std::string_view as_text(bytes_view data) noexcept
{
  return {reinterpret_cast<char const *>(std::data(data)), std::size(data)};
}
} // namespace cqlxx
#endif
