/* Helpers for the textual CQL literal format.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; other headers include it where needed.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_LITERAL)
#  define CQLXX_H_LITERAL

#  include <optional>
#  include <string>
#  include <string_view>
#  include <vector>

namespace cqlxx::internal
{
/// The literal for a null value.
inline constexpr std::string_view null_literal{"NULL"};


/// Strip leading and trailing whitespace.
[[nodiscard]] CQLXX_LIBEXPORT CQLXX_PURE std::string_view
trim(std::string_view text) noexcept;


/// Is `text` a null literal?  That's `NULL` in any case, or nothing at all.
[[nodiscard]] CQLXX_LIBEXPORT CQLXX_PURE bool
is_null_literal(std::string_view text) noexcept;


/// Case-insensitive comparison of ASCII text.
[[nodiscard]] CQLXX_LIBEXPORT CQLXX_PURE bool
iequals(std::string_view lhs, std::string_view rhs) noexcept;


/// Quote `text` as a CQL string literal: `it's` becomes `'it''s'`.
[[nodiscard]] CQLXX_LIBEXPORT std::string quote(std::string_view text);


/// Undo @ref quote.  Returns nothing if `text` is not a valid string literal.
[[nodiscard]] CQLXX_LIBEXPORT std::optional<std::string>
unquote(std::string_view text);


/// Split the body of a collection or UDT literal on `separator`.
/** Only splits at the top nesting level: separators inside nested brackets,
 * braces, or quoted strings do not count.  Each resulting item is trimmed.
 *
 * Returns nothing if the brackets and quotes in `body` are not properly
 * balanced, or if any item is empty.
 */
[[nodiscard]] CQLXX_LIBEXPORT std::optional<std::vector<std::string_view>>
split_top_level(std::string_view body, char separator);
} // namespace cqlxx::internal
#endif
