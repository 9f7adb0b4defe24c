/* Naming schemes: how C++ names map to CQL identifiers.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/naming instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_NAMING)
#  define CQLXX_H_NAMING

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <functional>
#  include <string>
#  include <string_view>

namespace cqlxx
{
/// Translation from a C++ identifier to a CQL identifier.
/** Used for UDT fields, row columns, and nominal enum values.  A field's or
 * column's explicit rename always takes precedence over the naming scheme.
 */
class CQLXX_LIBEXPORT naming_scheme
{
public:
  using mapping = std::function<std::string(std::string_view)>;

  /// Names stay exactly as they are.
  [[nodiscard]] static naming_scheme identity();

  /// `camelCase` and `PascalCase` become `snake_case`.
  /** Existing underscores stay where they are.  A run of capitals counts as
   * one word, so `HTTPServer` becomes `http_server`.
   */
  [[nodiscard]] static naming_scheme snake_case();

  /// Any translation you like.  The label only shows up in diagnostics.
  naming_scheme(std::string label, mapping map);

  [[nodiscard]] std::string operator()(std::string_view name) const
  {
    return m_map(name);
  }

  [[nodiscard]] std::string const &label() const noexcept { return m_label; }

private:
  std::string m_label;
  mapping m_map;
};
} // namespace cqlxx
#endif
