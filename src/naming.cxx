/** Implementation of the built-in naming schemes.
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
#include "cqlxx/naming.hxx"

#include "cqlxx/internal/header-post.hxx"


namespace
{
constexpr bool is_upper(char c) noexcept
{
  return c >= 'A' and c <= 'Z';
}


constexpr bool is_lower_or_digit(char c) noexcept
{
  return (c >= 'a' and c <= 'z') or (c >= '0' and c <= '9');
}


std::string to_snake_case(std::string_view name)
{
  std::string out;
  out.reserve(std::size(name) + 4);
  for (std::size_t i{0}; i < std::size(name); ++i)
  {
    char const c{name[i]};
    if (is_upper(c))
    {
      bool const after_word{i > 0 and is_lower_or_digit(name[i - 1])};
      // The last capital of an acronym starts the next word: "HTTPServer".
      bool const ends_acronym{
        i > 0 and is_upper(name[i - 1]) and i + 1 < std::size(name) and
        is_lower_or_digit(name[i + 1])};
      if ((after_word or ends_acronym) and out.back() != '_')
        out.push_back('_');
      out.push_back(static_cast<char>(c - 'A' + 'a'));
    }
    else
    {
      out.push_back(c);
    }
  }
  return out;
}
} // namespace


cqlxx::naming_scheme::naming_scheme(std::string label, mapping map) :
        m_label{std::move(label)}, m_map{std::move(map)}
{
  if (not m_map)
    throw usage_error{
      internal::concat("Naming scheme '", m_label, "' has no mapping.")};
}


cqlxx::naming_scheme cqlxx::naming_scheme::identity()
{
  return {"identity", [](std::string_view name) { return std::string{name}; }};
}


cqlxx::naming_scheme cqlxx::naming_scheme::snake_case()
{
  return {"snake_case", to_snake_case};
}
