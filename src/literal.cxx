/** Implementation of the CQL literal helpers.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include <algorithm>

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/internal/literal.hxx"

#include "cqlxx/internal/header-post.hxx"


namespace
{
[[nodiscard]] constexpr bool is_space(char c) noexcept
{
  return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\f' or
         c == '\v';
}


[[nodiscard]] constexpr char to_lower(char c) noexcept
{
  return (c >= 'A' and c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}
} // namespace


std::string_view cqlxx::internal::trim(std::string_view text) noexcept
{
  while (not std::empty(text) and is_space(text.front()))
    text.remove_prefix(1);
  while (not std::empty(text) and is_space(text.back())) text.remove_suffix(1);
  return text;
}


bool cqlxx::internal::iequals(
  std::string_view lhs, std::string_view rhs) noexcept
{
  return std::size(lhs) == std::size(rhs) and
         std::equal(
           std::begin(lhs), std::end(lhs), std::begin(rhs),
           [](char l, char r) { return to_lower(l) == to_lower(r); });
}


bool cqlxx::internal::is_null_literal(std::string_view text) noexcept
{
  auto const trimmed{trim(text)};
  return std::empty(trimmed) or iequals(trimmed, null_literal);
}


std::string cqlxx::internal::quote(std::string_view text)
{
  std::string out;
  out.reserve(std::size(text) + 2);
  out.push_back('\'');
  for (char const c : text)
  {
    if (c == '\'')
      out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}


std::optional<std::string> cqlxx::internal::unquote(std::string_view text)
{
  text = trim(text);
  if (std::size(text) < 2 or text.front() != '\'' or text.back() != '\'')
    return {};
  text = text.substr(1, std::size(text) - 2);

  std::string out;
  out.reserve(std::size(text));
  for (std::size_t i{0}; i < std::size(text); ++i)
  {
    if (text[i] == '\'')
    {
      // Inside the quotes, a quote must be doubled.
      if (i + 1 == std::size(text) or text[i + 1] != '\'')
        return {};
      ++i;
    }
    out.push_back(text[i]);
  }
  return out;
}


std::optional<std::vector<std::string_view>>
cqlxx::internal::split_top_level(std::string_view body, char separator)
{
  std::vector<std::string_view> items;
  std::vector<char> closers;
  bool quoted{false};
  std::size_t start{0};

  auto const take{[&](std::size_t end) {
    auto const item{trim(body.substr(start, end - start))};
    if (std::empty(item))
      return false;
    items.push_back(item);
    return true;
  }};

  for (std::size_t i{0}; i < std::size(body); ++i)
  {
    char const c{body[i]};
    if (quoted)
    {
      if (c == '\'')
      {
        if (i + 1 < std::size(body) and body[i + 1] == '\'')
          ++i;
        else
          quoted = false;
      }
      continue;
    }

    switch (c)
    {
    case '\'': quoted = true; break;
    case '{': closers.push_back('}'); break;
    case '[': closers.push_back(']'); break;
    case '(': closers.push_back(')'); break;
    case '}':
    case ']':
    case ')':
      if (std::empty(closers) or closers.back() != c)
        return {};
      closers.pop_back();
      break;
    default:
      if (c == separator and std::empty(closers))
      {
        if (not take(i))
          return {};
        start = i + 1;
      }
      break;
    }
  }

  if (quoted or not std::empty(closers) or not take(std::size(body)))
    return {};
  return items;
}
