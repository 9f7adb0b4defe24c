/** Implementation of the non-template parts of the UDT codecs.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include <string>
#include <string_view>

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/data_type.hxx"
#include "cqlxx/udt.hxx"

#include "cqlxx/internal/header-post.hxx"


std::string cqlxx::udt_options::column_for(std::string_view member) const
{
  if (auto const here{renames.find(member)}; here != std::end(renames))
    return here->second;
  return naming(member);
}


std::string cqlxx::udt_options::type_name(std::string_view cxx_name) const
{
  if (not std::empty(name))
    return name;
  return naming(internal::unqualified(cxx_name));
}


std::string_view cqlxx::internal::unqualified(std::string_view name) noexcept
{
  auto const colon{name.rfind(':')};
  if (colon == std::string_view::npos)
    return name;
  return name.substr(colon + 1);
}


bool cqlxx::internal::same_udt(data_type const &declared, data_type const &live)
{
  if (declared.kind() != type_kind::udt or live.kind() != type_kind::udt)
    return false;
  if (declared.name() != live.name())
    return false;
  return std::empty(declared.keyspace()) or std::empty(live.keyspace()) or
         declared.keyspace() == live.keyspace();
}
