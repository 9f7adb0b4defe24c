/** Implementation of the type-erased codec base class.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/codec.hxx"

#include "cqlxx/internal/header-post.hxx"


cqlxx::codec_base::~codec_base() noexcept = default;


bool cqlxx::codec_base::accepts(data_type const &type) const
{
  return cql_type().same_shape(type);
}


bool cqlxx::codec_base::accepts(std::any const &value) const
{
  return value.type() == value_type();
}


std::string cqlxx::codec_base::describe() const
{
  return internal::concat("codec<", cql_type().to_string(), ">");
}
