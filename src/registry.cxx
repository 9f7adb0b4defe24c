/** Implementation of the codec registry.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include <mutex>
#include <utility>

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/internal/log.hxx"
#include "cqlxx/primitives.hxx"
#include "cqlxx/registry.hxx"

#include "cqlxx/internal/header-post.hxx"


namespace
{
/// Describe a sample value for error messages.
std::string describe_sample(std::any const &sample)
{
  if (not sample.has_value())
    return "empty value";
  return cqlxx::internal::concat("value of C++ type ", sample.type().name());
}
} // namespace


cqlxx::codec_registry::codec_registry(bool builtins)
{
  if (not builtins)
    return;

  // Where two built-ins share a C++ type, the later one wins lookups by
  // value.  So ascii goes before text, and counter before bigint.
  m_codecs = {
    std::make_shared<text_codec const>(type_kind::ascii),
    std::make_shared<integral_codec<std::int64_t> const>(type_kind::counter),
    default_codec<std::int8_t>(),
    default_codec<std::int16_t>(),
    default_codec<std::int32_t>(),
    default_codec<std::int64_t>(),
    default_codec<float>(),
    default_codec<double>(),
    default_codec<bool>(),
    default_codec<std::string>(),
    default_codec<bytes>(),
    default_codec<timestamp>(),
    default_codec<varint>(),
    default_codec<decimal>(),
  };
}


void cqlxx::codec_registry::register_codec(any_codec_ptr c)
{
  if (not c)
    throw argument_error{"Registering a null codec."};
  CQLXX_LOG_DEBUG("Registering {}.", c->describe());
  std::unique_lock const lock{m_mutex};
  m_codecs.push_back(std::move(c));
}


std::size_t cqlxx::codec_registry::size() const
{
  std::shared_lock const lock{m_mutex};
  return std::size(m_codecs);
}


cqlxx::any_codec_ptr
cqlxx::codec_registry::resolve(data_type const &type) const
{
  return adapt(
    find(
      [&type](codec_base const &c) { return c.accepts(type); },
      type.to_string()),
    type);
}


cqlxx::any_codec_ptr cqlxx::codec_registry::resolve(
  data_type const &type, std::any const &sample) const
{
  return adapt(
    find(
      [&type, &sample](codec_base const &c) {
        return c.accepts(type) and c.accepts(sample);
      },
      internal::concat(type.to_string(), " and ", describe_sample(sample))),
    type);
}


cqlxx::any_codec_ptr
cqlxx::codec_registry::resolve(std::any const &sample) const
{
  return find(
    [&sample](codec_base const &c) { return c.accepts(sample); },
    describe_sample(sample));
}


cqlxx::any_codec_ptr cqlxx::codec_registry::find(
  predicate const &match, std::string const &what) const
{
  std::shared_lock const lock{m_mutex};
  any_codec_ptr found;
  std::size_t matches{0};
  for (auto c{std::rbegin(m_codecs)}; c != std::rend(m_codecs); ++c)
    if (match(**c))
    {
      if (matches++ == 0)
        found = *c;
    }

  if (not found)
    throw codec_not_found{internal::concat("No codec found for ", what, ".")};
  if (matches > 1)
    CQLXX_LOG_DEBUG(
      "{} codecs match {}; using the most recently registered, {}.", matches,
      what, found->describe());
  return found;
}


cqlxx::any_codec_ptr cqlxx::codec_registry::adapt(
  any_codec_ptr const &c, data_type const &type) const
{
  auto adapted{c->adapt_any(type)};
  return adapted ? adapted : c;
}
