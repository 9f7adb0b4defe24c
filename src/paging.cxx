/** Implementation of paging tokens and their serializers.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include <algorithm>
#include <array>
#include <climits>
#include <cstdint>
#include <utility>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/except.hxx"
#include "cqlxx/internal/concat.hxx"
#include "cqlxx/internal/log.hxx"
#include "cqlxx/internal/wire.hxx"
#include "cqlxx/paging.hxx"

#include "cqlxx/internal/header-post.hxx"


namespace
{
using json = nlohmann::json;


/// Format version of the CBOR envelope.
constexpr int envelope_version{1};


json to_binary(cqlxx::bytes_view data)
{
  std::vector<std::uint8_t> out(std::size(data));
  std::transform(
    std::begin(data), std::end(data), std::begin(out),
    [](std::byte b) { return static_cast<std::uint8_t>(b); });
  return json::binary(std::move(out));
}


cqlxx::bytes from_binary(json const &value)
{
  auto const &bin{value.get_binary()};
  cqlxx::bytes out(std::size(bin));
  std::transform(
    std::begin(bin), std::end(bin), std::begin(out),
    [](std::uint8_t b) { return static_cast<std::byte>(b); });
  return out;
}


[[noreturn]] void reject_token(std::string_view why)
{
  CQLXX_LOG_DEBUG("Rejecting paging token: {}.", why);
  throw cqlxx::corrupted_state{
    cqlxx::internal::concat("Corrupted paging token: ", why, ".")};
}
} // namespace


std::optional<std::string> cqlxx::query_fingerprint::first_difference(
  query_fingerprint const &other) const
{
  if (query != other.query)
    return "query";
  if (std::size(params) != std::size(other.params))
    return "parameter count";
  for (std::size_t i{0}; i < std::size(params); ++i)
    if (params[i] != other.params[i])
      return internal::concat("parameter ", i + 1);
  return {};
}


cqlxx::bytes cqlxx::cursor_envelope::to_cbor() const
{
  json params = json::array();
  for (auto const &p : fingerprint.params)
    if (p.has_value())
      params.push_back(to_binary(*p));
    else
      params.push_back(nullptr);

  json doc = json::object();
  doc["v"] = envelope_version;
  doc["state"] = to_binary(state.raw());
  doc["query"] = fingerprint.query;
  doc["params"] = std::move(params);

  auto const cbor{json::to_cbor(doc)};
  bytes out(std::size(cbor));
  std::transform(
    std::begin(cbor), std::end(cbor), std::begin(out),
    [](std::uint8_t b) { return static_cast<std::byte>(b); });
  return out;
}


cqlxx::cursor_envelope cqlxx::cursor_envelope::from_cbor(bytes_view data)
{
  auto const *const begin{
    reinterpret_cast<std::uint8_t const *>(std::data(data))};
  try
  {
    auto const doc{json::from_cbor(begin, begin + std::size(data))};
    if (not doc.is_object())
      throw corrupted_state{"Paging token envelope is not a CBOR map."};
    if (doc.at("v").get<int>() != envelope_version)
      throw corrupted_state{internal::concat(
        "Unsupported paging token version: ", doc.at("v").get<int>(), ".")};

    auto const &params{doc.at("params")};
    if (not params.is_array())
      throw corrupted_state{"Paging token parameters are not a CBOR array."};
    query_fingerprint fingerprint{doc.at("query").get<std::string>(), {}};
    for (auto const &p : params)
      if (p.is_null())
        fingerprint.params.emplace_back();
      else
        fingerprint.params.emplace_back(from_binary(p));

    return {paging_state{from_binary(doc.at("state"))}, std::move(fingerprint)};
  }
  catch (json::exception const &e)
  {
    throw corrupted_state{
      internal::concat("Malformed paging token envelope: ", e.what())};
  }
}


cqlxx::page_source::~page_source() noexcept = default;


cqlxx::bytes cqlxx::simple_pager_serializer::serialize(
  paging_state const &state, query_fingerprint const &) const
{
  return state.raw();
}


cqlxx::paging_state cqlxx::simple_pager_serializer::deserialize(
  bytes const &token, query_fingerprint const &) const
{
  if (std::empty(token))
    reject_token("empty");
  return paging_state{token};
}


cqlxx::default_pager_serializer::default_pager_serializer(std::string key) :
        m_key{std::move(key)}
{
  if (std::size(m_key) > static_cast<std::size_t>(INT_MAX))
    throw argument_error{"Paging token key is too long."};
}


cqlxx::bytes cqlxx::default_pager_serializer::sign(bytes_view body) const
{
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len{0};
  auto const *const res{HMAC(
    EVP_sha256(), std::data(m_key), static_cast<int>(std::size(m_key)),
    reinterpret_cast<unsigned char const *>(std::data(body)), std::size(body),
    std::data(digest), &len)};
  if (res == nullptr or len != tag_size)
    throw failure{"Could not compute HMAC-SHA256 digest for paging token."};

  bytes out(tag_size);
  std::transform(
    std::begin(digest), std::begin(digest) + tag_size, std::begin(out),
    [](unsigned char b) { return static_cast<std::byte>(b); });
  return out;
}


std::string cqlxx::default_pager_serializer::serialize(
  paging_state const &state, query_fingerprint const &query) const
{
  auto body{cursor_envelope{state, query}.to_cbor()};
  auto const tag{sign(body)};
  body.insert(std::end(body), std::begin(tag), std::end(tag));
  return internal::to_hex(body);
}


cqlxx::paging_state cqlxx::default_pager_serializer::deserialize(
  std::string const &token, query_fingerprint const &query) const
{
  bytes raw;
  try
  {
    raw = internal::from_hex(token);
  }
  catch (argument_error const &)
  {
    reject_token("not hexadecimal");
  }
  // Tokens are lower-case.  Anything else has been tampered with.
  if (internal::to_hex(raw) != token)
    reject_token("not in canonical form");
  if (std::size(raw) <= tag_size)
    reject_token("too short");

  bytes_view const all{raw};
  auto const body{all.first(std::size(raw) - tag_size)},
    tag{all.last(tag_size)};
  auto const expected{sign(body)};
  if (CRYPTO_memcmp(std::data(expected), std::data(tag), tag_size) != 0)
    reject_token("digest does not match");

  auto envelope{cursor_envelope::from_cbor(body)};
  if (auto const diff{envelope.fingerprint.first_difference(query)};
      diff.has_value())
  {
    CQLXX_LOG_DEBUG("Paging token is for another query: {} differs.", *diff);
    throw statement_mismatch{
      internal::concat(
        "Paging token belongs to a different statement: ", *diff,
        " differs."),
      *diff};
  }
  return std::move(envelope.state);
}


std::string_view cqlxx::name_of(pager_status status) noexcept
{
  switch (status)
  {
  case pager_status::no_cursor: return "no_cursor";
  case pager_status::has_cursor: return "has_cursor";
  case pager_status::exhausted: return "exhausted";
  }
  return "unknown";
}
