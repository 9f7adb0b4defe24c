/* Paging through query results, and transportable paging tokens.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/paging instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_PAGING)
#  define CQLXX_H_PAGING

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <memory>
#  include <optional>
#  include <string>
#  include <string_view>
#  include <utility>
#  include <vector>

#  include "cqlxx/codec.hxx"
#  include "cqlxx/except.hxx"
#  include "cqlxx/row.hxx"


namespace cqlxx
{
/// Identity of one execution of a query: its text, and its parameters.
/** The parameters are in encoded form, in order.  A null parameter is
 * absent.  Two fingerprints are equal only if the query text and all of the
 * parameters are exactly equal.
 */
struct CQLXX_LIBEXPORT query_fingerprint
{
  std::string query;
  std::vector<wire_value> params;

  [[nodiscard]] bool operator==(query_fingerprint const &) const = default;

  /// Name the first component in which `other` differs from this one.
  /** Returns "query", "parameter count", or "parameter N" (counting from 1).
   * Returns nothing if the two are equal.
   */
  [[nodiscard]] std::optional<std::string>
  first_difference(query_fingerprint const &other) const;
};


/// Create a @ref query_fingerprint, encoding `args` with their default codecs.
template<typename... ARGS>
[[nodiscard]] inline query_fingerprint
fingerprint(std::string query, ARGS const &...args)
{
  return {std::move(query), {default_codec<ARGS>()->encode(args)...}};
}


/// The execution layer's opaque continuation token.
class CQLXX_LIBEXPORT paging_state
{
public:
  explicit paging_state(bytes raw) : m_raw{std::move(raw)} {}

  [[nodiscard]] bytes const &raw() const noexcept { return m_raw; }

  [[nodiscard]] bool operator==(paging_state const &) const = default;

private:
  bytes m_raw;
};


/// A paging state, bound to the query execution which produced it.
struct CQLXX_LIBEXPORT cursor_envelope
{
  paging_state state;
  query_fingerprint fingerprint;

  /// Encode as CBOR.
  [[nodiscard]] bytes to_cbor() const;

  /// Decode CBOR as written by @ref to_cbor.
  /** @throw corrupted_state if `data` is not a valid envelope.
   */
  [[nodiscard]] static cursor_envelope from_cbor(bytes_view data);
};


/// One page of results, fresh from the execution layer.
struct CQLXX_LIBEXPORT fetched_page
{
  std::vector<row> rows;
  /// Where the next page starts.  Nothing if this was the last page.
  std::optional<paging_state> next;
};


/// The execution layer, as far as paging is concerned.
class CQLXX_LIBEXPORT page_source
{
public:
  virtual ~page_source() noexcept;

  /// Execute the query `query`, and return up to `page_size` rows.
  /** Starts at `state` if given, or at the beginning if not.
   */
  [[nodiscard]] virtual fetched_page fetch(
    query_fingerprint const &query, std::optional<paging_state> const &state,
    std::size_t page_size) = 0;
};


/// Turns a @ref paging_state into a token of type `TOKEN`, and back.
template<typename TOKEN> class pager_serializer
{
public:
  using token_type = TOKEN;

  virtual ~pager_serializer() = default;

  [[nodiscard]] virtual TOKEN
  serialize(paging_state const &state, query_fingerprint const &query) const =
    0;

  /// Recover a paging state from `token`, for resuming `query`.
  /** @throw corrupted_state if `token` is not a valid token.
   * @throw statement_mismatch if `token` is for a different query execution.
   */
  [[nodiscard]] virtual paging_state
  deserialize(TOKEN const &token, query_fingerprint const &query) const = 0;
};


/// Serializer which hands out the raw paging state.
/** This checks nothing.  The execution layer will refuse a paging state for
 * a query of a different shape, but a paging state for another query with
 * the same shape will go through, and produce rows of that other query.
 */
class CQLXX_LIBEXPORT simple_pager_serializer final
        : public pager_serializer<bytes>
{
public:
  [[nodiscard]] bytes serialize(
    paging_state const &state, query_fingerprint const &query) const override;

  [[nodiscard]] paging_state deserialize(
    bytes const &token, query_fingerprint const &query) const override;
};


/// Serializer which signs the paging state together with its query.
/** The token is hexadecimal text: a CBOR @ref cursor_envelope, followed by
 * its HMAC-SHA256 digest.  The key defaults to empty, which detects
 * corruption but not forgery.  Give it a secret key to detect forgery.
 */
class CQLXX_LIBEXPORT default_pager_serializer final
        : public pager_serializer<std::string>
{
public:
  /// Size of the digest at the end of a token.
  static constexpr std::size_t tag_size{32};

  explicit default_pager_serializer(std::string key = {});

  [[nodiscard]] std::string serialize(
    paging_state const &state, query_fingerprint const &query) const override;

  [[nodiscard]] paging_state deserialize(
    std::string const &token, query_fingerprint const &query) const override;

private:
  [[nodiscard]] bytes sign(bytes_view body) const;

  std::string m_key;
};


/// Where a @ref pager is in its query's results.
enum class pager_status
{
  /// Nothing fetched yet.
  no_cursor,
  /// Fetched at least one page, and there may be more.
  has_cursor,
  /// All rows fetched.
  exhausted,
};


[[nodiscard]] CQLXX_LIBEXPORT std::string_view name_of(pager_status) noexcept;


/// Fetches a query's results one page at a time.
/** A pager does not change.  Executing it returns the rows of the next page,
 * plus a new pager for the rest of the results.
 */
template<typename TYPE> class pager
{
public:
  pager(
    std::shared_ptr<page_source> source, query_fingerprint query,
    row_mapper_ptr<TYPE> mapper = default_row_mapper<TYPE>()) :
          pager{
            std::move(source), std::move(query), std::move(mapper),
            pager_status::no_cursor, std::nullopt}
  {}

  [[nodiscard]] pager_status status() const noexcept { return m_status; }

  [[nodiscard]] query_fingerprint const &query() const noexcept
  {
    return m_query;
  }

  [[nodiscard]] std::optional<paging_state> const &state() const noexcept
  {
    return m_state;
  }

  /// Fetch up to `page_size` rows.
  /** Once the pager is exhausted, this returns no rows, and an exhausted
   * pager.
   *
   * @throw argument_error if `page_size` is zero.
   */
  [[nodiscard]] std::pair<pager, std::vector<TYPE>>
  execute(std::size_t page_size) const
  {
    if (page_size == 0)
      throw argument_error{"Page size must be at least 1."};
    if (m_status == pager_status::exhausted)
      return {*this, {}};

    auto page{m_source->fetch(m_query, m_state, page_size)};
    std::vector<TYPE> out;
    out.reserve(std::size(page.rows));
    for (auto const &r : page.rows) out.push_back(m_mapper->map(r));

    auto const more{page.next.has_value() and not std::empty(page.next->raw())};
    pager next{
      m_source, m_query, m_mapper,
      more ? pager_status::has_cursor : pager_status::exhausted,
      more ? std::move(page.next) : std::optional<paging_state>{}};
    return {std::move(next), std::move(out)};
  }

  /// Produce a token from which the pager can be resumed later.
  /** Returns nothing unless the pager's status is `has_cursor`.
   */
  template<typename TOKEN>
  [[nodiscard]] std::optional<TOKEN>
  encode_paging_state(pager_serializer<TOKEN> const &serializer) const
  {
    if (m_status != pager_status::has_cursor)
      return {};
    return serializer.serialize(*m_state, m_query);
  }

  /// Recreate a pager from a token made by @ref encode_paging_state.
  /** @throw corrupted_state if `token` is not a valid token.
   * @throw statement_mismatch if `token` is for a different query execution.
   */
  template<typename TOKEN>
  [[nodiscard]] static pager resume(
    std::shared_ptr<page_source> source, query_fingerprint query,
    pager_serializer<TOKEN> const &serializer, TOKEN const &token,
    row_mapper_ptr<TYPE> mapper = default_row_mapper<TYPE>())
  {
    auto state{serializer.deserialize(token, query)};
    return pager{
      std::move(source), std::move(query), std::move(mapper),
      pager_status::has_cursor, std::move(state)};
  }

private:
  pager(
    std::shared_ptr<page_source> source, query_fingerprint query,
    row_mapper_ptr<TYPE> mapper, pager_status status,
    std::optional<paging_state> state) :
          m_source{std::move(source)},
          m_query{std::move(query)},
          m_mapper{std::move(mapper)},
          m_status{status},
          m_state{std::move(state)}
  {
    if (not m_source)
      throw usage_error{"Creating a pager without a page source."};
    if (not m_mapper)
      throw usage_error{"Creating a pager without a row mapper."};
  }

  std::shared_ptr<page_source> m_source;
  query_fingerprint m_query;
  row_mapper_ptr<TYPE> m_mapper;
  pager_status m_status;
  std::optional<paging_state> m_state;
};
} // namespace cqlxx
#endif
