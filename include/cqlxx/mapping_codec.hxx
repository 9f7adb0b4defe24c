/* Mapping codecs: codecs built on top of other codecs.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/mapping_codec instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_MAPPING_CODEC)
#  define CQLXX_H_MAPPING_CODEC

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <functional>
#  include <memory>
#  include <optional>
#  include <typeinfo>
#  include <utility>

#  include "cqlxx/codec.hxx"
#  include "cqlxx/internal/literal.hxx"


namespace cqlxx
{
/// Codec for `OUTER`, implemented in terms of an existing codec for `INNER`.
/** All the wire-format and literal-format work happens in the inner codec.
 * A mapping codec only converts values between `INNER` and `OUTER`, by
 * implementing @ref inner_to_outer and @ref outer_to_inner.
 *
 * Nulls never reach the conversion functions: a null `OUTER` encodes as an
 * absent value, and an absent value decodes as `OUTER`'s null.  If `OUTER`
 * has no null value, decoding an absent value throws @ref unexpected_null.
 *
 * By default, the mapping codec reports the inner codec's CQL type.  You can
 * pass a different one, such as `timestamp` for a codec based on `bigint`.
 */
template<typename INNER, typename OUTER>
class mapping_codec : public codec<OUTER>
{
public:
  explicit mapping_codec(
    codec_ptr<INNER> inner, std::optional<data_type> type = std::nullopt) :
          m_inner{std::move(inner)}, m_type{std::move(type)}
  {
    if (not m_inner)
      throw usage_error{"Mapping codec has no inner codec."};
  }

  [[nodiscard]] data_type cql_type() const override
  {
    return m_type.has_value() ? *m_type : m_inner->cql_type();
  }

  using codec_base::accepts;

  [[nodiscard]] bool accepts(data_type const &type) const override
  {
    return m_type.has_value() ? m_type->same_shape(type) :
                                m_inner->accepts(type);
  }

  [[nodiscard]] wire_value encode(OUTER const &value) const override
  {
    if constexpr (nullness<OUTER>::has_null)
      if (nullness<OUTER>::is_null(value))
        return {};
    return m_inner->encode(outer_to_inner(value));
  }

  [[nodiscard]] OUTER decode(std::optional<bytes_view> data) const override
  {
    if (not data.has_value())
    {
      if constexpr (nullness<OUTER>::has_null)
        return nullness<OUTER>::null();
      else
        throw unexpected_null{internal::concat(
          "Null ", cql_type().to_string(), " value, but C++ type ",
          typeid(OUTER).name(), " has no null.")};
    }
    return inner_to_outer(m_inner->decode(data));
  }

  [[nodiscard]] std::string format(OUTER const &value) const override
  {
    if constexpr (nullness<OUTER>::has_null)
      if (nullness<OUTER>::is_null(value))
        return std::string{internal::null_literal};
    return m_inner->format(outer_to_inner(value));
  }

  [[nodiscard]] OUTER parse(std::string_view text) const override
  {
    if constexpr (nullness<OUTER>::has_null)
      if (internal::is_null_literal(text))
        return nullness<OUTER>::null();
    return inner_to_outer(m_inner->parse(text));
  }

protected:
  /// Convert a non-null inner value to the outer type.
  [[nodiscard]] virtual OUTER inner_to_outer(INNER const &value) const = 0;

  /// Convert a non-null outer value to the inner type.
  [[nodiscard]] virtual INNER outer_to_inner(OUTER const &value) const = 0;

  [[nodiscard]] codec_ptr<INNER> const &inner() const noexcept
  {
    return m_inner;
  }

private:
  codec_ptr<INNER> m_inner;
  std::optional<data_type> m_type;
};


/// A @ref mapping_codec whose conversions are function objects.
template<typename INNER, typename OUTER>
class function_mapping_codec final : public mapping_codec<INNER, OUTER>
{
public:
  using to_outer_function = std::function<OUTER(INNER const &)>;
  using to_inner_function = std::function<INNER(OUTER const &)>;

  function_mapping_codec(
    codec_ptr<INNER> inner, to_outer_function to_outer,
    to_inner_function to_inner,
    std::optional<data_type> type = std::nullopt) :
          mapping_codec<INNER, OUTER>{std::move(inner), std::move(type)},
          m_to_outer{std::move(to_outer)},
          m_to_inner{std::move(to_inner)}
  {}

protected:
  [[nodiscard]] OUTER inner_to_outer(INNER const &value) const override
  {
    return m_to_outer(value);
  }

  [[nodiscard]] INNER outer_to_inner(OUTER const &value) const override
  {
    return m_to_inner(value);
  }

private:
  to_outer_function m_to_outer;
  to_inner_function m_to_inner;
};


/// Create a codec for `OUTER` out of a codec for some other type.
/** Example, for a "percentage" type stored in the database as an `int`:
 *
 * ```cxx
 * auto const pct{cqlxx::make_mapping_codec<percentage>(
 *   cqlxx::default_codec<std::int32_t>(),
 *   [](std::int32_t i) { return percentage{i}; },
 *   [](percentage p) { return p.value(); })};
 * ```
 */
template<typename OUTER, typename INNER, typename TO_OUTER, typename TO_INNER>
[[nodiscard]] inline codec_ptr<OUTER> make_mapping_codec(
  codec_ptr<INNER> inner, TO_OUTER &&to_outer, TO_INNER &&to_inner,
  std::optional<data_type> type = std::nullopt)
{
  return std::make_shared<function_mapping_codec<INNER, OUTER>>(
    std::move(inner), std::forward<TO_OUTER>(to_outer),
    std::forward<TO_INNER>(to_inner), std::move(type));
}
} // namespace cqlxx
#endif
