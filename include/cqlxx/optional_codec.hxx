/* Codec for std::optional: CQL null as a C++ value.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/optional_codec instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_OPTIONAL_CODEC)
#  define CQLXX_H_OPTIONAL_CODEC

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <any>
#  include <memory>
#  include <optional>
#  include <utility>

#  include "cqlxx/codec.hxx"
#  include "cqlxx/internal/literal.hxx"


namespace cqlxx
{
/// Codec for `std::optional<TYPE>`, wrapping a codec for `TYPE`.
/** `std::nullopt` is a CQL null, encoded as an absent value.  For fixed-width
 * types, an empty value decodes as `std::nullopt` as well, since it can't
 * hold anything of the inner type.
 *
 * Besides values of type `std::optional<TYPE>`, this codec accepts a bare
 * `std::nullopt`.  That means that any two optional codecs accept the same
 * null sample value: see @ref codec_registry for how a lookup resolves that.
 */
template<typename TYPE>
class optional_codec final : public codec<std::optional<TYPE>>
{
public:
  using value_type_t = std::optional<TYPE>;

  explicit optional_codec(codec_ptr<TYPE> inner) : m_inner{std::move(inner)}
  {
    if (not m_inner)
      throw usage_error{"Optional codec has no inner codec."};
  }

  [[nodiscard]] data_type cql_type() const override
  {
    return m_inner->cql_type();
  }

  [[nodiscard]] bool accepts(data_type const &type) const override
  {
    return m_inner->accepts(type);
  }

  [[nodiscard]] bool accepts(std::any const &value) const override
  {
    return value.type() == typeid(value_type_t) or
           value.type() == typeid(std::nullopt_t);
  }

  [[nodiscard]] std::string describe() const override
  {
    return "optional " + m_inner->describe();
  }

  [[nodiscard]] wire_value encode(value_type_t const &value) const override
  {
    if (not value.has_value())
      return {};
    return m_inner->encode(*value);
  }

  [[nodiscard]] value_type_t
  decode(std::optional<bytes_view> data) const override
  {
    if (not data.has_value())
      return {};
    if (std::empty(*data) and m_inner->cql_type().is_fixed_width())
      return {};
    return m_inner->decode(data);
  }

  [[nodiscard]] std::string format(value_type_t const &value) const override
  {
    if (not value.has_value())
      return std::string{internal::null_literal};
    return m_inner->format(*value);
  }

  [[nodiscard]] value_type_t parse(std::string_view text) const override
  {
    if (internal::is_null_literal(text))
      return {};
    return m_inner->parse(text);
  }

  [[nodiscard]] codec_ptr<value_type_t>
  adapt(data_type const &type) const override
  {
    auto adapted{m_inner->adapt(type)};
    if (not adapted)
      return {};
    return std::make_shared<optional_codec<TYPE> const>(std::move(adapted));
  }

  /// The codec for the contained type.
  [[nodiscard]] codec_ptr<TYPE> const &inner() const noexcept
  {
    return m_inner;
  }

private:
  codec_ptr<TYPE> m_inner;
};


/// Wrap a codec in an @ref optional_codec.
template<typename TYPE>
[[nodiscard]] inline codec_ptr<std::optional<TYPE>>
make_optional_codec(codec_ptr<TYPE> inner)
{
  return std::make_shared<optional_codec<TYPE> const>(std::move(inner));
}


template<has_natural_codec TYPE> struct natural_codec<std::optional<TYPE>>
{
  [[nodiscard]] static codec_ptr<std::optional<TYPE>> get()
  {
    return make_optional_codec(default_codec<TYPE>());
  }
};
} // namespace cqlxx
#endif
